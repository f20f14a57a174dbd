/*
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements.  See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership.  The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License.  You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "proteus/serialization/codec.h"
#include "proteus/util/error.h"
#include "proteus/util/result.h"

namespace proteus {
namespace serialization {

constexpr const char kDescriptorPrefix[] = "proteus:";
constexpr const char kEnvelopeDescriptor[] = "proteus:envelope";
constexpr const char kSchemaDescriptor[] = "proteus:schema";
constexpr const char kCompositeTypeDescriptor[] = "proteus:composite_type";
constexpr const char kRestrictedTypeDescriptor[] = "proteus:restricted_type";
constexpr const char kTypeDescriptorDescriptor[] = "proteus:descriptor";
constexpr const char kFieldDescriptor[] = "proteus:field";
constexpr const char kChoiceDescriptor[] = "proteus:choice";
constexpr const char kTransformsDescriptor[] = "proteus:transforms";
constexpr const char kTransformDescriptor[] = "proteus:transform";

struct Descriptor {
  std::string name;

  bool operator==(const Descriptor &other) const { return name == other.name; }
};

struct Field {
  std::string name;
  std::string type;
  std::vector<std::string> requirements;
  std::optional<std::string> default_value;
  std::optional<std::string> label;
  bool mandatory = true;
  bool multiple = false;

  bool operator==(const Field &other) const;
};

struct Choice {
  std::string name;
  std::string value;

  bool operator==(const Choice &other) const {
    return name == other.name && value == other.value;
  }
};

/// Schema entry of a class serialized by its properties.
struct CompositeType {
  std::string name;
  std::optional<std::string> label;
  std::vector<std::string> provides;
  Descriptor descriptor;
  std::vector<Field> fields;

  bool operator==(const CompositeType &other) const;
};

/// Schema entry of a type whose body is a single source shape: collections
/// and maps ("list", "map"), enums (choices), arrays, singletons and custom
/// serializer output.
struct RestrictedType {
  std::string name;
  std::optional<std::string> label;
  std::vector<std::string> provides;
  std::string source;
  Descriptor descriptor;
  std::vector<Choice> choices;

  bool operator==(const RestrictedType &other) const;
};

using TypeNotation = std::variant<CompositeType, RestrictedType>;

const std::string &notation_name(const TypeNotation &notation);

const std::string &notation_descriptor(const TypeNotation &notation);

/// Ordered set of type notations, unique by name.
class Schema {
public:
  const std::vector<TypeNotation> &types() const { return types_; }

  /// Adds `notation` unless one with the same name is present; returns
  /// whether it was added.
  bool add(TypeNotation notation);

  const TypeNotation *find_by_descriptor(const std::string &descriptor) const;

  void write(Encoder &encoder) const;

  static Result<Schema, Error> read(Decoder &decoder);

private:
  std::vector<TypeNotation> types_;
};

struct Transform {
  enum class Kind { Rename, Default };

  Kind kind;
  std::string from;
  std::string to;

  bool operator==(const Transform &other) const {
    return kind == other.kind && from == other.from && to == other.to;
  }
};

/// Enum transforms keyed by enum type name.
class TransformsSchema {
public:
  const std::map<std::string, std::vector<Transform>> &types() const {
    return types_;
  }

  bool empty() const { return types_.empty(); }

  void put(const std::string &type_name, std::vector<Transform> transforms) {
    types_[type_name] = std::move(transforms);
  }

  const std::vector<Transform> *find(const std::string &type_name) const;

  void write(Encoder &encoder) const;

  static Result<TransformsSchema, Error> read(Decoder &decoder);

private:
  std::map<std::string, std::vector<Transform>> types_;
};

/// Everything a reader received alongside the object.
struct SerializationSchemas {
  Schema schema;
  TransformsSchema transforms;
};

} // namespace serialization
} // namespace proteus
