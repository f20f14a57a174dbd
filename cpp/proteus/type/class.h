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

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "proteus/type/value.h"

namespace proteus {

enum class ClassKind : uint8_t {
  Primitive,
  Composite,
  Interface,
  Enum,
  Collection,
  Map,
  Top,
};

const char *class_kind_name(ClassKind kind);

/// A property of a composite or interface. The type is a canonical type name
/// (see TypeIdentifier) and may name one of the declaring class's type
/// parameters.
struct Property {
  std::string name;
  std::string type_name;
  bool mandatory = true;
  /// Used when data written without this property is evolved into it.
  std::optional<Value> default_value;
};

/// The schema record of a runtime class.
///
/// Classes refer to each other by name only, so a class never owns another
/// one and self-referencing classes need no special handling. Classes are
/// immutable once built; create them with ClassBuilder.
class Class {
public:
  const std::string &name() const { return name_; }
  ClassKind kind() const { return kind_; }

  const std::vector<Property> &properties() const { return properties_; }
  const Property *find_property(const std::string &name) const;

  const std::vector<std::string> &interfaces() const { return interfaces_; }
  /// Empty when the class has no superclass.
  const std::string &superclass() const { return superclass_; }
  const std::vector<std::string> &type_parameters() const {
    return type_parameters_;
  }

  /// Enum constants in ordinal order.
  const std::vector<std::string> &enum_constants() const {
    return enum_constants_;
  }
  std::optional<int32_t> ordinal_of(const std::string &constant) const;
  /// Constant renames, `from` being the older name.
  const std::vector<std::pair<std::string, std::string>> &enum_renames() const {
    return enum_renames_;
  }
  /// Constant defaults, mapping a newer constant onto the one an older
  /// reader should fall back to.
  const std::vector<std::pair<std::string, std::string>> &
  enum_defaults() const {
    return enum_defaults_;
  }

  bool is_primitive() const { return kind_ == ClassKind::Primitive; }
  bool is_interface() const { return kind_ == ClassKind::Interface; }
  bool is_enum() const { return kind_ == ClassKind::Enum; }
  bool is_top() const { return kind_ == ClassKind::Top; }

  /// Anonymous or lambda-like: cannot be rebuilt on a remote peer.
  bool is_synthetic() const { return synthetic_; }
  /// Has exactly one instance.
  bool is_singleton() const { return singleton_; }
  /// Produced by the class carpenter.
  bool is_synthesized() const { return synthesized_; }
  /// Opted in to serialization; the whitelist honours this marker.
  bool is_serializable() const { return serializable_; }

private:
  friend class ClassBuilder;

  Class() = default;

  std::string name_;
  ClassKind kind_ = ClassKind::Composite;
  std::vector<Property> properties_;
  std::vector<std::string> interfaces_;
  std::string superclass_;
  std::vector<std::string> type_parameters_;
  std::vector<std::string> enum_constants_;
  std::vector<std::pair<std::string, std::string>> enum_renames_;
  std::vector<std::pair<std::string, std::string>> enum_defaults_;
  bool synthetic_ = false;
  bool singleton_ = false;
  bool synthesized_ = false;
  bool serializable_ = false;
};

using ClassPtr = std::shared_ptr<const Class>;

/// Fluent builder for Class.
///
/// ```cpp
/// ClassPtr foo = ClassBuilder("com.example.Foo")
///                    .property("x", "int")
///                    .property("y", "string", false)
///                    .serializable()
///                    .build();
/// ```
class ClassBuilder {
public:
  explicit ClassBuilder(std::string name,
                        ClassKind kind = ClassKind::Composite);

  ClassBuilder &property(std::string name, std::string type_name,
                         bool mandatory = true);
  ClassBuilder &property_with_default(std::string name, std::string type_name,
                                      Value default_value);
  ClassBuilder &implements(std::string interface_name);
  ClassBuilder &extends(std::string superclass_name);
  ClassBuilder &type_parameter(std::string name);
  ClassBuilder &constant(std::string name);
  ClassBuilder &rename(std::string from, std::string to);
  ClassBuilder &default_constant(std::string from, std::string to);
  ClassBuilder &synthetic(bool value = true);
  ClassBuilder &singleton(bool value = true);
  ClassBuilder &synthesized(bool value = true);
  ClassBuilder &serializable(bool value = true);

  ClassPtr build();

private:
  std::shared_ptr<Class> clazz_;
};

} // namespace proteus
