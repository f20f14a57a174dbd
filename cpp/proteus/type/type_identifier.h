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

#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "proteus/type/type.h"
#include "proteus/util/error.h"
#include "proteus/util/result.h"

namespace proteus {

/// The canonical name of a type as a tree, independent of any class loader.
/// Used as a map key wherever types are identified across peers.
///
/// Two identifiers are equal iff their canonical names are equal, so generic
/// argument order and array suffixes are significant.
class TypeIdentifier {
public:
  enum class Kind { Top, Unparameterised, Parameterised, Array, PrimitiveArray };

  /// The top type `?`.
  TypeIdentifier();

  static TypeIdentifier top() { return TypeIdentifier(); }
  static TypeIdentifier unparameterised(std::string name);
  static TypeIdentifier parameterised(std::string name,
                                      std::vector<TypeIdentifier> parameters);
  static TypeIdentifier array(TypeIdentifier component);
  /// `component` names a primitive; whether arrays of it are legal is
  /// decided when the identifier is resolved.
  static TypeIdentifier primitive_array(std::string component);

  /// Parses a canonical name such as `com.example.Box<int, java.Foo[]>[]` or
  /// `int[p]`. Whitespace between tokens is ignored.
  static Result<TypeIdentifier, Error> parse(std::string_view name);

  static TypeIdentifier for_type(const Type &type);

  Kind kind() const { return node_->kind; }

  /// The erased name: the class name for Unparameterised and Parameterised
  /// identifiers, the component name for PrimitiveArray, `?` for Top, and
  /// the erased component name followed by `[]` for Array.
  const std::string &erased_name() const { return node_->erased_name; }

  const std::vector<TypeIdentifier> &parameters() const {
    return node_->parameters;
  }

  /// Component of an Array identifier.
  const TypeIdentifier &component() const;

  const std::string &name() const { return node_->name; }

  /// Renders the identifier; when `simplified` package prefixes are dropped.
  std::string pretty_print(bool simplified = true) const;

  bool operator==(const TypeIdentifier &other) const {
    return name() == other.name();
  }
  bool operator!=(const TypeIdentifier &other) const {
    return !(*this == other);
  }

  template <typename H> friend H AbslHashValue(H h, const TypeIdentifier &id) {
    return H::combine(std::move(h), id.name());
  }

private:
  struct Node {
    Kind kind = Kind::Top;
    std::string erased_name;
    std::vector<TypeIdentifier> parameters;
    std::vector<TypeIdentifier> component;
    std::string name;
  };

  explicit TypeIdentifier(std::shared_ptr<const Node> node)
      : node_(std::move(node)) {}

  std::shared_ptr<const Node> node_;
};

inline std::ostream &operator<<(std::ostream &os, const TypeIdentifier &id) {
  return os << id.name();
}

} // namespace proteus
