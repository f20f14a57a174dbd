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
#include <utility>
#include <vector>

#include "proteus/type/class.h"

namespace proteus {

/// A value-semantics handle over a runtime type: a class, a parameterized
/// class, an array (of references or of a primitive), or the wildcard.
///
/// Every Type has a canonical name:
/// - class: the class name
/// - parameterized: `raw<a, b>`
/// - array: component name followed by `[p]` for primitive components and
///   `[]` otherwise
/// - wildcard: `?`
///
/// Equality and hashing use the canonical name only.
class Type {
public:
  enum class Kind { Class, Parameterized, Array, Wildcard };

  /// The wildcard.
  Type();

  static Type wildcard() { return Type(); }
  static Type of(ClassPtr clazz);
  static Type parameterized(ClassPtr raw, std::vector<Type> arguments);
  static Type array(Type component);
  static Type primitive_array(ClassPtr component);

  Kind kind() const { return node_->kind; }
  bool is_wildcard() const { return node_->kind == Kind::Wildcard; }
  bool is_array() const { return node_->kind == Kind::Array; }
  bool is_primitive_array() const {
    return node_->kind == Kind::Array && node_->primitive_array;
  }
  bool is_parameterized() const {
    return node_->kind == Kind::Parameterized;
  }

  /// The class of a Class type or the raw class of a Parameterized type;
  /// nullptr for arrays and the wildcard.
  const ClassPtr &raw_class() const { return node_->clazz; }

  /// Type arguments of a Parameterized type, empty otherwise.
  const std::vector<Type> &arguments() const { return node_->arguments; }

  /// Component of an Array type.
  const Type &component() const;

  const std::string &name() const { return node_->name; }

  bool operator==(const Type &other) const { return name() == other.name(); }
  bool operator!=(const Type &other) const { return !(*this == other); }

  template <typename H> friend H AbslHashValue(H h, const Type &type) {
    return H::combine(std::move(h), type.name());
  }

private:
  struct Node {
    Kind kind = Kind::Wildcard;
    ClassPtr clazz;
    std::vector<Type> arguments;
    std::vector<Type> component;
    bool primitive_array = false;
    std::string name;
  };

  explicit Type(std::shared_ptr<const Node> node) : node_(std::move(node)) {}

  std::shared_ptr<const Node> node_;
};

inline std::ostream &operator<<(std::ostream &os, const Type &type) {
  return os << type.name();
}

} // namespace proteus
