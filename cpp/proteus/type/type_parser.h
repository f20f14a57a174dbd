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

#include <optional>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"

#include "proteus/type/class_loader.h"
#include "proteus/type/type.h"
#include "proteus/type/type_identifier.h"
#include "proteus/util/error.h"
#include "proteus/util/result.h"

namespace proteus {

/// Type parameter name to the type bound to it.
using TypeBindings = absl::flat_hash_map<std::string, Type>;

/// A property with its type resolved against a concrete owner type.
struct ResolvedProperty {
  std::string name;
  Type type;
  bool mandatory = true;
  std::optional<Value> default_value;
};

/// Turns canonical type names into Types using a class loader.
class TypeParser {
public:
  /// Parses and resolves `name`:
  /// - `?` is the wildcard
  /// - `X[]` is a reference array of X
  /// - `X[p]` is a primitive array, allowed for int, char, boolean, float,
  ///   double, short and long only; anything else fails with NotSerializable
  /// - `raw<a, b>` is a parameterized type
  /// - a name bound in `bindings` resolves to the bound type
  ///
  /// Unknown class names fail with ClassNotFound.
  static Result<Type, Error> parse(const std::string &name,
                                   const ClassLoader &loader,
                                   const TypeBindings &bindings = {});

  static Result<Type, Error> resolve(const TypeIdentifier &id,
                                     const ClassLoader &loader,
                                     const TypeBindings &bindings = {});

  /// Binds the raw class's type parameters to the type's arguments. Missing
  /// arguments bind to the wildcard.
  static TypeBindings bindings_for(const Type &type);

  /// The properties of the raw class of `type` in declaration order, with
  /// type parameters substituted.
  static Result<std::vector<ResolvedProperty>, Error>
  resolve_properties(const Type &type, const ClassLoader &loader);
};

} // namespace proteus
