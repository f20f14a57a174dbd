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

#include "proteus/serialization/whitelist.h"

#include "absl/strings/str_cat.h"

namespace proteus {
namespace serialization {

namespace {

bool has_serializable_marker(const Class &clazz, const ClassLoader &loader,
                             absl::flat_hash_set<std::string> &seen) {
  if (!seen.insert(clazz.name()).second) {
    return false;
  }
  if (clazz.is_serializable()) {
    return true;
  }
  std::vector<std::string> supers = clazz.interfaces();
  if (!clazz.superclass().empty()) {
    supers.push_back(clazz.superclass());
  }
  for (const auto &name : supers) {
    auto super = loader.load_class(name);
    if (super.ok() && has_serializable_marker(*super.value(), loader, seen)) {
      return true;
    }
  }
  return false;
}

} // namespace

Result<void, Error> require_whitelisted(const ClassWhitelist &whitelist,
                                        const ClassLoader &loader,
                                        const Type &type) {
  if (type.is_wildcard()) {
    return Result<void, Error>();
  }
  if (type.is_array()) {
    return require_whitelisted(whitelist, loader, type.component());
  }
  for (const auto &argument : type.arguments()) {
    PROTEUS_RETURN_NOT_OK(require_whitelisted(whitelist, loader, argument));
  }
  const Class &clazz = *type.raw_class();
  if (clazz.is_primitive() || clazz.is_top() || whitelist.has_listed(clazz)) {
    return Result<void, Error>();
  }
  absl::flat_hash_set<std::string> seen;
  if (has_serializable_marker(clazz, loader, seen)) {
    return Result<void, Error>();
  }
  return Unexpected(Error::not_whitelisted(
      absl::StrCat("Class ", clazz.name(),
                   " is not on the whitelist or marked serializable.")));
}

} // namespace serialization
} // namespace proteus
