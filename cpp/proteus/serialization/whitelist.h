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
#include <string>
#include <vector>

#include "absl/container/flat_hash_set.h"

#include "proteus/type/class.h"
#include "proteus/type/class_loader.h"
#include "proteus/type/type.h"
#include "proteus/util/error.h"
#include "proteus/util/result.h"

namespace proteus {
namespace serialization {

/// Policy deciding which classes may cross the serialization boundary
/// without carrying the serializable marker themselves.
class ClassWhitelist {
public:
  virtual ~ClassWhitelist() = default;

  virtual bool has_listed(const Class &clazz) const = 0;
};

using ClassWhitelistPtr = std::shared_ptr<const ClassWhitelist>;

/// Lists every class.
class AllWhitelist : public ClassWhitelist {
public:
  bool has_listed(const Class &) const override { return true; }
};

/// Lists nothing: only classes marked serializable pass.
class EmptyWhitelist : public ClassWhitelist {
public:
  bool has_listed(const Class &) const override { return false; }
};

/// Lists the named classes.
class ExplicitWhitelist : public ClassWhitelist {
public:
  explicit ExplicitWhitelist(const std::vector<std::string> &names)
      : names_(names.begin(), names.end()) {}

  bool has_listed(const Class &clazz) const override {
    return names_.contains(clazz.name());
  }

private:
  absl::flat_hash_set<std::string> names_;
};

/// Fails with NotWhitelisted unless every class `type` mentions is listed
/// or marked serializable on itself, a superclass or an interface.
Result<void, Error> require_whitelisted(const ClassWhitelist &whitelist,
                                        const ClassLoader &loader,
                                        const Type &type);

} // namespace serialization
} // namespace proteus
