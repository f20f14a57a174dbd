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

#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"

#include "proteus/model/remote_type_carpenter.h"
#include "proteus/model/remote_type_information.h"
#include "proteus/type/type.h"
#include "proteus/type/type_identifier.h"
#include "proteus/util/concurrent_cache.h"
#include "proteus/util/error.h"
#include "proteus/util/result.h"

namespace proteus {
namespace model {

/// Orders the types of one carpentry batch so that every type comes after
/// the batch members it depends on.
///
/// Only dependencies on other batch members are recorded; anything else is
/// expected to be locally resolvable. A dependency reached through a type
/// outside the batch (e.g. `List<Foo>` when only `Foo` is in the batch)
/// still counts. Self references need no ordering and are ignored.
///
/// Types are emitted in rounds: the first round holds the types without
/// recorded dependencies, each later round the types whose dependencies were
/// all emitted before. Within a round input order is kept, so the result is
/// deterministic for a given input sequence. A round that emits nothing
/// while types remain means a cycle, reported as CarpentryError
/// "Cannot build dependencies for [...]".
class CarpentryDependencyGraph {
public:
  static Result<std::vector<RemoteTypeInformationPtr>, Error>
  order(const std::vector<RemoteTypeInformationPtr> &types);

  /// Orders `types` and carpents each one through `cache`, so concurrent
  /// batches asking for the same identifier share one build. Nothing is
  /// carpented when ordering fails.
  static Result<std::vector<std::pair<TypeIdentifier, Type>>, Error>
  carpent_in_order(RemoteTypeCarpenter &carpenter,
                   util::ConcurrentCache<TypeIdentifier, Type> &cache,
                   const std::vector<RemoteTypeInformationPtr> &types);

private:
  explicit CarpentryDependencyGraph(
      const std::vector<RemoteTypeInformationPtr> &types);

  void record_dependencies(const RemoteTypeInformationPtr &dependent);

  Result<std::vector<RemoteTypeInformationPtr>, Error> topological_sort();

  // Batch members, first occurrence of each identifier.
  std::vector<RemoteTypeInformationPtr> types_;
  absl::flat_hash_set<TypeIdentifier> members_;
  absl::flat_hash_map<TypeIdentifier, absl::flat_hash_set<TypeIdentifier>>
      dependencies_;
};

} // namespace model
} // namespace proteus
