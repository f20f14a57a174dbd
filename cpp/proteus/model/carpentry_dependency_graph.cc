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

#include "proteus/model/carpentry_dependency_graph.h"

#include <string>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

namespace proteus {
namespace model {

CarpentryDependencyGraph::CarpentryDependencyGraph(
    const std::vector<RemoteTypeInformationPtr> &types) {
  for (const auto &type : types) {
    if (members_.insert(type->type_identifier()).second) {
      types_.push_back(type);
    }
  }
}

void CarpentryDependencyGraph::record_dependencies(
    const RemoteTypeInformationPtr &dependent) {
  const TypeIdentifier &self = dependent->type_identifier();
  std::vector<RemoteTypeInformationPtr> pending = dependent->dependencies();
  absl::flat_hash_set<const RemoteTypeInformation *> visited;
  while (!pending.empty()) {
    RemoteTypeInformationPtr dependee = std::move(pending.back());
    pending.pop_back();
    if (dependee == nullptr || !visited.insert(dependee.get()).second) {
      continue;
    }
    const TypeIdentifier &id = dependee->type_identifier();
    if (members_.contains(id)) {
      if (id != self) {
        dependencies_[self].insert(id);
      }
      continue;
    }
    // Look through types outside the batch for members they mention.
    for (auto &nested : dependee->dependencies()) {
      pending.push_back(std::move(nested));
    }
  }
}

Result<std::vector<RemoteTypeInformationPtr>, Error>
CarpentryDependencyGraph::topological_sort() {
  std::vector<RemoteTypeInformationPtr> ordered;
  ordered.reserve(types_.size());
  absl::flat_hash_set<TypeIdentifier> emitted;
  std::vector<RemoteTypeInformationPtr> remaining = types_;

  while (!remaining.empty()) {
    std::vector<RemoteTypeInformationPtr> frontier;
    std::vector<RemoteTypeInformationPtr> blocked;
    for (const auto &type : remaining) {
      bool ready = true;
      auto it = dependencies_.find(type->type_identifier());
      if (it != dependencies_.end()) {
        for (const auto &dependee : it->second) {
          if (!emitted.contains(dependee)) {
            ready = false;
            break;
          }
        }
      }
      (ready ? frontier : blocked).push_back(type);
    }
    if (frontier.empty()) {
      std::vector<std::string> names;
      names.reserve(blocked.size());
      for (const auto &type : blocked) {
        names.push_back(type->type_identifier().pretty_print(false));
      }
      return Unexpected(Error::carpentry_error(absl::StrCat(
          "Cannot build dependencies for [", absl::StrJoin(names, ", "),
          "]")));
    }
    for (auto &type : frontier) {
      emitted.insert(type->type_identifier());
      ordered.push_back(std::move(type));
    }
    remaining = std::move(blocked);
  }
  return ordered;
}

Result<std::vector<RemoteTypeInformationPtr>, Error>
CarpentryDependencyGraph::order(
    const std::vector<RemoteTypeInformationPtr> &types) {
  CarpentryDependencyGraph graph(types);
  for (const auto &type : graph.types_) {
    graph.record_dependencies(type);
  }
  return graph.topological_sort();
}

Result<std::vector<std::pair<TypeIdentifier, Type>>, Error>
CarpentryDependencyGraph::carpent_in_order(
    RemoteTypeCarpenter &carpenter,
    util::ConcurrentCache<TypeIdentifier, Type> &cache,
    const std::vector<RemoteTypeInformationPtr> &types) {
  PROTEUS_TRY(ordered, order(types));
  std::vector<std::pair<TypeIdentifier, Type>> carpented;
  carpented.reserve(ordered.size());
  for (const auto &information : ordered) {
    PROTEUS_TRY(type, cache.get_or_create(information->type_identifier(),
                                          [&]() -> Result<Type, Error> {
                                            return carpenter.carpent(
                                                *information);
                                          }));
    carpented.emplace_back(information->type_identifier(), std::move(type));
  }
  return carpented;
}

} // namespace model
} // namespace proteus
