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

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"

#include "proteus/model/remote_type_carpenter.h"
#include "proteus/model/remote_type_information.h"
#include "proteus/serialization/fingerprinter.h"
#include "proteus/serialization/schema.h"
#include "proteus/type/class_loader.h"
#include "proteus/type/type.h"
#include "proteus/type/type_identifier.h"
#include "proteus/util/concurrent_cache.h"
#include "proteus/util/error.h"
#include "proteus/util/result.h"

namespace proteus {
namespace serialization {

/// A wire notation resolved to a local type.
///
/// `local_descriptor` is computed from the local type; when it differs from
/// the notation's descriptor the data needs evolution.
struct RemoteType {
  Type type;
  TypeNotation notation;
  std::string local_descriptor;

  const std::string &remote_descriptor() const {
    return notation_descriptor(notation);
  }
};

/// Maps wire notations to local types.
class RemoteTypeResolver {
public:
  virtual ~RemoteTypeResolver() = default;

  /// One result per notation, in input order.
  virtual Result<std::vector<RemoteType>, Error>
  resolve(const std::vector<TypeNotation> &notations) = 0;
};

/// Builds the structural description of notations for the carpenter.
///
/// Names a notation refers to are described from the notations passed in
/// when present there, otherwise from their identifier alone. A type met
/// again while its own description is being built is referred to by an
/// unknown placeholder carrying its identifier.
class RemoteTypeInformationBuilder {
public:
  explicit RemoteTypeInformationBuilder(
      const std::vector<TypeNotation> &notations);

  Result<model::RemoteTypeInformationPtr, Error> build(const std::string &name);

private:
  Result<model::RemoteTypeInformationPtr, Error>
  build(const TypeIdentifier &id);

  Result<model::RemoteTypeInformationPtr, Error>
  build_notation(const TypeNotation &notation, const TypeIdentifier &id);

  Result<std::vector<model::RemoteTypeInformationPtr>, Error>
  build_all(const std::vector<TypeIdentifier> &ids);

  absl::flat_hash_map<std::string, const TypeNotation *> by_name_;
  absl::flat_hash_map<std::string, model::RemoteTypeInformationPtr> built_;
  absl::flat_hash_set<std::string> in_progress_;
};

/// Resolves notations against the local loader first, carpenting the ones
/// whose classes are missing in a single dependency ordered batch, and
/// caches results by wire descriptor.
///
/// A carpentry failure is reported as NotSerializable with the carpenter's
/// message; a class still missing after carpentry is fatal.
class CachingRemoteTypeResolver : public RemoteTypeResolver {
public:
  /// `carpenter` may be null when carpentry is disabled.
  CachingRemoteTypeResolver(std::shared_ptr<const ClassLoader> loader,
                            std::shared_ptr<model::RemoteTypeCarpenter> carpenter,
                            FingerprinterPtr fingerprinter);

  Result<std::vector<RemoteType>, Error>
  resolve(const std::vector<TypeNotation> &notations) override;

  /// Number of cached resolutions.
  size_t cached_count() const { return cache_.size(); }

private:
  Result<RemoteType, Error> resolve_locally(const TypeNotation &notation);

  Result<void, Error>
  carpent(const std::vector<TypeNotation> &notations,
          const std::vector<const TypeNotation *> &pending);

  std::shared_ptr<const ClassLoader> loader_;
  std::shared_ptr<model::RemoteTypeCarpenter> carpenter_;
  FingerprinterPtr fingerprinter_;
  util::ConcurrentCache<std::string, RemoteType> cache_;
  util::ConcurrentCache<TypeIdentifier, Type> carpented_;
};

} // namespace serialization
} // namespace proteus
