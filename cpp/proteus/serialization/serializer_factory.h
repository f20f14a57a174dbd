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
#include <utility>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

#include "proteus/carpenter/class_carpenter.h"
#include "proteus/serialization/config.h"
#include "proteus/serialization/custom_serializer.h"
#include "proteus/serialization/evolution_serializer.h"
#include "proteus/serialization/fingerprinter.h"
#include "proteus/serialization/remote_type_resolver.h"
#include "proteus/serialization/schema.h"
#include "proteus/serialization/serializer.h"
#include "proteus/serialization/whitelist.h"
#include "proteus/type/class_loader.h"
#include "proteus/type/type.h"
#include "proteus/util/concurrent_cache.h"
#include "proteus/util/error.h"
#include "proteus/util/result.h"

namespace proteus {
namespace serialization {

/// Registry and builder of serializers, shared by every serialize and
/// deserialize call made with it.
///
/// Serializers are cached by type for the encode path and by descriptor for
/// the decode path. Both caches build at most one serializer per key, so
/// concurrent callers asking for one type get one instance. Nothing is
/// evicted.
///
/// Classes are resolved through the carpenter's loader, which sees the
/// application loader's classes and those synthesized for remote types.
class SerializerFactory {
public:
  SerializerFactory(
      Config config, std::shared_ptr<const ClassLoader> application_loader,
      ClassWhitelistPtr whitelist,
      EvolutionSerializerGetterPtr evolution_getter =
          std::make_shared<DefaultEvolutionSerializerGetter>(),
      FingerprinterConstructor fingerprinter_constructor =
          SerializerFingerprinter::create);

  SerializerFactory(const SerializerFactory &) = delete;
  SerializerFactory &operator=(const SerializerFactory &) = delete;

  /// Encode path: the serializer for a value of runtime class `actual`
  /// (null when unknown) written where `declared` is expected.
  Result<SerializerPtr, Error> get(const ClassPtr &actual,
                                   const Type &declared);

  /// Decode path: the serializer for `descriptor`, resolving and, when
  /// needed, carpenting and evolving the types `schemas` describes.
  Result<SerializerPtr, Error> get(const std::string &descriptor,
                                   const SerializationSchemas &schemas);

  /// Registers a custom serializer and, on first registration, the
  /// serializers it declares as additional. Registering a descriptor twice
  /// is a no-op.
  void register_serializer(const CustomSerializerPtr &serializer);

  /// Registers a serializer supplied by untrusted code. Same idempotency as
  /// `register_serializer`, without additional serializers.
  Result<void, Error>
  register_external(std::shared_ptr<const SerializationCustomSerializer> plugin);

  /// The registered custom serializer for `clazz` written where `declared`
  /// is expected, or null.
  CustomSerializerPtr find_custom_serializer(const ClassPtr &clazz,
                                             const Type &declared);

  bool has_custom_serializer(const Class &clazz) const;

  size_t custom_serializer_count() const;

  /// `proteus:<fingerprint>` of a local type.
  Result<std::string, Error> descriptor_for(const Type &type);

  /// Parses a canonical type name against the factory's loader.
  Result<Type, Error> type_for_name(const std::string &name) const;

  const Config &config() const { return config_; }
  const std::shared_ptr<ClassLoader> &class_loader() const {
    return carpenter_->class_loader();
  }
  const ClassWhitelist &whitelist() const { return *whitelist_; }
  Fingerprinter &fingerprinter() { return *fingerprinter_; }
  RemoteTypeResolver &resolver() { return *resolver_; }

private:
  template <typename Builder>
  Result<SerializerPtr, Error> get_or_create(const Type &type,
                                             Builder &&build);

  Result<SerializerPtr, Error> make_class_serializer(const ClassPtr &clazz,
                                                     const Type &type,
                                                     const Type &declared);

  Result<void, Error> process_remote_type(const RemoteType &remote,
                                          const SerializationSchemas &schemas);

  Config config_;
  ClassWhitelistPtr whitelist_;
  EvolutionSerializerGetterPtr evolution_getter_;
  std::shared_ptr<carpenter::ClassCarpenter> carpenter_;
  FingerprinterPtr fingerprinter_;
  std::unique_ptr<RemoteTypeResolver> resolver_;

  util::ConcurrentCache<Type, SerializerPtr> serializers_by_type_;
  util::ConcurrentCache<std::string, SerializerPtr> serializers_by_descriptor_;
  util::ConcurrentCache<std::pair<std::string, std::string>,
                        CustomSerializerPtr>
      custom_serializer_cache_;

  mutable absl::Mutex custom_mu_;
  std::vector<CustomSerializerPtr> custom_serializers_ ABSL_GUARDED_BY(custom_mu_);
  absl::flat_hash_map<std::string, CustomSerializerPtr>
      custom_by_descriptor_ ABSL_GUARDED_BY(custom_mu_);
};

} // namespace serialization
} // namespace proteus
