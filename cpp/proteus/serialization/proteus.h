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
#include <utility>
#include <vector>

#include "proteus/serialization/config.h"
#include "proteus/serialization/custom_serializer.h"
#include "proteus/serialization/evolution_serializer.h"
#include "proteus/serialization/fingerprinter.h"
#include "proteus/serialization/serializer_factory.h"
#include "proteus/serialization/whitelist.h"
#include "proteus/type/class_loader.h"
#include "proteus/type/type.h"
#include "proteus/type/value.h"
#include "proteus/util/error.h"
#include "proteus/util/result.h"

namespace proteus {

class Proteus;

/// Builder class for creating Proteus instances with custom configuration.
///
/// Example:
/// ```cpp
/// auto proteus = Proteus::builder()
///     .whitelist(std::make_shared<serialization::AllWhitelist>())
///     .class_loader(loader)
///     .max_depth(16)
///     .build();
/// ```
class ProteusBuilder {
public:
  ProteusBuilder() = default;

  /// Reject every class that has no registered custom serializer.
  ProteusBuilder &only_custom_serializers(bool enable) {
    config_.only_custom_serializers = enable;
    return *this;
  }

  /// Synthesize classes for remote types missing locally.
  ProteusBuilder &carpenter_enabled(bool enable) {
    config_.carpenter_enabled = enable;
    return *this;
  }

  /// Add interface properties a remote class does not declare as
  /// non-mandatory instead of failing.
  ProteusBuilder &lenient_carpenter(bool enable) {
    config_.lenient_carpenter = enable;
    return *this;
  }

  /// Set maximum allowed nesting depth.
  ProteusBuilder &max_depth(uint32_t depth) {
    config_.max_depth = depth;
    return *this;
  }

  /// Classes allowed besides those marked serializable. Defaults to none.
  ProteusBuilder &whitelist(serialization::ClassWhitelistPtr whitelist) {
    whitelist_ = std::move(whitelist);
    return *this;
  }

  /// Loader holding the application's classes. Defaults to a fresh loader
  /// over the builtin classes.
  ProteusBuilder &class_loader(std::shared_ptr<const ClassLoader> loader) {
    class_loader_ = std::move(loader);
    return *this;
  }

  ProteusBuilder &
  evolution_getter(serialization::EvolutionSerializerGetterPtr getter) {
    evolution_getter_ = std::move(getter);
    return *this;
  }

  /// Policy of the default evolution serializer getter. Ignored when an
  /// evolution getter is set.
  ProteusBuilder &evolution_policy(serialization::EvolutionPolicyPtr policy) {
    evolution_policy_ = std::move(policy);
    return *this;
  }

  ProteusBuilder &fingerprinter_constructor(
      serialization::FingerprinterConstructor constructor) {
    fingerprinter_constructor_ = std::move(constructor);
    return *this;
  }

  /// Build the final Proteus instance.
  Proteus build();

private:
  serialization::Config config_;
  serialization::ClassWhitelistPtr whitelist_;
  std::shared_ptr<const ClassLoader> class_loader_;
  serialization::EvolutionSerializerGetterPtr evolution_getter_;
  serialization::EvolutionPolicyPtr evolution_policy_;
  serialization::FingerprinterConstructor fingerprinter_constructor_;
};

/// Entry point for encoding and decoding values.
///
/// Every call shares the instance's serializer factory, so serializers,
/// resolved remote types and carpented classes are reused across calls and
/// threads.
///
/// Example:
/// ```cpp
/// auto proteus = Proteus::builder().class_loader(loader).build();
/// auto bytes = proteus.serialize(point, point_type);
/// if (bytes.ok()) {
///   auto decoded = proteus.deserialize(bytes.value(), point_type);
/// }
/// ```
class Proteus {
public:
  static ProteusBuilder builder() { return ProteusBuilder(); }

  /// Encodes `value` as an instance of `declared`.
  Result<std::vector<uint8_t>, Error> serialize(const Value &value,
                                                const Type &declared) const;

  /// Encodes `value` with the wildcard as its declared type.
  Result<std::vector<uint8_t>, Error> serialize(const Value &value) const {
    return serialize(value, Type::wildcard());
  }

  /// Decodes `bytes`, requiring the result to be compatible with
  /// `expected`.
  Result<Value, Error> deserialize(const std::vector<uint8_t> &bytes,
                                   const Type &expected) const;

  Result<Value, Error> deserialize(const std::vector<uint8_t> &bytes) const {
    return deserialize(bytes, Type::wildcard());
  }

  void register_serializer(const serialization::CustomSerializerPtr &serializer) {
    factory_->register_serializer(serializer);
  }

  Result<void, Error> register_external(
      std::shared_ptr<const serialization::SerializationCustomSerializer>
          plugin) {
    return factory_->register_external(std::move(plugin));
  }

  /// Loader that sees the application's classes and the carpented ones.
  const std::shared_ptr<ClassLoader> &class_loader() const {
    return factory_->class_loader();
  }

  const std::shared_ptr<serialization::SerializerFactory> &factory() const {
    return factory_;
  }

private:
  explicit Proteus(std::shared_ptr<serialization::SerializerFactory> factory)
      : factory_(std::move(factory)) {}

  std::shared_ptr<serialization::SerializerFactory> factory_;

  friend class ProteusBuilder;
};

} // namespace proteus
