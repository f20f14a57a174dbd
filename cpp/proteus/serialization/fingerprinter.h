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
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "absl/container/flat_hash_set.h"

#include "proteus/type/class_loader.h"
#include "proteus/type/type.h"
#include "proteus/util/concurrent_cache.h"
#include "proteus/util/error.h"
#include "proteus/util/result.h"

namespace proteus {
namespace serialization {

/// FNV-1a 64-bit hash.
constexpr uint64_t fnv1a_64(std::string_view str) {
  uint64_t hash = 14695981039346656037ULL;
  for (char c : str) {
    hash ^= static_cast<uint64_t>(static_cast<unsigned char>(c));
    hash *= 1099511628211ULL;
  }
  return hash;
}

/// Hashes a structural shape into a 16 hex digit fingerprint.
std::string fingerprint_of(std::string_view shape);

/// Fingerprint of a class written by a custom serializer. Only the class
/// name takes part: the serializer owns the shape.
std::string custom_fingerprint(const std::string &class_name);

/// Wire descriptor for a fingerprint, `proteus:<fingerprint>`.
std::string descriptor_for(const std::string &fingerprint);

/// Computes structural fingerprints of local types.
class Fingerprinter {
public:
  virtual ~Fingerprinter() = default;

  virtual Result<std::string, Error> fingerprint(const Type &type) = 0;
};

using FingerprinterPtr = std::shared_ptr<Fingerprinter>;

/// Whether a custom serializer will write the given class.
using CustomSerializerLookup = std::function<bool(const Class &)>;

/// Constructs the fingerprinter a factory uses.
using FingerprinterConstructor = std::function<FingerprinterPtr(
    std::shared_ptr<const ClassLoader>, CustomSerializerLookup)>;

/// Fingerprints the shape the serializers put on the wire:
/// - primitives by name
/// - custom serialized classes by the custom marker and their name
/// - enums by name and constants
/// - composites and interfaces by name, properties (name, type and
///   optionality, with generic bindings applied) and interfaces in
///   declaration order; the superclass does not take part
/// - collections and maps by name and type arguments
/// - arrays by component and suffix
///
/// A type met again while its own shape is being computed contributes a
/// back reference instead of recursing. Results of top level calls are
/// memoized.
class SerializerFingerprinter : public Fingerprinter {
public:
  explicit SerializerFingerprinter(
      std::shared_ptr<const ClassLoader> loader,
      CustomSerializerLookup has_custom_serializer = nullptr);

  Result<std::string, Error> fingerprint(const Type &type) override;

  /// The shape string the fingerprint is computed from.
  Result<std::string, Error> shape(const Type &type);

  static FingerprinterPtr
  create(std::shared_ptr<const ClassLoader> loader,
         CustomSerializerLookup has_custom_serializer) {
    return std::make_shared<SerializerFingerprinter>(
        std::move(loader), std::move(has_custom_serializer));
  }

private:
  Result<void, Error> append_shape(const Type &type, std::string &out,
                                   absl::flat_hash_set<std::string> &visiting);

  std::shared_ptr<const ClassLoader> loader_;
  CustomSerializerLookup has_custom_serializer_;
  util::ConcurrentCache<Type, std::string> cache_;
};

} // namespace serialization
} // namespace proteus
