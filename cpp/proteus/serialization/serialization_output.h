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
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"

#include "proteus/serialization/codec.h"
#include "proteus/serialization/schema.h"
#include "proteus/serialization/serializer.h"
#include "proteus/type/type.h"
#include "proteus/type/value.h"
#include "proteus/util/buffer.h"
#include "proteus/util/error.h"
#include "proteus/util/result.h"

namespace proteus {
namespace serialization {

class SerializerFactory;

/// Preamble opening every encoded message; followed by one format byte.
constexpr char kPreamble[] = {'p', 'r', 'o', 't', 'e', 'u', 's', '\0'};
constexpr uint8_t kFormatVersion = 0;

/// State of one serialize call: the buffer, the schema and transforms
/// collected so far and the serializers whose notations were written.
///
/// Not thread-safe; create one per call.
class SerializationOutput {
public:
  explicit SerializationOutput(SerializerFactory &factory);

  SerializationOutput(const SerializationOutput &) = delete;
  SerializationOutput &operator=(const SerializationOutput &) = delete;

  /// Encodes `value` as an instance of `declared` into a complete message.
  Result<std::vector<uint8_t>, Error> serialize(const Value &value,
                                                const Type &declared);

  SerializerFactory &factory() { return factory_; }
  Encoder &encoder() { return encoder_; }
  const Schema &schema() const { return schema_; }
  const TransformsSchema &transforms() const { return transforms_; }

  /// Writes a null, a bare primitive or a described value.
  Result<void, Error> write_object_or_null(const Value &value,
                                           const Type &declared);

  /// Adds a notation to the schema; false if one with the name exists.
  bool write_type_notation(TypeNotation notation) {
    return schema_.add(std::move(notation));
  }

  /// Makes sure the notation of the serializer for `type` is in the schema.
  /// The wildcard and Object have none.
  Result<void, Error> require_serializer(const Type &type);

  void add_transforms(const std::string &type_name,
                      std::vector<Transform> transforms) {
    transforms_.put(type_name, std::move(transforms));
  }

private:
  Result<ClassPtr, Error> actual_class_of(const Value &value,
                                          const Type &declared) const;

  Result<void, Error> write_class_info_once(const SerializerPtr &serializer);

  SerializerFactory &factory_;
  Buffer buffer_;
  Encoder encoder_;
  Schema schema_;
  TransformsSchema transforms_;
  absl::flat_hash_map<std::string, SerializerPtr> serializer_history_;
  uint32_t depth_ = 0;
};

} // namespace serialization
} // namespace proteus
