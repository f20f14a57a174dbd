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
#include <vector>

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

/// State of one deserialize call: the decoder and the schemas received with
/// the object.
///
/// Not thread-safe; create one per call.
class DeserializationInput {
public:
  explicit DeserializationInput(SerializerFactory &factory);

  DeserializationInput(const DeserializationInput &) = delete;
  DeserializationInput &operator=(const DeserializationInput &) = delete;

  /// Decodes a complete message into a value compatible with `expected`.
  Result<Value, Error> deserialize(const std::vector<uint8_t> &bytes,
                                   const Type &expected);

  /// Decodes the envelope's schema and transforms without the object.
  static Result<SerializationSchemas, Error>
  read_schemas(const std::vector<uint8_t> &bytes);

  SerializerFactory &factory() { return factory_; }
  Decoder &decoder() { return *decoder_; }
  const SerializationSchemas &schemas() const { return schemas_; }

  /// Reads a null, a bare primitive or a described value.
  Result<Value, Error> read_object_or_null(const Type &expected);

private:
  Result<void, Error> check_compatible(const Type &actual,
                                       const Type &expected) const;

  SerializerFactory &factory_;
  Decoder *decoder_ = nullptr;
  SerializationSchemas schemas_;
  uint32_t depth_ = 0;
};

} // namespace serialization
} // namespace proteus
