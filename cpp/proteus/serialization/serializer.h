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

#include "proteus/type/type.h"
#include "proteus/type/value.h"
#include "proteus/util/error.h"
#include "proteus/util/result.h"

namespace proteus {
namespace serialization {

class SerializationOutput;
class DeserializationInput;

/// Writes and reads values of one type.
///
/// Every value but a primitive goes on the wire as a described value whose
/// descriptor is `type_descriptor()`. `write_object` writes the descriptor
/// and the body; `read_object` is called once the reader has consumed the
/// descriptor and reads the body.
///
/// Serializers are shared by every thread using a factory and must not hold
/// per-call state.
class Serializer {
public:
  virtual ~Serializer() = default;

  virtual const Type &type() const = 0;

  virtual const std::string &type_descriptor() const = 0;

  /// Adds this serializer's type notation, and those of the types it
  /// depends on, to the schema under construction.
  virtual Result<void, Error> write_class_info(SerializationOutput &output) = 0;

  virtual Result<void, Error> write_object(const Value &value,
                                           const Type &declared,
                                           SerializationOutput &output) = 0;

  virtual Result<Value, Error> read_object(DeserializationInput &input) = 0;
};

using SerializerPtr = std::shared_ptr<Serializer>;

} // namespace serialization
} // namespace proteus
