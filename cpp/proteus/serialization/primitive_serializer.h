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

#include <string>
#include <utility>

#include "proteus/serialization/serializer.h"

namespace proteus {
namespace serialization {

/// Fails with TypeMismatch when `declared` names a primitive type and the
/// non-null `value` is of a different kind. Other declared types pass.
Result<void, Error> check_primitive_kind(const Type &declared,
                                         const Value &value);

/// Writes AMQP primitives bare; the format code describes them.
class PrimitiveSerializer : public Serializer {
public:
  explicit PrimitiveSerializer(Type type)
      : type_(std::move(type)), descriptor_(type_.name()) {}

  const Type &type() const override { return type_; }
  const std::string &type_descriptor() const override { return descriptor_; }

  Result<void, Error> write_class_info(SerializationOutput &) override {
    return Result<void, Error>();
  }

  Result<void, Error> write_object(const Value &value, const Type &declared,
                                   SerializationOutput &output) override;

  Result<Value, Error> read_object(DeserializationInput &input) override;

private:
  Type type_;
  std::string descriptor_;
};

} // namespace serialization
} // namespace proteus
