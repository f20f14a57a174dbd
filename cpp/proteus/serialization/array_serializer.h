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

#include "proteus/serialization/schema.h"
#include "proteus/serialization/serializer.h"
#include "proteus/type/primitive.h"

namespace proteus {
namespace serialization {

class SerializerFactory;

/// Serializes arrays of reference types as AMQP lists.
class ArraySerializer : public Serializer {
public:
  /// Builds an ArraySerializer, or a PrimArraySerializer for `X[p]`.
  static Result<SerializerPtr, Error> make(const Type &type,
                                           SerializerFactory &factory);

  ArraySerializer(Type type, std::string descriptor);

  const Type &type() const override { return type_; }
  const std::string &type_descriptor() const override { return descriptor_; }

  Result<void, Error> write_class_info(SerializationOutput &output) override;

  Result<void, Error> write_object(const Value &value, const Type &declared,
                                   SerializationOutput &output) override;

  Result<Value, Error> read_object(DeserializationInput &input) override;

protected:
  virtual Result<void, Error> write_element(const Value &element,
                                            SerializationOutput &output);

  virtual Result<Value, Error> read_element(DeserializationInput &input);

  const Type &component_type() const { return type_.component(); }

private:
  Type type_;
  std::string descriptor_;
  RestrictedType notation_;
};

/// Serializes arrays of primitives; every element must be of the component
/// kind and null elements are rejected.
class PrimArraySerializer : public ArraySerializer {
public:
  PrimArraySerializer(Type type, std::string descriptor);

protected:
  Result<void, Error> write_element(const Value &element,
                                    SerializationOutput &output) override;

  Result<Value, Error> read_element(DeserializationInput &input) override;

private:
  Result<void, Error> check_kind(const Value &element) const;

  ValueKind component_kind_;
};

} // namespace serialization
} // namespace proteus
