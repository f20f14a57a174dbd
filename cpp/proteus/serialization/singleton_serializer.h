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

namespace proteus {
namespace serialization {

/// Serializes object singletons. The body carries no state; reading yields
/// the singleton instance.
class SingletonSerializer : public Serializer {
public:
  SingletonSerializer(Type type, std::string descriptor);

  const Type &type() const override { return type_; }
  const std::string &type_descriptor() const override { return descriptor_; }

  Result<void, Error> write_class_info(SerializationOutput &output) override;

  Result<void, Error> write_object(const Value &value, const Type &declared,
                                   SerializationOutput &output) override;

  Result<Value, Error> read_object(DeserializationInput &input) override;

private:
  Type type_;
  std::string descriptor_;
  RestrictedType notation_;
};

} // namespace serialization
} // namespace proteus
