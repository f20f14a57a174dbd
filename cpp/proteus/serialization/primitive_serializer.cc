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

#include "proteus/serialization/primitive_serializer.h"

#include "absl/strings/str_cat.h"
#include "proteus/serialization/deserialization_input.h"
#include "proteus/serialization/serialization_output.h"

namespace proteus {
namespace serialization {

Result<void, Error> check_primitive_kind(const Type &declared,
                                         const Value &value) {
  const ClassPtr &clazz = declared.raw_class();
  if (value.is_null() || clazz == nullptr || !clazz->is_primitive()) {
    return Result<void, Error>();
  }
  const PrimitiveInfo *info = find_primitive(clazz->name());
  if (info == nullptr || info->kind != value.kind()) {
    return Unexpected(Error::type_mismatch(
        absl::StrCat("Found ", value_kind_name(value.kind()),
                     " value where ", clazz->name(), " was declared")));
  }
  return Result<void, Error>();
}

Result<void, Error> PrimitiveSerializer::write_object(
    const Value &value, const Type &, SerializationOutput &output) {
  PROTEUS_RETURN_NOT_OK(check_primitive_kind(type_, value));
  return output.encoder().write_primitive(value);
}

Result<Value, Error> PrimitiveSerializer::read_object(
    DeserializationInput &input) {
  PROTEUS_TRY(value, input.decoder().read_primitive());
  PROTEUS_RETURN_NOT_OK(check_primitive_kind(type_, value));
  return value;
}

} // namespace serialization
} // namespace proteus
