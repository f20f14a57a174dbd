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

#include "proteus/serialization/singleton_serializer.h"

#include "absl/strings/str_cat.h"
#include "proteus/serialization/deserialization_input.h"
#include "proteus/serialization/serialization_output.h"

namespace proteus {
namespace serialization {

SingletonSerializer::SingletonSerializer(Type type, std::string descriptor)
    : type_(std::move(type)), descriptor_(std::move(descriptor)) {
  notation_.name = type_.name();
  notation_.label = "Singleton";
  notation_.provides = type_.raw_class()->interfaces();
  notation_.source = "boolean";
  notation_.descriptor = Descriptor{descriptor_};
}

Result<void, Error>
SingletonSerializer::write_class_info(SerializationOutput &output) {
  output.write_type_notation(notation_);
  return Result<void, Error>();
}

Result<void, Error>
SingletonSerializer::write_object(const Value &value, const Type &,
                                  SerializationOutput &output) {
  if (value.kind() != ValueKind::Object ||
      value.object_class() != type_.raw_class()->name()) {
    return Unexpected(Error::type_mismatch(
        absl::StrCat("Value is not the singleton ", type_.name())));
  }
  output.encoder().write_described(descriptor_);
  output.encoder().write_boolean(false);
  return Result<void, Error>();
}

Result<Value, Error>
SingletonSerializer::read_object(DeserializationInput &input) {
  PROTEUS_RETURN_NOT_OK(input.decoder().read_boolean());
  return Value::object(type_.raw_class()->name(), {});
}

} // namespace serialization
} // namespace proteus
