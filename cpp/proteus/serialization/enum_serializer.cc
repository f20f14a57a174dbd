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

#include "proteus/serialization/enum_serializer.h"

#include "absl/strings/str_cat.h"
#include "proteus/serialization/deserialization_input.h"
#include "proteus/serialization/serialization_output.h"
#include "proteus/serialization/serializer_factory.h"
#include "proteus/util/logging.h"

namespace proteus {
namespace serialization {

Result<SerializerPtr, Error> EnumSerializer::make(const Type &type,
                                                  SerializerFactory &factory) {
  PROTEUS_TRY(descriptor, factory.descriptor_for(type));
  PROTEUS_LOG(DEBUG) << "action=\"build enum serializer\" type=" << type.name()
                     << " descriptor=" << descriptor;
  return SerializerPtr(
      std::make_shared<EnumSerializer>(type, std::move(descriptor)));
}

EnumSerializer::EnumSerializer(Type type, std::string descriptor)
    : type_(std::move(type)), descriptor_(std::move(descriptor)) {
  notation_.name = type_.name();
  notation_.provides = enum_class().interfaces();
  notation_.source = "list";
  notation_.descriptor = Descriptor{descriptor_};
  const auto &constants = enum_class().enum_constants();
  for (size_t i = 0; i < constants.size(); ++i) {
    notation_.choices.push_back(Choice{constants[i], std::to_string(i)});
  }
}

std::vector<Transform> EnumSerializer::transforms() const {
  std::vector<Transform> transforms;
  for (const auto &rename : enum_class().enum_renames()) {
    transforms.push_back(
        Transform{Transform::Kind::Rename, rename.first, rename.second});
  }
  for (const auto &fallback : enum_class().enum_defaults()) {
    transforms.push_back(
        Transform{Transform::Kind::Default, fallback.first, fallback.second});
  }
  return transforms;
}

Result<void, Error>
EnumSerializer::write_class_info(SerializationOutput &output) {
  if (output.write_type_notation(notation_)) {
    std::vector<Transform> declared = transforms();
    if (!declared.empty()) {
      output.add_transforms(type_.name(), std::move(declared));
    }
  }
  return Result<void, Error>();
}

Result<void, Error> EnumSerializer::write_object(const Value &value,
                                                 const Type &,
                                                 SerializationOutput &output) {
  if (value.kind() != ValueKind::Enum) {
    return Unexpected(Error::type_mismatch(
        absl::StrCat("Cannot write ", value_kind_name(value.kind()),
                     " value as ", type_.name())));
  }
  auto ordinal = enum_class().ordinal_of(value.enum_name());
  if (!ordinal.has_value()) {
    return Unexpected(Error::unknown_enum(absl::StrCat(
        value.enum_name(), " is not a constant of ", type_.name())));
  }
  Encoder &encoder = output.encoder();
  encoder.write_described(descriptor_);
  uint32_t start = encoder.begin_list();
  encoder.write_symbol(value.enum_name());
  encoder.write_int(*ordinal);
  encoder.end_list(start, 2);
  return Result<void, Error>();
}

Result<std::pair<std::string, int32_t>, Error>
EnumSerializer::read_constant(DeserializationInput &input) {
  Decoder &decoder = input.decoder();
  PROTEUS_TRY(count, decoder.read_list_header());
  if (count != 2) {
    return Unexpected(Error::invalid_data(
        absl::StrCat("Enum constant with ", count, " elements")));
  }
  PROTEUS_TRY(name, decoder.read_symbol());
  PROTEUS_TRY(ordinal, decoder.read_primitive());
  if (ordinal.kind() != ValueKind::Int) {
    return Unexpected(Error::invalid_data(absl::StrCat(
        "Enum ordinal of ", name, " is ", value_kind_name(ordinal.kind()))));
  }
  return std::make_pair(std::move(name),
                        static_cast<int32_t>(ordinal.as_int64()));
}

Result<Value, Error> EnumSerializer::read_object(DeserializationInput &input) {
  PROTEUS_TRY(constant, read_constant(input));
  auto ordinal = enum_class().ordinal_of(constant.first);
  if (!ordinal.has_value()) {
    return Unexpected(Error::unknown_enum(absl::StrCat(
        constant.first, " is not a constant of ", type_.name())));
  }
  return Value::enum_constant(enum_class().name(), std::move(constant.first),
                              *ordinal);
}

} // namespace serialization
} // namespace proteus
