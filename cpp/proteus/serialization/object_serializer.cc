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

#include "proteus/serialization/object_serializer.h"

#include "absl/strings/str_cat.h"
#include "proteus/serialization/deserialization_input.h"
#include "proteus/serialization/serialization_output.h"
#include "proteus/serialization/serializer_factory.h"
#include "proteus/util/logging.h"

namespace proteus {
namespace serialization {

Result<std::shared_ptr<ObjectSerializer>, Error>
ObjectSerializer::make(const Type &type, SerializerFactory &factory) {
  const ClassPtr &clazz = type.raw_class();
  if (clazz == nullptr || (clazz->kind() != ClassKind::Composite &&
                           clazz->kind() != ClassKind::Interface)) {
    return Unexpected(Error::not_serializable(
        absl::StrCat("Unable to serialize/deserialize ", type.name())));
  }
  PROTEUS_TRY(properties,
              TypeParser::resolve_properties(type, *factory.class_loader()));
  PROTEUS_TRY(descriptor, factory.descriptor_for(type));
  PROTEUS_LOG(DEBUG) << "action=\"build object serializer\" type="
                     << type.name() << " descriptor=" << descriptor;
  return std::make_shared<ObjectSerializer>(type, std::move(descriptor),
                                            std::move(properties));
}

ObjectSerializer::ObjectSerializer(Type type, std::string descriptor,
                                   std::vector<ResolvedProperty> properties)
    : type_(std::move(type)), descriptor_(std::move(descriptor)),
      properties_(std::move(properties)) {
  const Class &clazz = *type_.raw_class();
  notation_.name = type_.name();
  if (clazz.is_interface()) {
    notation_.label = "interface";
  }
  notation_.provides = clazz.interfaces();
  notation_.descriptor = Descriptor{descriptor_};
  for (const auto &property : properties_) {
    Field field;
    field.name = property.name;
    field.type = property.type.name();
    field.mandatory = property.mandatory;
    notation_.fields.push_back(std::move(field));
  }
}

Result<void, Error>
ObjectSerializer::write_class_info(SerializationOutput &output) {
  if (!output.write_type_notation(notation_)) {
    return Result<void, Error>();
  }
  for (const auto &property : properties_) {
    PROTEUS_RETURN_NOT_OK(output.require_serializer(property.type));
  }
  for (const auto &name : type_.raw_class()->interfaces()) {
    PROTEUS_TRY(interface_type, output.factory().type_for_name(name));
    PROTEUS_RETURN_NOT_OK(output.require_serializer(interface_type));
  }
  return Result<void, Error>();
}

Result<void, Error> ObjectSerializer::write_object(const Value &value,
                                                   const Type &,
                                                   SerializationOutput &output) {
  output.encoder().write_described(descriptor_);
  return write_properties(value, output);
}

Result<void, Error>
ObjectSerializer::write_properties(const Value &value,
                                   SerializationOutput &output) {
  if (value.kind() != ValueKind::Object) {
    return Unexpected(Error::type_mismatch(
        absl::StrCat("Cannot write ", value_kind_name(value.kind()),
                     " value as ", type_.name())));
  }
  Encoder &encoder = output.encoder();
  uint32_t start = encoder.begin_list();
  for (const auto &property : properties_) {
    const Value *field = value.field(property.name);
    if (field == nullptr || field->is_null()) {
      if (property.mandatory) {
        return Unexpected(Error::not_serializable(
            absl::StrCat("Mandatory property ", property.name, " of ",
                         type_.name(), " is null")));
      }
      encoder.write_null();
      continue;
    }
    PROTEUS_RETURN_NOT_OK(output.write_object_or_null(*field, property.type));
  }
  encoder.end_list(start, static_cast<uint32_t>(properties_.size()));
  return Result<void, Error>();
}

Result<Value, Error> ObjectSerializer::read_object(DeserializationInput &input) {
  if (type_.raw_class()->is_interface()) {
    return Unexpected(Error::not_serializable(
        absl::StrCat("Cannot instantiate interface ", type_.name())));
  }
  PROTEUS_TRY(fields, read_properties(input));
  return Value::object(type_.raw_class()->name(), std::move(fields));
}

Result<Value::Fields, Error>
ObjectSerializer::read_properties(DeserializationInput &input) {
  PROTEUS_TRY(count, input.decoder().read_list_header());
  if (count != properties_.size()) {
    return Unexpected(Error::invalid_data(
        absl::StrCat(type_.name(), " has ", properties_.size(),
                     " properties but ", count, " were written")));
  }
  Value::Fields fields;
  fields.reserve(count);
  for (const auto &property : properties_) {
    PROTEUS_TRY(field, input.read_object_or_null(property.type));
    if (field.is_null() && property.mandatory) {
      return Unexpected(Error::not_serializable(
          absl::StrCat("Mandatory property ", property.name, " of ",
                       type_.name(), " is null")));
    }
    fields.emplace_back(property.name, std::move(field));
  }
  return fields;
}

} // namespace serialization
} // namespace proteus
