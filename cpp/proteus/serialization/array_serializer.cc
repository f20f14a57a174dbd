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

#include "proteus/serialization/array_serializer.h"

#include "absl/strings/str_cat.h"
#include "proteus/serialization/deserialization_input.h"
#include "proteus/serialization/serialization_output.h"
#include "proteus/serialization/serializer_factory.h"
#include "proteus/util/logging.h"

namespace proteus {
namespace serialization {

Result<SerializerPtr, Error> ArraySerializer::make(const Type &type,
                                                   SerializerFactory &factory) {
  PROTEUS_TRY(descriptor, factory.descriptor_for(type));
  PROTEUS_LOG(DEBUG) << "action=\"build array serializer\" type="
                     << type.name() << " descriptor=" << descriptor;
  if (type.is_primitive_array()) {
    return SerializerPtr(
        std::make_shared<PrimArraySerializer>(type, std::move(descriptor)));
  }
  return SerializerPtr(
      std::make_shared<ArraySerializer>(type, std::move(descriptor)));
}

ArraySerializer::ArraySerializer(Type type, std::string descriptor)
    : type_(std::move(type)), descriptor_(std::move(descriptor)) {
  notation_.name = type_.name();
  notation_.source = "list";
  notation_.descriptor = Descriptor{descriptor_};
}

Result<void, Error>
ArraySerializer::write_class_info(SerializationOutput &output) {
  if (output.write_type_notation(notation_)) {
    PROTEUS_RETURN_NOT_OK(output.require_serializer(component_type()));
  }
  return Result<void, Error>();
}

Result<void, Error> ArraySerializer::write_object(const Value &value,
                                                  const Type &,
                                                  SerializationOutput &output) {
  if (value.kind() != ValueKind::List) {
    return Unexpected(Error::type_mismatch(
        absl::StrCat("Cannot write ", value_kind_name(value.kind()),
                     " value as ", type_.name())));
  }
  Encoder &encoder = output.encoder();
  encoder.write_described(descriptor_);
  uint32_t start = encoder.begin_list();
  for (const auto &element : value.as_list()) {
    PROTEUS_RETURN_NOT_OK(write_element(element, output));
  }
  encoder.end_list(start, static_cast<uint32_t>(value.as_list().size()));
  return Result<void, Error>();
}

Result<Value, Error> ArraySerializer::read_object(DeserializationInput &input) {
  PROTEUS_TRY(count, input.decoder().read_list_header());
  Value::List elements;
  for (uint32_t i = 0; i < count; ++i) {
    PROTEUS_TRY(element, read_element(input));
    elements.push_back(std::move(element));
  }
  return Value::list(std::move(elements));
}

Result<void, Error> ArraySerializer::write_element(const Value &element,
                                                   SerializationOutput &output) {
  return output.write_object_or_null(element, component_type());
}

Result<Value, Error> ArraySerializer::read_element(DeserializationInput &input) {
  return input.read_object_or_null(component_type());
}

PrimArraySerializer::PrimArraySerializer(Type type, std::string descriptor)
    : ArraySerializer(std::move(type), std::move(descriptor)),
      component_kind_(find_primitive(component_type().name())->kind) {}

Result<void, Error> PrimArraySerializer::check_kind(const Value &element) const {
  if (element.kind() != component_kind_) {
    return Unexpected(Error::type_mismatch(absl::StrCat(
        "Element of kind ", value_kind_name(element.kind()), " in ",
        type().name())));
  }
  return Result<void, Error>();
}

Result<void, Error>
PrimArraySerializer::write_element(const Value &element,
                                   SerializationOutput &output) {
  PROTEUS_RETURN_NOT_OK(check_kind(element));
  return output.encoder().write_primitive(element);
}

Result<Value, Error>
PrimArraySerializer::read_element(DeserializationInput &input) {
  PROTEUS_TRY(element, input.decoder().read_primitive());
  PROTEUS_RETURN_NOT_OK(check_kind(element));
  return element;
}

} // namespace serialization
} // namespace proteus
