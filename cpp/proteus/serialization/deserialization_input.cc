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

#include "proteus/serialization/deserialization_input.h"

#include <cstring>
#include <utility>

#include "absl/strings/str_cat.h"
#include "proteus/serialization/serialization_output.h"
#include "proteus/serialization/primitive_serializer.h"
#include "proteus/serialization/serializer_factory.h"
#include "proteus/util/logging.h"

namespace proteus {
namespace serialization {

namespace {

constexpr uint32_t kEnvelopeFields = 3;

// Reads up to the object: checks the preamble, decodes the schema and
// transforms that follow the object and returns the object's offset.
Result<uint32_t, Error> read_envelope(Decoder &decoder,
                                      SerializationSchemas &schemas) {
  Buffer &buffer = decoder.buffer();
  if (buffer.remaining_size() < sizeof(kPreamble) + 1 ||
      std::memcmp(buffer.data(), kPreamble, sizeof(kPreamble)) != 0) {
    return Unexpected(Error::invalid_data(
        "Serialized data does not start with the proteus preamble"));
  }
  PROTEUS_RETURN_NOT_OK(buffer.seek(sizeof(kPreamble)));
  PROTEUS_TRY(format, buffer.read_uint8());
  if (format != kFormatVersion) {
    return Unexpected(Error::invalid_data(
        absl::StrCat("Unsupported format version ", format)));
  }
  PROTEUS_TRY(descriptor, decoder.read_descriptor());
  if (descriptor != kEnvelopeDescriptor) {
    return Unexpected(Error::invalid_data(
        absl::StrCat("Expected an envelope, found ", descriptor)));
  }
  PROTEUS_TRY(count, decoder.read_list_header());
  if (count < kEnvelopeFields) {
    return Unexpected(Error::invalid_data(
        absl::StrCat("Envelope has ", count, " fields, expected ",
                     kEnvelopeFields)));
  }
  uint32_t object_offset = buffer.reader_index();
  PROTEUS_RETURN_NOT_OK(decoder.skip_value());
  PROTEUS_ASSIGN_OR_RETURN(schemas.schema, Schema::read(decoder));
  PROTEUS_ASSIGN_OR_RETURN(schemas.transforms, TransformsSchema::read(decoder));
  return object_offset;
}

bool is_untyped(const Type &type) {
  return type.is_wildcard() ||
         (type.raw_class() != nullptr && type.raw_class()->is_top());
}

} // namespace

DeserializationInput::DeserializationInput(SerializerFactory &factory)
    : factory_(factory) {}

Result<SerializationSchemas, Error>
DeserializationInput::read_schemas(const std::vector<uint8_t> &bytes) {
  Buffer buffer(bytes.data(), static_cast<uint32_t>(bytes.size()));
  Decoder decoder(buffer);
  SerializationSchemas schemas;
  PROTEUS_RETURN_NOT_OK(read_envelope(decoder, schemas));
  return schemas;
}

Result<Value, Error>
DeserializationInput::deserialize(const std::vector<uint8_t> &bytes,
                                  const Type &expected) {
  Buffer buffer(bytes.data(), static_cast<uint32_t>(bytes.size()));
  Decoder decoder(buffer);
  decoder_ = &decoder;
  auto value = [&]() -> Result<Value, Error> {
    PROTEUS_TRY(object_offset, read_envelope(decoder, schemas_));
    PROTEUS_RETURN_NOT_OK(buffer.seek(object_offset));
    return read_object_or_null(expected);
  }();
  decoder_ = nullptr;
  if (!value.ok()) {
    PROTEUS_LOG(DEBUG) << "action=\"deserialize\" type=" << expected.name()
                       << " error=\"" << value.error() << "\"";
  }
  return value;
}

Result<Value, Error>
DeserializationInput::read_object_or_null(const Type &expected) {
  PROTEUS_TRY(is_null, decoder().read_null_if_present());
  if (is_null) {
    return Value::null();
  }
  PROTEUS_TRY(described, decoder().next_is_described());
  if (!described) {
    const ClassPtr &clazz = expected.raw_class();
    if (clazz != nullptr && !clazz->is_top() && !clazz->is_primitive()) {
      return Unexpected(Error::type_mismatch(absl::StrCat(
          "Found a primitive value where ", expected.name(),
          " was expected")));
    }
    PROTEUS_TRY(value, decoder().read_primitive());
    PROTEUS_RETURN_NOT_OK(check_primitive_kind(expected, value));
    return value;
  }
  PROTEUS_TRY(descriptor, decoder().read_descriptor());
  PROTEUS_TRY(serializer, factory_.get(descriptor, schemas_));
  PROTEUS_RETURN_NOT_OK(check_compatible(serializer->type(), expected));
  uint32_t max_depth = factory_.config().max_depth;
  if (depth_ >= max_depth) {
    return Unexpected(Error::depth_exceed(absl::StrCat(
        "Object graph of ", expected.name(), " is deeper than ", max_depth)));
  }
  ++depth_;
  auto value = serializer->read_object(*this);
  --depth_;
  return value;
}

Result<void, Error>
DeserializationInput::check_compatible(const Type &actual,
                                       const Type &expected) const {
  if (is_untyped(expected) || actual.name() == expected.name()) {
    return Result<void, Error>();
  }
  if (actual.is_array() && expected.is_array()) {
    return Result<void, Error>();
  }
  const ClassPtr &actual_class = actual.raw_class();
  const ClassPtr &expected_class = expected.raw_class();
  if (actual_class != nullptr && expected_class != nullptr) {
    if (actual_class->name() == expected_class->name() ||
        factory_.class_loader()->is_assignable(*actual_class,
                                               expected_class->name())) {
      return Result<void, Error>();
    }
    bool both_collections = actual_class->kind() == ClassKind::Collection &&
                            expected_class->kind() == ClassKind::Collection;
    bool both_maps = actual_class->kind() == ClassKind::Map &&
                     expected_class->kind() == ClassKind::Map;
    if (both_collections || both_maps) {
      return Result<void, Error>();
    }
  }
  return Unexpected(Error::type_mismatch(
      absl::StrCat("Described type ", actual.name(),
                   " is not compatible with expected type ", expected.name())));
}

} // namespace serialization
} // namespace proteus
