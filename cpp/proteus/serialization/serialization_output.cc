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

#include "proteus/serialization/serialization_output.h"

#include <utility>

#include "absl/strings/str_cat.h"
#include "proteus/serialization/primitive_serializer.h"
#include "proteus/serialization/serializer_factory.h"
#include "proteus/type/class_loader.h"
#include "proteus/util/logging.h"

namespace proteus {
namespace serialization {

SerializationOutput::SerializationOutput(SerializerFactory &factory)
    : factory_(factory), encoder_(buffer_) {}

Result<std::vector<uint8_t>, Error>
SerializationOutput::serialize(const Value &value, const Type &declared) {
  buffer_.write_bytes(kPreamble, sizeof(kPreamble));
  buffer_.write_uint8(kFormatVersion);
  encoder_.write_described(kEnvelopeDescriptor);
  uint32_t start = encoder_.begin_list();
  PROTEUS_RETURN_NOT_OK(write_object_or_null(value, declared));
  schema_.write(encoder_);
  transforms_.write(encoder_);
  encoder_.end_list(start, 3);
  PROTEUS_LOG(TRACE) << "action=\"serialize\" type=" << declared.name()
                     << " notations=" << schema_.types().size()
                     << " bytes=" << buffer_.writer_index();
  return buffer_.to_vector();
}

Result<void, Error>
SerializationOutput::write_object_or_null(const Value &value,
                                          const Type &declared) {
  if (value.is_null()) {
    encoder_.write_null();
    return Result<void, Error>();
  }
  if (value.is_primitive()) {
    PROTEUS_RETURN_NOT_OK(check_primitive_kind(declared, value));
    return encoder_.write_primitive(value);
  }
  uint32_t max_depth = factory_.config().max_depth;
  if (depth_ >= max_depth) {
    return Unexpected(Error::depth_exceed(absl::StrCat(
        "Object graph of ", declared.name(), " is deeper than ", max_depth)));
  }
  PROTEUS_TRY(actual, actual_class_of(value, declared));
  PROTEUS_TRY(serializer, factory_.get(actual, declared));
  PROTEUS_RETURN_NOT_OK(write_class_info_once(serializer));
  ++depth_;
  auto written = serializer->write_object(value, declared, *this);
  --depth_;
  return written;
}

Result<void, Error> SerializationOutput::require_serializer(const Type &type) {
  if (type.is_wildcard() ||
      (type.raw_class() != nullptr && type.raw_class()->is_top())) {
    return Result<void, Error>();
  }
  PROTEUS_TRY(serializer, factory_.get(nullptr, type));
  return write_class_info_once(serializer);
}

Result<ClassPtr, Error>
SerializationOutput::actual_class_of(const Value &value,
                                     const Type &declared) const {
  const ClassLoader &loader = *factory_.class_loader();
  switch (value.kind()) {
  case ValueKind::Object:
    return loader.load_class(value.object_class());
  case ValueKind::Enum:
    return loader.load_class(value.enum_class());
  case ValueKind::List:
  case ValueKind::Map: {
    if (!value.collection_class().empty()) {
      return loader.load_class(value.collection_class());
    }
    bool untyped = declared.is_wildcard() || (declared.raw_class() != nullptr &&
                                              declared.raw_class()->is_top());
    if (!untyped) {
      return ClassPtr();
    }
    return loader.load_class(value.kind() == ValueKind::List
                                 ? builtin::kList
                                 : builtin::kLinkedHashMap);
  }
  default:
    return ClassPtr();
  }
}

Result<void, Error>
SerializationOutput::write_class_info_once(const SerializerPtr &serializer) {
  if (!serializer_history_.emplace(serializer->type_descriptor(), serializer)
           .second) {
    return Result<void, Error>();
  }
  return serializer->write_class_info(*this);
}

} // namespace serialization
} // namespace proteus
