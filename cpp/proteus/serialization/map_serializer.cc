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

#include "proteus/serialization/map_serializer.h"

#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "proteus/serialization/deserialization_input.h"
#include "proteus/serialization/serialization_output.h"
#include "proteus/serialization/serializer_factory.h"
#include "proteus/util/logging.h"

namespace proteus {
namespace serialization {

namespace {

const std::vector<const char *> &supported_maps() {
  static const std::vector<const char *> names = {
      builtin::kMap, builtin::kSortedMap, builtin::kNavigableMap};
  return names;
}

bool is_map(const ClassPtr &clazz) {
  return clazz != nullptr && clazz->kind() == ClassKind::Map;
}

} // namespace

Result<void, Error>
MapSerializer::check_supported_map_type(const Class &clazz,
                                        const ClassLoader &loader) {
  if (clazz.name() == builtin::kHashMap ||
      loader.is_assignable(clazz, builtin::kHashMap)) {
    return Unexpected(Error::unsupported(absl::StrCat(
        "Map type ", clazz.name(),
        " is unstable under iteration. Suggested fix: use LinkedHashMap "
        "instead.")));
  }
  if (clazz.name() == builtin::kWeakHashMap ||
      loader.is_assignable(clazz, builtin::kWeakHashMap)) {
    return Unexpected(Error::unsupported(
        "Weak references with map types not supported. Suggested fix: use "
        "LinkedHashMap instead."));
  }
  return Result<void, Error>();
}

Result<Type, Error>
MapSerializer::derive_parameterized_type(const Type &declared,
                                         const ClassPtr &actual,
                                         const ClassLoader &loader) {
  ClassPtr base = actual;
  if (!is_map(base)) {
    base = declared.raw_class();
  }
  if (!is_map(base)) {
    PROTEUS_ASSIGN_OR_RETURN(base, loader.load_class(builtin::kLinkedHashMap));
  }
  PROTEUS_RETURN_NOT_OK(check_supported_map_type(*base, loader));
  const char *normalized = nullptr;
  for (const char *name : supported_maps()) {
    if (base->name() == name || loader.is_assignable(*base, name)) {
      normalized = name;
    }
  }
  if (normalized == nullptr) {
    return Unexpected(Error::unsupported(
        absl::StrCat("Unsupported map type ", base->name())));
  }
  PROTEUS_TRY(map, loader.load_class(normalized));
  Type key = Type::wildcard();
  Type value = Type::wildcard();
  if (is_map(declared.raw_class()) && declared.arguments().size() == 2) {
    key = declared.arguments()[0];
    value = declared.arguments()[1];
  }
  return Type::parameterized(std::move(map), {std::move(key), std::move(value)});
}

Result<SerializerPtr, Error> MapSerializer::make(const Type &type,
                                                 SerializerFactory &factory) {
  PROTEUS_TRY(descriptor, factory.descriptor_for(type));
  PROTEUS_LOG(DEBUG) << "action=\"build map serializer\" type=" << type.name()
                     << " descriptor=" << descriptor;
  return SerializerPtr(
      std::make_shared<MapSerializer>(type, std::move(descriptor)));
}

MapSerializer::MapSerializer(Type type, std::string descriptor)
    : type_(std::move(type)), descriptor_(std::move(descriptor)) {
  if (type_.arguments().size() == 2) {
    key_type_ = type_.arguments()[0];
    value_type_ = type_.arguments()[1];
  }
  notation_.name = type_.name();
  notation_.source = "map";
  notation_.descriptor = Descriptor{descriptor_};
}

Result<void, Error> MapSerializer::write_class_info(SerializationOutput &output) {
  if (output.write_type_notation(notation_)) {
    PROTEUS_RETURN_NOT_OK(output.require_serializer(key_type_));
    PROTEUS_RETURN_NOT_OK(output.require_serializer(value_type_));
  }
  return Result<void, Error>();
}

Result<void, Error> MapSerializer::write_object(const Value &value,
                                                const Type &,
                                                SerializationOutput &output) {
  if (value.kind() != ValueKind::Map) {
    return Unexpected(Error::type_mismatch(
        absl::StrCat("Cannot write ", value_kind_name(value.kind()),
                     " value as ", type_.name())));
  }
  Encoder &encoder = output.encoder();
  encoder.write_described(descriptor_);
  uint32_t start = encoder.begin_map();
  for (const auto &entry : value.as_entries()) {
    PROTEUS_RETURN_NOT_OK(output.write_object_or_null(entry.first, key_type_));
    PROTEUS_RETURN_NOT_OK(
        output.write_object_or_null(entry.second, value_type_));
  }
  encoder.end_map(start, static_cast<uint32_t>(value.as_entries().size()));
  return Result<void, Error>();
}

Result<Value, Error> MapSerializer::read_object(DeserializationInput &input) {
  PROTEUS_TRY(count, input.decoder().read_map_header());
  Value::Entries entries;
  for (uint32_t i = 0; i < count; ++i) {
    PROTEUS_TRY(key, input.read_object_or_null(key_type_));
    PROTEUS_TRY(value, input.read_object_or_null(value_type_));
    entries.emplace_back(std::move(key), std::move(value));
  }
  return Value::map(std::move(entries), type_.raw_class()->name());
}

} // namespace serialization
} // namespace proteus
