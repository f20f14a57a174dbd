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

#include "proteus/serialization/collection_serializer.h"

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

// Collection interfaces a collection is serialized as, most general first.
const std::vector<const char *> &supported_collections() {
  static const std::vector<const char *> names = {
      builtin::kCollection,   builtin::kList,        builtin::kSet,
      builtin::kSortedSet,    builtin::kNavigableSet, builtin::kNonEmptySet};
  return names;
}

bool is_collection(const ClassPtr &clazz) {
  return clazz != nullptr && clazz->kind() == ClassKind::Collection;
}

} // namespace

Result<Type, Error> CollectionSerializer::derive_parameterized_type(
    const Type &declared, const ClassPtr &actual, const ClassLoader &loader) {
  ClassPtr base = actual;
  if (!is_collection(base)) {
    base = declared.raw_class();
  }
  if (!is_collection(base)) {
    PROTEUS_ASSIGN_OR_RETURN(base, loader.load_class(builtin::kList));
  }
  // The most specific supported interface the class implements.
  const char *normalized = nullptr;
  for (const char *name : supported_collections()) {
    if (base->name() == name || loader.is_assignable(*base, name)) {
      normalized = name;
    }
  }
  if (normalized == nullptr) {
    return Unexpected(Error::unsupported(
        absl::StrCat("Unsupported collection type ", base->name())));
  }
  PROTEUS_TRY(collection, loader.load_class(normalized));
  Type element = Type::wildcard();
  if (is_collection(declared.raw_class()) && !declared.arguments().empty()) {
    element = declared.arguments()[0];
  }
  return Type::parameterized(std::move(collection), {std::move(element)});
}

Result<SerializerPtr, Error>
CollectionSerializer::make(const Type &type, SerializerFactory &factory) {
  PROTEUS_TRY(descriptor, factory.descriptor_for(type));
  PROTEUS_LOG(DEBUG) << "action=\"build collection serializer\" type="
                     << type.name() << " descriptor=" << descriptor;
  return SerializerPtr(
      std::make_shared<CollectionSerializer>(type, std::move(descriptor)));
}

CollectionSerializer::CollectionSerializer(Type type, std::string descriptor)
    : type_(std::move(type)), descriptor_(std::move(descriptor)),
      element_type_(type_.arguments().empty() ? Type::wildcard()
                                              : type_.arguments()[0]) {
  notation_.name = type_.name();
  notation_.source = "list";
  notation_.descriptor = Descriptor{descriptor_};
}

Result<void, Error>
CollectionSerializer::write_class_info(SerializationOutput &output) {
  if (output.write_type_notation(notation_)) {
    PROTEUS_RETURN_NOT_OK(output.require_serializer(element_type_));
  }
  return Result<void, Error>();
}

Result<void, Error>
CollectionSerializer::write_object(const Value &value, const Type &,
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
    PROTEUS_RETURN_NOT_OK(output.write_object_or_null(element, element_type_));
  }
  encoder.end_list(start, static_cast<uint32_t>(value.as_list().size()));
  return Result<void, Error>();
}

Result<Value, Error>
CollectionSerializer::read_object(DeserializationInput &input) {
  PROTEUS_TRY(count, input.decoder().read_list_header());
  Value::List elements;
  for (uint32_t i = 0; i < count; ++i) {
    PROTEUS_TRY(element, input.read_object_or_null(element_type_));
    elements.push_back(std::move(element));
  }
  return Value::list(std::move(elements), type_.raw_class()->name());
}

} // namespace serialization
} // namespace proteus
