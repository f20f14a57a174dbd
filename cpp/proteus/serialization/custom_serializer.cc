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

#include "proteus/serialization/custom_serializer.h"

#include <utility>

#include "absl/strings/str_cat.h"
#include "proteus/serialization/deserialization_input.h"
#include "proteus/serialization/fingerprinter.h"
#include "proteus/serialization/object_serializer.h"
#include "proteus/serialization/serialization_output.h"
#include "proteus/serialization/serializer_factory.h"

namespace proteus {
namespace serialization {

Result<void, Error> CustomSerializer::write_object(const Value &value,
                                                   const Type &declared,
                                                   SerializationOutput &output) {
  output.encoder().write_described(type_descriptor());
  return write_described_object(value, declared, output);
}

// ============================================================================
// ProxySerializer
// ============================================================================

ProxySerializer::ProxySerializer(ClassPtr clazz, ClassPtr proxy_class,
                                 Conversion to_proxy, Conversion from_proxy,
                                 Matching matching, bool reveal_subclasses,
                                 std::vector<CustomSerializerPtr> additional)
    : clazz_(std::move(clazz)), proxy_class_(std::move(proxy_class)),
      type_(Type::of(clazz_)),
      descriptor_(descriptor_for(custom_fingerprint(clazz_->name()))),
      to_proxy_(std::move(to_proxy)), from_proxy_(std::move(from_proxy)),
      matching_(matching), reveal_subclasses_(reveal_subclasses),
      additional_(std::move(additional)) {}

bool ProxySerializer::is_serializer_for(const Class &clazz,
                                        const ClassLoader &loader) const {
  if (clazz.name() == clazz_->name()) {
    return true;
  }
  return matching_ == Matching::Implements &&
         loader.is_assignable(clazz, clazz_->name());
}

Result<std::shared_ptr<ObjectSerializer>, Error>
ProxySerializer::proxy_serializer(SerializerFactory &factory) {
  absl::MutexLock lock(&mu_);
  if (proxy_serializer_ == nullptr) {
    PROTEUS_ASSIGN_OR_RETURN(proxy_serializer_,
                             ObjectSerializer::make(Type::of(proxy_class_),
                                                    factory));
  }
  return proxy_serializer_;
}

Result<void, Error> ProxySerializer::write_class_info(SerializationOutput &output) {
  PROTEUS_TRY(proxy, proxy_serializer(output.factory()));
  CompositeType notation;
  notation.name = type_.name();
  notation.descriptor = Descriptor{descriptor_};
  notation.fields = proxy->notation().fields;
  if (output.write_type_notation(std::move(notation))) {
    for (const auto &property : proxy->properties()) {
      PROTEUS_RETURN_NOT_OK(output.require_serializer(property.type));
    }
  }
  return Result<void, Error>();
}

Result<void, Error>
ProxySerializer::write_described_object(const Value &value, const Type &,
                                        SerializationOutput &output) {
  PROTEUS_TRY(proxy_serializer_for_write, proxy_serializer(output.factory()));
  PROTEUS_TRY(proxy, to_proxy_(value));
  return proxy_serializer_for_write->write_properties(proxy, output);
}

Result<Value, Error>
ProxySerializer::read_described_object(DeserializationInput &input) {
  PROTEUS_TRY(proxy_serializer_for_read, proxy_serializer(input.factory()));
  PROTEUS_TRY(fields, proxy_serializer_for_read->read_properties(input));
  return from_proxy_(Value::object(proxy_class_->name(), std::move(fields)));
}

// ============================================================================
// SubClassSerializer
// ============================================================================

SubClassSerializer::SubClassSerializer(ClassPtr clazz, CustomSerializerPtr base)
    : clazz_(std::move(clazz)), base_(std::move(base)), type_(Type::of(clazz_)),
      descriptor_(descriptor_for(custom_fingerprint(clazz_->name()))) {}

Result<void, Error>
SubClassSerializer::write_class_info(SerializationOutput &output) {
  RestrictedType notation;
  notation.name = type_.name();
  notation.source = base_->type().name();
  notation.descriptor = Descriptor{descriptor_};
  if (output.write_type_notation(std::move(notation))) {
    PROTEUS_RETURN_NOT_OK(base_->write_class_info(output));
  }
  return Result<void, Error>();
}

// ============================================================================
// ExternalSerializer
// ============================================================================

Result<std::shared_ptr<ExternalSerializer>, Error> ExternalSerializer::make(
    std::shared_ptr<const SerializationCustomSerializer> plugin,
    const ClassLoader &loader) {
  PROTEUS_TRY(clazz, loader.load_class(plugin->type_name()));
  PROTEUS_TRY(proxy_class, loader.load_class(plugin->proxy_type_name()));
  return std::make_shared<ExternalSerializer>(
      std::move(plugin), std::move(clazz), std::move(proxy_class));
}

ExternalSerializer::ExternalSerializer(
    std::shared_ptr<const SerializationCustomSerializer> plugin,
    ClassPtr clazz, ClassPtr proxy_class)
    : ProxySerializer(
          std::move(clazz), std::move(proxy_class),
          [plugin](const Value &value) { return plugin->to_proxy(value); },
          [plugin](const Value &proxy) { return plugin->from_proxy(proxy); }),
      plugin_(std::move(plugin)) {}

} // namespace serialization
} // namespace proteus
