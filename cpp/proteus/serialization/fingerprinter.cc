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

#include "proteus/serialization/fingerprinter.h"

#include <cstdio>
#include <utility>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "proteus/serialization/schema.h"
#include "proteus/type/type_parser.h"

namespace proteus {
namespace serialization {

std::string fingerprint_of(std::string_view shape) {
  char text[17];
  std::snprintf(text, sizeof(text), "%016llx",
                static_cast<unsigned long long>(fnv1a_64(shape)));
  return text;
}

std::string custom_fingerprint(const std::string &class_name) {
  return fingerprint_of(absl::StrCat("custom:", class_name));
}

std::string descriptor_for(const std::string &fingerprint) {
  return absl::StrCat(kDescriptorPrefix, fingerprint);
}

SerializerFingerprinter::SerializerFingerprinter(
    std::shared_ptr<const ClassLoader> loader,
    CustomSerializerLookup has_custom_serializer)
    : loader_(std::move(loader)),
      has_custom_serializer_(std::move(has_custom_serializer)) {}

Result<std::string, Error> SerializerFingerprinter::fingerprint(const Type &type) {
  return cache_.get_or_create(type, [&]() -> Result<std::string, Error> {
    PROTEUS_TRY(text, shape(type));
    return fingerprint_of(text);
  });
}

Result<std::string, Error> SerializerFingerprinter::shape(const Type &type) {
  std::string out;
  absl::flat_hash_set<std::string> visiting;
  PROTEUS_RETURN_NOT_OK(append_shape(type, out, visiting));
  return out;
}

Result<void, Error> SerializerFingerprinter::append_shape(
    const Type &type, std::string &out,
    absl::flat_hash_set<std::string> &visiting) {
  if (type.is_wildcard()) {
    out.append("?");
    return Result<void, Error>();
  }
  if (type.is_array()) {
    PROTEUS_RETURN_NOT_OK(append_shape(type.component(), out, visiting));
    out.append(type.is_primitive_array() ? "[p]" : "[]");
    return Result<void, Error>();
  }
  const Class &clazz = *type.raw_class();
  if (clazz.is_primitive() || clazz.is_top()) {
    out.append(clazz.name());
    return Result<void, Error>();
  }
  if (has_custom_serializer_ && has_custom_serializer_(clazz)) {
    absl::StrAppend(&out, "custom:", clazz.name());
    return Result<void, Error>();
  }
  if (!visiting.insert(type.name()).second) {
    absl::StrAppend(&out, "^", type.name());
    return Result<void, Error>();
  }
  switch (clazz.kind()) {
  case ClassKind::Enum:
    absl::StrAppend(&out, "enum:", clazz.name(), "[",
                    absl::StrJoin(clazz.enum_constants(), ","), "]");
    break;
  case ClassKind::Collection:
  case ClassKind::Map: {
    out.append(clazz.name());
    out.append("<");
    for (size_t i = 0; i < type.arguments().size(); ++i) {
      if (i > 0) {
        out.append(",");
      }
      PROTEUS_RETURN_NOT_OK(append_shape(type.arguments()[i], out, visiting));
    }
    out.append(">");
    break;
  }
  default: {
    out.append(clazz.name());
    if (!type.arguments().empty()) {
      out.append("<");
      for (size_t i = 0; i < type.arguments().size(); ++i) {
        if (i > 0) {
          out.append(",");
        }
        PROTEUS_RETURN_NOT_OK(
            append_shape(type.arguments()[i], out, visiting));
      }
      out.append(">");
    }
    PROTEUS_TRY(properties, TypeParser::resolve_properties(type, *loader_));
    out.append("{");
    for (const auto &property : properties) {
      absl::StrAppend(&out, property.name, ":");
      PROTEUS_RETURN_NOT_OK(append_shape(property.type, out, visiting));
      if (!property.mandatory) {
        out.append("?");
      }
      out.append(";");
    }
    out.append("}");
    if (!clazz.interfaces().empty()) {
      absl::StrAppend(&out, ":", absl::StrJoin(clazz.interfaces(), ","));
    }
    break;
  }
  }
  visiting.erase(type.name());
  return Result<void, Error>();
}

} // namespace serialization
} // namespace proteus
