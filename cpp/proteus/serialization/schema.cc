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

#include "proteus/serialization/schema.h"

#include <utility>

#include "absl/strings/str_cat.h"

namespace proteus {
namespace serialization {

namespace {

Result<void, Error> expect_described(Decoder &decoder, const char *expected) {
  PROTEUS_TRY(descriptor, decoder.read_descriptor());
  if (descriptor != expected) {
    return Unexpected(Error::invalid_data(absl::StrCat(
        "Expected ", expected, " but found descriptor ", descriptor)));
  }
  return Result<void, Error>();
}

// Reads the list header of a described composite and checks it has at least
// `fields` elements. Returns the number of trailing elements to skip.
Result<uint32_t, Error> read_composite_header(Decoder &decoder,
                                              const char *descriptor,
                                              uint32_t fields) {
  PROTEUS_RETURN_NOT_OK(expect_described(decoder, descriptor));
  PROTEUS_TRY(count, decoder.read_list_header());
  if (count < fields) {
    return Unexpected(Error::invalid_data(absl::StrCat(
        descriptor, " has ", count, " elements, expected ", fields)));
  }
  return count - fields;
}

Result<void, Error> skip_values(Decoder &decoder, uint32_t count) {
  for (uint32_t i = 0; i < count; ++i) {
    PROTEUS_RETURN_NOT_OK(decoder.skip_value());
  }
  return Result<void, Error>();
}

void write_strings(Encoder &encoder, const std::vector<std::string> &values) {
  uint32_t start = encoder.begin_list();
  for (const auto &value : values) {
    encoder.write_string(value);
  }
  encoder.end_list(start, static_cast<uint32_t>(values.size()));
}

Result<std::vector<std::string>, Error> read_strings(Decoder &decoder) {
  PROTEUS_TRY(count, decoder.read_list_header());
  std::vector<std::string> values;
  for (uint32_t i = 0; i < count; ++i) {
    PROTEUS_TRY(value, decoder.read_string());
    values.push_back(std::move(value));
  }
  return values;
}

void write_descriptor(Encoder &encoder, const Descriptor &descriptor) {
  encoder.write_described(kTypeDescriptorDescriptor);
  uint32_t start = encoder.begin_list();
  encoder.write_symbol(descriptor.name);
  encoder.end_list(start, 1);
}

Result<Descriptor, Error> read_descriptor(Decoder &decoder) {
  PROTEUS_TRY(extra,
              read_composite_header(decoder, kTypeDescriptorDescriptor, 1));
  Descriptor descriptor;
  PROTEUS_ASSIGN_OR_RETURN(descriptor.name, decoder.read_symbol());
  PROTEUS_RETURN_NOT_OK(skip_values(decoder, extra));
  return descriptor;
}

void write_field(Encoder &encoder, const Field &field) {
  encoder.write_described(kFieldDescriptor);
  uint32_t start = encoder.begin_list();
  encoder.write_string(field.name);
  encoder.write_string(field.type);
  write_strings(encoder, field.requirements);
  encoder.write_optional_string(field.default_value);
  encoder.write_optional_string(field.label);
  encoder.write_boolean(field.mandatory);
  encoder.write_boolean(field.multiple);
  encoder.end_list(start, 7);
}

Result<Field, Error> read_field(Decoder &decoder) {
  PROTEUS_TRY(extra, read_composite_header(decoder, kFieldDescriptor, 7));
  Field field;
  PROTEUS_ASSIGN_OR_RETURN(field.name, decoder.read_string());
  PROTEUS_ASSIGN_OR_RETURN(field.type, decoder.read_string());
  PROTEUS_ASSIGN_OR_RETURN(field.requirements, read_strings(decoder));
  PROTEUS_ASSIGN_OR_RETURN(field.default_value, decoder.read_optional_string());
  PROTEUS_ASSIGN_OR_RETURN(field.label, decoder.read_optional_string());
  PROTEUS_ASSIGN_OR_RETURN(field.mandatory, decoder.read_boolean());
  PROTEUS_ASSIGN_OR_RETURN(field.multiple, decoder.read_boolean());
  PROTEUS_RETURN_NOT_OK(skip_values(decoder, extra));
  return field;
}

void write_composite(Encoder &encoder, const CompositeType &type) {
  encoder.write_described(kCompositeTypeDescriptor);
  uint32_t start = encoder.begin_list();
  encoder.write_string(type.name);
  encoder.write_optional_string(type.label);
  write_strings(encoder, type.provides);
  write_descriptor(encoder, type.descriptor);
  uint32_t fields = encoder.begin_list();
  for (const auto &field : type.fields) {
    write_field(encoder, field);
  }
  encoder.end_list(fields, static_cast<uint32_t>(type.fields.size()));
  encoder.end_list(start, 5);
}

Result<CompositeType, Error> read_composite_body(Decoder &decoder,
                                                 uint32_t extra) {
  CompositeType type;
  PROTEUS_ASSIGN_OR_RETURN(type.name, decoder.read_string());
  PROTEUS_ASSIGN_OR_RETURN(type.label, decoder.read_optional_string());
  PROTEUS_ASSIGN_OR_RETURN(type.provides, read_strings(decoder));
  PROTEUS_ASSIGN_OR_RETURN(type.descriptor, read_descriptor(decoder));
  PROTEUS_TRY(count, decoder.read_list_header());
  for (uint32_t i = 0; i < count; ++i) {
    PROTEUS_TRY(field, read_field(decoder));
    type.fields.push_back(std::move(field));
  }
  PROTEUS_RETURN_NOT_OK(skip_values(decoder, extra));
  return type;
}

void write_restricted(Encoder &encoder, const RestrictedType &type) {
  encoder.write_described(kRestrictedTypeDescriptor);
  uint32_t start = encoder.begin_list();
  encoder.write_string(type.name);
  encoder.write_optional_string(type.label);
  write_strings(encoder, type.provides);
  encoder.write_string(type.source);
  write_descriptor(encoder, type.descriptor);
  uint32_t choices = encoder.begin_list();
  for (const auto &choice : type.choices) {
    encoder.write_described(kChoiceDescriptor);
    uint32_t entry = encoder.begin_list();
    encoder.write_string(choice.name);
    encoder.write_string(choice.value);
    encoder.end_list(entry, 2);
  }
  encoder.end_list(choices, static_cast<uint32_t>(type.choices.size()));
  encoder.end_list(start, 6);
}

Result<RestrictedType, Error> read_restricted_body(Decoder &decoder,
                                                   uint32_t extra) {
  RestrictedType type;
  PROTEUS_ASSIGN_OR_RETURN(type.name, decoder.read_string());
  PROTEUS_ASSIGN_OR_RETURN(type.label, decoder.read_optional_string());
  PROTEUS_ASSIGN_OR_RETURN(type.provides, read_strings(decoder));
  PROTEUS_ASSIGN_OR_RETURN(type.source, decoder.read_string());
  PROTEUS_ASSIGN_OR_RETURN(type.descriptor, read_descriptor(decoder));
  PROTEUS_TRY(count, decoder.read_list_header());
  for (uint32_t i = 0; i < count; ++i) {
    PROTEUS_TRY(choice_extra,
                read_composite_header(decoder, kChoiceDescriptor, 2));
    Choice choice;
    PROTEUS_ASSIGN_OR_RETURN(choice.name, decoder.read_string());
    PROTEUS_ASSIGN_OR_RETURN(choice.value, decoder.read_string());
    PROTEUS_RETURN_NOT_OK(skip_values(decoder, choice_extra));
    type.choices.push_back(std::move(choice));
  }
  PROTEUS_RETURN_NOT_OK(skip_values(decoder, extra));
  return type;
}

Result<TypeNotation, Error> read_notation(Decoder &decoder) {
  PROTEUS_TRY(descriptor, decoder.read_descriptor());
  PROTEUS_TRY(count, decoder.read_list_header());
  if (descriptor == kCompositeTypeDescriptor) {
    if (count < 5) {
      return Unexpected(Error::invalid_data(
          absl::StrCat("Composite type has ", count, " elements")));
    }
    PROTEUS_TRY(composite, read_composite_body(decoder, count - 5));
    return TypeNotation(std::move(composite));
  }
  if (descriptor == kRestrictedTypeDescriptor) {
    if (count < 6) {
      return Unexpected(Error::invalid_data(
          absl::StrCat("Restricted type has ", count, " elements")));
    }
    PROTEUS_TRY(restricted, read_restricted_body(decoder, count - 6));
    return TypeNotation(std::move(restricted));
  }
  return Unexpected(Error::invalid_data(
      absl::StrCat("Unknown type notation ", descriptor)));
}

const char *transform_kind_name(Transform::Kind kind) {
  return kind == Transform::Kind::Rename ? "rename" : "default";
}

} // namespace

bool Field::operator==(const Field &other) const {
  return name == other.name && type == other.type &&
         requirements == other.requirements &&
         default_value == other.default_value && label == other.label &&
         mandatory == other.mandatory && multiple == other.multiple;
}

bool CompositeType::operator==(const CompositeType &other) const {
  return name == other.name && label == other.label &&
         provides == other.provides && descriptor == other.descriptor &&
         fields == other.fields;
}

bool RestrictedType::operator==(const RestrictedType &other) const {
  return name == other.name && label == other.label &&
         provides == other.provides && source == other.source &&
         descriptor == other.descriptor && choices == other.choices;
}

const std::string &notation_name(const TypeNotation &notation) {
  return std::visit(
      [](const auto &type) -> const std::string & { return type.name; },
      notation);
}

const std::string &notation_descriptor(const TypeNotation &notation) {
  return std::visit(
      [](const auto &type) -> const std::string & {
        return type.descriptor.name;
      },
      notation);
}

bool Schema::add(TypeNotation notation) {
  const std::string &name = notation_name(notation);
  for (const auto &existing : types_) {
    if (notation_name(existing) == name) {
      return false;
    }
  }
  types_.push_back(std::move(notation));
  return true;
}

const TypeNotation *
Schema::find_by_descriptor(const std::string &descriptor) const {
  for (const auto &notation : types_) {
    if (notation_descriptor(notation) == descriptor) {
      return &notation;
    }
  }
  return nullptr;
}

void Schema::write(Encoder &encoder) const {
  encoder.write_described(kSchemaDescriptor);
  uint32_t start = encoder.begin_list();
  uint32_t types = encoder.begin_list();
  for (const auto &notation : types_) {
    if (const auto *composite = std::get_if<CompositeType>(&notation)) {
      write_composite(encoder, *composite);
    } else {
      write_restricted(encoder, std::get<RestrictedType>(notation));
    }
  }
  encoder.end_list(types, static_cast<uint32_t>(types_.size()));
  encoder.end_list(start, 1);
}

Result<Schema, Error> Schema::read(Decoder &decoder) {
  PROTEUS_TRY(extra, read_composite_header(decoder, kSchemaDescriptor, 1));
  PROTEUS_TRY(count, decoder.read_list_header());
  Schema schema;
  for (uint32_t i = 0; i < count; ++i) {
    PROTEUS_TRY(notation, read_notation(decoder));
    schema.types_.push_back(std::move(notation));
  }
  PROTEUS_RETURN_NOT_OK(skip_values(decoder, extra));
  return schema;
}

const std::vector<Transform> *
TransformsSchema::find(const std::string &type_name) const {
  auto it = types_.find(type_name);
  return it == types_.end() ? nullptr : &it->second;
}

void TransformsSchema::write(Encoder &encoder) const {
  encoder.write_described(kTransformsDescriptor);
  uint32_t start = encoder.begin_map();
  for (const auto &entry : types_) {
    encoder.write_string(entry.first);
    uint32_t list = encoder.begin_list();
    for (const auto &transform : entry.second) {
      encoder.write_described(kTransformDescriptor);
      uint32_t item = encoder.begin_list();
      encoder.write_string(transform_kind_name(transform.kind));
      encoder.write_string(transform.from);
      encoder.write_string(transform.to);
      encoder.end_list(item, 3);
    }
    encoder.end_list(list, static_cast<uint32_t>(entry.second.size()));
  }
  encoder.end_map(start, static_cast<uint32_t>(types_.size()));
}

Result<TransformsSchema, Error> TransformsSchema::read(Decoder &decoder) {
  PROTEUS_RETURN_NOT_OK(expect_described(decoder, kTransformsDescriptor));
  PROTEUS_TRY(entries, decoder.read_map_header());
  TransformsSchema schema;
  for (uint32_t i = 0; i < entries; ++i) {
    PROTEUS_TRY(type_name, decoder.read_string());
    PROTEUS_TRY(count, decoder.read_list_header());
    std::vector<Transform> transforms;
    for (uint32_t j = 0; j < count; ++j) {
      PROTEUS_TRY(extra,
                  read_composite_header(decoder, kTransformDescriptor, 3));
      PROTEUS_TRY(kind, decoder.read_string());
      Transform transform;
      if (kind == "rename") {
        transform.kind = Transform::Kind::Rename;
      } else if (kind == "default") {
        transform.kind = Transform::Kind::Default;
      } else {
        return Unexpected(Error::invalid_data(
            absl::StrCat("Unknown enum transform ", kind)));
      }
      PROTEUS_ASSIGN_OR_RETURN(transform.from, decoder.read_string());
      PROTEUS_ASSIGN_OR_RETURN(transform.to, decoder.read_string());
      PROTEUS_RETURN_NOT_OK(skip_values(decoder, extra));
      transforms.push_back(std::move(transform));
    }
    schema.types_.emplace(std::move(type_name), std::move(transforms));
  }
  return schema;
}

} // namespace serialization
} // namespace proteus
