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

#include "proteus/serialization/evolution_serializer.h"

#include <utility>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_cat.h"
#include "proteus/serialization/deserialization_input.h"
#include "proteus/serialization/serialization_output.h"
#include "proteus/type/primitive.h"

namespace proteus {
namespace serialization {

namespace {

Error read_only(const Type &type) {
  return Error::unsupported(absl::StrCat(
      "Evolution serializer for ", type.name(), " cannot write objects"));
}

bool same_fields(const CompositeType &remote, const CompositeType &local) {
  if (remote.fields.size() != local.fields.size()) {
    return false;
  }
  for (size_t i = 0; i < remote.fields.size(); ++i) {
    const Field &a = remote.fields[i];
    const Field &b = local.fields[i];
    if (a.name != b.name || a.type != b.type || a.mandatory != b.mandatory) {
      return false;
    }
  }
  return true;
}

bool same_constants(const RestrictedType &remote, const Class &local) {
  const auto &constants = local.enum_constants();
  if (remote.choices.size() != constants.size()) {
    return false;
  }
  for (size_t i = 0; i < constants.size(); ++i) {
    if (remote.choices[i].name != constants[i]) {
      return false;
    }
  }
  return true;
}

} // namespace

// ============================================================================
// DefaultEvolutionPolicy
// ============================================================================

std::optional<Value> DefaultEvolutionPolicy::zero_value(const Type &type) {
  const ClassPtr &clazz = type.raw_class();
  if (clazz == nullptr || !clazz->is_primitive()) {
    return std::nullopt;
  }
  const PrimitiveInfo *info = find_primitive(clazz->name());
  switch (info->kind) {
  case ValueKind::Boolean:
    return Value::of_boolean(false);
  case ValueKind::Byte:
    return Value::of_byte(0);
  case ValueKind::UByte:
    return Value::of_ubyte(0);
  case ValueKind::Short:
    return Value::of_short(0);
  case ValueKind::UShort:
    return Value::of_ushort(0);
  case ValueKind::Int:
    return Value::of_int(0);
  case ValueKind::UInt:
    return Value::of_uint(0);
  case ValueKind::Long:
    return Value::of_long(0);
  case ValueKind::ULong:
    return Value::of_ulong(0);
  case ValueKind::Float:
    return Value::of_float(0);
  case ValueKind::Double:
    return Value::of_double(0);
  case ValueKind::Char:
    return Value::of_char(0);
  case ValueKind::String:
    return Value::of_string("");
  default:
    return std::nullopt;
  }
}

Result<EvolutionPlan, Error>
DefaultEvolutionPolicy::plan(const CompositeType &remote,
                             const ObjectSerializer &local) const {
  const auto &properties = local.properties();
  EvolutionPlan plan;
  plan.remote_to_local.assign(remote.fields.size(), std::nullopt);
  plan.defaults.resize(properties.size());
  for (size_t i = 0; i < properties.size(); ++i) {
    const ResolvedProperty &property = properties[i];
    bool matched = false;
    for (size_t j = 0; j < remote.fields.size(); ++j) {
      const Field &field = remote.fields[j];
      if (field.name != property.name) {
        continue;
      }
      if (field.type != property.type.name()) {
        return Unexpected(Error::not_serializable(absl::StrCat(
            "Property ", property.name, " of ", local.type().name(),
            " changed type from ", field.type, " to ",
            property.type.name())));
      }
      plan.remote_to_local[j] = i;
      matched = true;
      break;
    }
    if (matched) {
      continue;
    }
    if (property.default_value.has_value()) {
      plan.defaults[i] = *property.default_value;
    } else if (!property.mandatory) {
      plan.defaults[i] = Value::null();
    } else if (auto zero = zero_value(property.type)) {
      plan.defaults[i] = *zero;
    } else {
      return Unexpected(Error::not_serializable(absl::StrCat(
          "Property ", property.name, " of ", local.type().name(),
          " is missing from ", remote.name, " and has no default")));
    }
  }
  return plan;
}

// ============================================================================
// EvolutionSerializer
// ============================================================================

EvolutionSerializer::EvolutionSerializer(
    std::shared_ptr<ObjectSerializer> local, std::string remote_descriptor,
    EvolutionPlan plan)
    : local_(std::move(local)), remote_descriptor_(std::move(remote_descriptor)),
      plan_(std::move(plan)) {}

Result<void, Error> EvolutionSerializer::write_class_info(SerializationOutput &) {
  return Unexpected(read_only(type()));
}

Result<void, Error> EvolutionSerializer::write_object(const Value &,
                                                      const Type &,
                                                      SerializationOutput &) {
  return Unexpected(read_only(type()));
}

Result<Value, Error> EvolutionSerializer::read_object(DeserializationInput &input) {
  PROTEUS_TRY(count, input.decoder().read_list_header());
  if (count != plan_.remote_to_local.size()) {
    return Unexpected(Error::invalid_data(
        absl::StrCat("Remote shape of ", type().name(), " has ",
                     plan_.remote_to_local.size(), " fields but ", count,
                     " were written")));
  }
  const auto &properties = local_->properties();
  Value::Fields fields;
  fields.reserve(properties.size());
  for (size_t i = 0; i < properties.size(); ++i) {
    fields.emplace_back(properties[i].name, plan_.defaults[i]);
  }
  for (uint32_t j = 0; j < count; ++j) {
    const auto &target = plan_.remote_to_local[j];
    Type expected =
        target.has_value() ? properties[*target].type : Type::wildcard();
    PROTEUS_TRY(value, input.read_object_or_null(expected));
    if (target.has_value()) {
      fields[*target].second = std::move(value);
    }
  }
  return Value::object(type().raw_class()->name(), std::move(fields));
}

// ============================================================================
// EnumEvolutionSerializer
// ============================================================================

Result<std::shared_ptr<EnumEvolutionSerializer>, Error>
EnumEvolutionSerializer::make(const RestrictedType &remote,
                              std::shared_ptr<EnumSerializer> local,
                              const TransformsSchema &transforms) {
  const Class &clazz = local->enum_class();
  std::vector<std::pair<std::string, std::string>> renames =
      clazz.enum_renames();
  absl::flat_hash_map<std::string, std::string> defaults;
  for (const auto &fallback : clazz.enum_defaults()) {
    defaults.emplace(fallback.first, fallback.second);
  }
  if (const auto *remote_transforms = transforms.find(remote.name)) {
    for (const auto &transform : *remote_transforms) {
      if (transform.kind == Transform::Kind::Rename) {
        renames.emplace_back(transform.from, transform.to);
      } else {
        defaults.emplace(transform.from, transform.to);
      }
    }
  }

  absl::flat_hash_map<std::string, std::string> conversions;
  for (const auto &choice : remote.choices) {
    std::string current = choice.name;
    absl::flat_hash_set<std::string> visited = {current};
    bool resolved = false;
    while (true) {
      if (clazz.ordinal_of(current).has_value()) {
        resolved = true;
        break;
      }
      std::string next;
      for (const auto &rename : renames) {
        if (rename.first == current && !visited.contains(rename.second)) {
          next = rename.second;
          break;
        }
        if (rename.second == current && !visited.contains(rename.first)) {
          next = rename.first;
          break;
        }
      }
      if (next.empty()) {
        auto fallback = defaults.find(current);
        if (fallback != defaults.end() && !visited.contains(fallback->second)) {
          next = fallback->second;
        }
      }
      if (next.empty()) {
        break;
      }
      visited.insert(next);
      current = std::move(next);
    }
    if (!resolved) {
      return Unexpected(Error::not_serializable(
          absl::StrCat("Enum constant ", choice.name, " of ", remote.name,
                       " has no local counterpart")));
    }
    conversions.emplace(choice.name, std::move(current));
  }
  return std::make_shared<EnumEvolutionSerializer>(
      std::move(local), remote.descriptor.name, std::move(conversions));
}

EnumEvolutionSerializer::EnumEvolutionSerializer(
    std::shared_ptr<EnumSerializer> local, std::string remote_descriptor,
    absl::flat_hash_map<std::string, std::string> conversions)
    : local_(std::move(local)), remote_descriptor_(std::move(remote_descriptor)),
      conversions_(std::move(conversions)) {}

Result<void, Error>
EnumEvolutionSerializer::write_class_info(SerializationOutput &) {
  return Unexpected(read_only(type()));
}

Result<void, Error> EnumEvolutionSerializer::write_object(const Value &,
                                                          const Type &,
                                                          SerializationOutput &) {
  return Unexpected(read_only(type()));
}

Result<Value, Error>
EnumEvolutionSerializer::read_object(DeserializationInput &input) {
  PROTEUS_TRY(constant, EnumSerializer::read_constant(input));
  auto it = conversions_.find(constant.first);
  if (it == conversions_.end()) {
    return Unexpected(Error::unknown_enum(absl::StrCat(
        constant.first, " is not a constant of the remote ", type().name())));
  }
  const Class &clazz = local_->enum_class();
  return Value::enum_constant(clazz.name(), it->second,
                              clazz.ordinal_of(it->second).value_or(0));
}

// ============================================================================
// DefaultEvolutionSerializerGetter
// ============================================================================

Result<SerializerPtr, Error>
DefaultEvolutionSerializerGetter::get_evolution_serializer(
    SerializerFactory &, const TypeNotation &remote, const SerializerPtr &local,
    const SerializationSchemas &schemas) {
  if (const auto *composite = std::get_if<CompositeType>(&remote)) {
    auto object = std::dynamic_pointer_cast<ObjectSerializer>(local);
    if (object == nullptr || same_fields(*composite, object->notation())) {
      return local;
    }
    PROTEUS_TRY(plan, policy_->plan(*composite, *object));
    return SerializerPtr(std::make_shared<EvolutionSerializer>(
        std::move(object), composite->descriptor.name, std::move(plan)));
  }
  const auto &restricted = std::get<RestrictedType>(remote);
  if (restricted.choices.empty()) {
    return local;
  }
  auto enum_serializer = std::dynamic_pointer_cast<EnumSerializer>(local);
  if (enum_serializer == nullptr ||
      same_constants(restricted, enum_serializer->enum_class())) {
    return local;
  }
  PROTEUS_TRY(evolved, EnumEvolutionSerializer::make(
                           restricted, std::move(enum_serializer),
                           schemas.transforms));
  return SerializerPtr(std::move(evolved));
}

} // namespace serialization
} // namespace proteus
