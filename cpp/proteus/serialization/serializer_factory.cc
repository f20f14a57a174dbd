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

#include "proteus/serialization/serializer_factory.h"

#include <type_traits>
#include <utility>
#include <variant>

#include "absl/strings/str_cat.h"
#include "proteus/serialization/array_serializer.h"
#include "proteus/serialization/collection_serializer.h"
#include "proteus/serialization/enum_serializer.h"
#include "proteus/serialization/map_serializer.h"
#include "proteus/serialization/object_serializer.h"
#include "proteus/serialization/primitive_serializer.h"
#include "proteus/serialization/singleton_serializer.h"
#include "proteus/type/type_parser.h"
#include "proteus/util/logging.h"

namespace proteus {
namespace serialization {

namespace {

bool has_kind(const ClassPtr &clazz, ClassKind kind) {
  return clazz != nullptr && clazz->kind() == kind;
}

bool is_enum_set(const ClassPtr &clazz) {
  return clazz != nullptr && clazz->name() == builtin::kEnumSet;
}

bool same_additional(const CustomSerializer &a, const CustomSerializer &b) {
  auto left = a.additional_serializers();
  auto right = b.additional_serializers();
  if (left.size() != right.size()) {
    return false;
  }
  for (size_t i = 0; i < left.size(); ++i) {
    if (left[i]->type_descriptor() != right[i]->type_descriptor()) {
      return false;
    }
  }
  return true;
}

} // namespace

SerializerFactory::SerializerFactory(
    Config config, std::shared_ptr<const ClassLoader> application_loader,
    ClassWhitelistPtr whitelist, EvolutionSerializerGetterPtr evolution_getter,
    FingerprinterConstructor fingerprinter_constructor)
    : config_(config), whitelist_(std::move(whitelist)),
      evolution_getter_(std::move(evolution_getter)),
      carpenter_(std::make_shared<carpenter::ClassCarpenter>(
          std::move(application_loader), config.lenient_carpenter)),
      fingerprinter_(fingerprinter_constructor(
          carpenter_->class_loader(),
          [this](const Class &clazz) { return has_custom_serializer(clazz); })),
      resolver_(std::make_unique<CachingRemoteTypeResolver>(
          carpenter_->class_loader(),
          config.carpenter_enabled
              ? std::shared_ptr<model::RemoteTypeCarpenter>(carpenter_)
              : nullptr,
          fingerprinter_)) {}

template <typename Builder>
Result<SerializerPtr, Error>
SerializerFactory::get_or_create(const Type &type, Builder &&build) {
  PROTEUS_TRY(serializer, serializers_by_type_.get_or_create(
                              type, std::forward<Builder>(build)));
  serializers_by_descriptor_.put_if_absent(serializer->type_descriptor(),
                                           serializer);
  return serializer;
}

Result<SerializerPtr, Error> SerializerFactory::get(const ClassPtr &actual,
                                                    const Type &declared) {
  PROTEUS_LOG(TRACE) << "action=\"find serializer\" class="
                     << (actual ? actual->name() : "?")
                     << " declared=" << declared.name();
  const ClassPtr &declared_class = declared.raw_class();
  const ClassLoader &loader = *class_loader();

  if (!is_enum_set(actual) && !is_enum_set(declared_class) &&
      (has_kind(actual, ClassKind::Collection) ||
       has_kind(declared_class, ClassKind::Collection))) {
    PROTEUS_TRY(collection_type, CollectionSerializer::derive_parameterized_type(
                                     declared, actual, loader));
    return get_or_create(collection_type, [&]() {
      return CollectionSerializer::make(collection_type, *this);
    });
  }
  if (has_kind(actual, ClassKind::Map) ||
      has_kind(declared_class, ClassKind::Map)) {
    PROTEUS_TRY(map_type, MapSerializer::derive_parameterized_type(
                              declared, actual, loader));
    return get_or_create(map_type,
                         [&]() { return MapSerializer::make(map_type, *this); });
  }

  const ClassPtr &effective = actual != nullptr ? actual : declared_class;
  if (effective != nullptr && effective->is_enum()) {
    Type enum_type = Type::of(effective);
    PROTEUS_RETURN_NOT_OK(require_whitelisted(*whitelist_, loader, enum_type));
    return get_or_create(enum_type,
                         [&]() { return EnumSerializer::make(enum_type, *this); });
  }

  Type actual_type = actual == nullptr || (declared_class != nullptr &&
                                           actual->name() == declared_class->name())
                         ? declared
                         : Type::of(actual);
  return get_or_create(actual_type, [&]() {
    return make_class_serializer(effective, actual_type, declared);
  });
}

Result<SerializerPtr, Error>
SerializerFactory::make_class_serializer(const ClassPtr &clazz,
                                         const Type &type,
                                         const Type &declared) {
  if (clazz != nullptr && clazz->is_synthetic()) {
    return Unexpected(Error::not_serializable(absl::StrCat(
        "Serializer does not support synthetic classes, found ",
        clazz->name())));
  }
  if (clazz != nullptr && clazz->is_primitive()) {
    return SerializerPtr(std::make_shared<PrimitiveSerializer>(type));
  }
  if (CustomSerializerPtr custom = find_custom_serializer(clazz, declared)) {
    PROTEUS_LOG(DEBUG) << "action=\"use custom serializer\" type="
                       << type.name() << " custom=" << custom->type().name();
    return SerializerPtr(std::move(custom));
  }
  if (config_.only_custom_serializers) {
    return Unexpected(Error::not_serializable(absl::StrCat(
        "Only allowed custom serializers, none registered for ",
        type.name())));
  }
  if (type.is_array()) {
    return ArraySerializer::make(type, *this);
  }
  if (clazz == nullptr) {
    return Unexpected(Error::not_serializable(
        absl::StrCat("Unable to serialize/deserialize ", type.name(),
                     ": no class is known for it")));
  }
  PROTEUS_RETURN_NOT_OK(require_whitelisted(*whitelist_, *class_loader(), type));
  if (clazz->is_singleton()) {
    PROTEUS_TRY(descriptor, descriptor_for(type));
    return SerializerPtr(
        std::make_shared<SingletonSerializer>(type, std::move(descriptor)));
  }
  PROTEUS_TRY(object, ObjectSerializer::make(type, *this));
  return SerializerPtr(std::move(object));
}

Result<SerializerPtr, Error>
SerializerFactory::get(const std::string &descriptor,
                       const SerializationSchemas &schemas) {
  if (auto cached = serializers_by_descriptor_.get(descriptor)) {
    return *cached;
  }
  PROTEUS_TRY(remote_types, resolver_->resolve(schemas.schema.types()));
  for (const auto &remote : remote_types) {
    PROTEUS_RETURN_NOT_OK(process_remote_type(remote, schemas));
  }
  if (auto found = serializers_by_descriptor_.get(descriptor)) {
    return *found;
  }
  return Unexpected(Error::descriptor_not_found(descriptor));
}

Result<void, Error>
SerializerFactory::process_remote_type(const RemoteType &remote,
                                       const SerializationSchemas &schemas) {
  const Type &type = remote.type;
  if (type.is_wildcard() ||
      (type.raw_class() != nullptr && type.raw_class()->is_top())) {
    return Result<void, Error>();
  }
  // Composites resolve through their class; restricted types (enums,
  // collections, maps, arrays) through the declared type alone.
  Result<SerializerPtr, Error> resolved = std::visit(
      [&](const auto &notation) -> Result<SerializerPtr, Error> {
        using Notation = std::decay_t<decltype(notation)>;
        if constexpr (std::is_same_v<Notation, CompositeType>) {
          return get(type.raw_class(), type);
        } else {
          static_assert(std::is_same_v<Notation, RestrictedType>,
                        "unhandled type notation");
          return get(ClassPtr(), type);
        }
      },
      remote.notation);
  PROTEUS_TRY(local, std::move(resolved));
  const std::string &remote_descriptor = remote.remote_descriptor();
  if (local->type_descriptor() == remote_descriptor) {
    return Result<void, Error>();
  }
  PROTEUS_LOG(DEBUG) << "action=\"compare descriptors\" type=" << type.name()
                     << " remote_descriptor=" << remote_descriptor
                     << " local_descriptor=" << remote.local_descriptor;
  PROTEUS_TRY(evolved,
              serializers_by_descriptor_.get_or_create(remote_descriptor, [&]() {
                return evolution_getter_->get_evolution_serializer(
                    *this, remote.notation, local, schemas);
              }));
  if (evolved != local) {
    PROTEUS_LOG(INFO) << "action=\"evolve serializer\" type=" << type.name()
                      << " descriptor=" << remote_descriptor;
  }
  return Result<void, Error>();
}

void SerializerFactory::register_serializer(
    const CustomSerializerPtr &serializer) {
  PROTEUS_LOG(TRACE) << "action=\"register custom serializer\" type="
                     << serializer->type().name()
                     << " descriptor=" << serializer->type_descriptor();
  {
    absl::MutexLock lock(&custom_mu_);
    auto existing = custom_by_descriptor_.find(serializer->type_descriptor());
    if (existing != custom_by_descriptor_.end()) {
      if (!same_additional(*existing->second, *serializer)) {
        PROTEUS_LOG(WARNING)
            << "action=\"ignore additional serializers\" type="
            << serializer->type().name()
            << " descriptor=" << serializer->type_descriptor()
            << " reason=\"already registered\"";
      }
      return;
    }
    custom_serializers_.push_back(serializer);
    custom_by_descriptor_.emplace(serializer->type_descriptor(), serializer);
  }
  for (const auto &additional : serializer->additional_serializers()) {
    register_serializer(additional);
  }
}

Result<void, Error> SerializerFactory::register_external(
    std::shared_ptr<const SerializationCustomSerializer> plugin) {
  PROTEUS_TRY(serializer,
              ExternalSerializer::make(std::move(plugin), *class_loader()));
  PROTEUS_LOG(TRACE) << "action=\"register external serializer\" type="
                     << serializer->type().name()
                     << " descriptor=" << serializer->type_descriptor();
  absl::MutexLock lock(&custom_mu_);
  if (custom_by_descriptor_.contains(serializer->type_descriptor())) {
    return Result<void, Error>();
  }
  custom_by_descriptor_.emplace(serializer->type_descriptor(), serializer);
  custom_serializers_.push_back(std::move(serializer));
  return Result<void, Error>();
}

CustomSerializerPtr
SerializerFactory::find_custom_serializer(const ClassPtr &clazz,
                                          const Type &declared) {
  if (clazz == nullptr) {
    return nullptr;
  }
  auto found = custom_serializer_cache_.get_or_create(
      std::make_pair(clazz->name(), declared.name()),
      [&]() -> Result<CustomSerializerPtr, Error> {
        const ClassLoader &loader = *class_loader();
        CustomSerializerPtr match;
        {
          absl::MutexLock lock(&custom_mu_);
          for (const auto &candidate : custom_serializers_) {
            if (candidate->is_serializer_for(*clazz, loader)) {
              match = candidate;
              break;
            }
          }
        }
        const ClassPtr &declared_class = declared.raw_class();
        if (match == nullptr || !match->reveal_subclasses_in_schema() ||
            declared_class == nullptr ||
            declared_class->superclass().empty()) {
          return match;
        }
        auto super = loader.load_class(declared_class->superclass());
        if (!super.ok() || !match->is_serializer_for(*super.value(), loader)) {
          return match;
        }
        return CustomSerializerPtr(
            std::make_shared<SubClassSerializer>(clazz, match));
      });
  PROTEUS_CHECK(found.ok()) << found.error();
  return found.value();
}

bool SerializerFactory::has_custom_serializer(const Class &clazz) const {
  const ClassLoader &loader = *class_loader();
  absl::MutexLock lock(&custom_mu_);
  for (const auto &serializer : custom_serializers_) {
    if (serializer->is_serializer_for(clazz, loader)) {
      return true;
    }
  }
  return false;
}

size_t SerializerFactory::custom_serializer_count() const {
  absl::MutexLock lock(&custom_mu_);
  return custom_serializers_.size();
}

Result<std::string, Error> SerializerFactory::descriptor_for(const Type &type) {
  PROTEUS_TRY(fingerprint, fingerprinter_->fingerprint(type));
  return serialization::descriptor_for(fingerprint);
}

Result<Type, Error>
SerializerFactory::type_for_name(const std::string &name) const {
  return TypeParser::parse(name, *class_loader());
}

} // namespace serialization
} // namespace proteus
