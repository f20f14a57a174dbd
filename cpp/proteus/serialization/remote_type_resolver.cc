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

#include "proteus/serialization/remote_type_resolver.h"

#include <optional>
#include <utility>
#include <variant>

#include "absl/strings/str_cat.h"
#include "proteus/model/carpentry_dependency_graph.h"
#include "proteus/type/primitive.h"
#include "proteus/type/type_parser.h"
#include "proteus/util/logging.h"

namespace proteus {
namespace serialization {

using model::RemotePropertyInformation;
using model::RemoteTypeInformation;
using model::RemoteTypeInformationPtr;

namespace {

constexpr const char *kInterfaceLabel = "interface";

} // namespace

// ============================================================================
// RemoteTypeInformationBuilder
// ============================================================================

RemoteTypeInformationBuilder::RemoteTypeInformationBuilder(
    const std::vector<TypeNotation> &notations) {
  for (const auto &notation : notations) {
    by_name_.emplace(notation_name(notation), &notation);
  }
}

Result<RemoteTypeInformationPtr, Error>
RemoteTypeInformationBuilder::build(const std::string &name) {
  PROTEUS_TRY(id, TypeIdentifier::parse(name));
  return build(id);
}

Result<RemoteTypeInformationPtr, Error>
RemoteTypeInformationBuilder::build(const TypeIdentifier &id) {
  if (id.kind() == TypeIdentifier::Kind::Top) {
    return RemoteTypeInformation::top();
  }
  auto built = built_.find(id.name());
  if (built != built_.end()) {
    return built->second;
  }
  if (in_progress_.contains(id.name())) {
    return RemoteTypeInformation::unknown(id);
  }
  auto notation = by_name_.find(id.name());
  if (notation != by_name_.end()) {
    return build_notation(*notation->second, id);
  }
  switch (id.kind()) {
  case TypeIdentifier::Kind::PrimitiveArray:
    return RemoteTypeInformation::an_array(
        "", id,
        RemoteTypeInformation::primitive(
            TypeIdentifier::unparameterised(id.erased_name())));
  case TypeIdentifier::Kind::Array: {
    PROTEUS_TRY(component, build(id.component()));
    return RemoteTypeInformation::an_array("", id, std::move(component));
  }
  case TypeIdentifier::Kind::Parameterised: {
    PROTEUS_TRY(parameters, build_all(id.parameters()));
    return RemoteTypeInformation::parameterised("", id, std::move(parameters));
  }
  default:
    break;
  }
  if (is_primitive_name(id.name())) {
    return RemoteTypeInformation::primitive(id);
  }
  return RemoteTypeInformation::unknown(id);
}

Result<RemoteTypeInformationPtr, Error>
RemoteTypeInformationBuilder::build_notation(const TypeNotation &notation,
                                             const TypeIdentifier &id) {
  in_progress_.insert(id.name());
  auto info = [&]() -> Result<RemoteTypeInformationPtr, Error> {
    if (const auto *composite = std::get_if<CompositeType>(&notation)) {
      std::vector<RemotePropertyInformation> properties;
      properties.reserve(composite->fields.size());
      for (const auto &field : composite->fields) {
        PROTEUS_TRY(type, build(field.type));
        properties.push_back({field.name, std::move(type), field.mandatory});
      }
      std::vector<RemoteTypeInformationPtr> interfaces;
      for (const auto &provided : composite->provides) {
        PROTEUS_TRY(iface, build(provided));
        interfaces.push_back(std::move(iface));
      }
      PROTEUS_TRY(parameters, build_all(id.parameters()));
      if (composite->label.has_value() && *composite->label == kInterfaceLabel) {
        return RemoteTypeInformation::an_interface(
            composite->descriptor.name, id, std::move(properties),
            std::move(interfaces), std::move(parameters));
      }
      return RemoteTypeInformation::composable(
          composite->descriptor.name, id, std::move(properties),
          std::move(interfaces), std::move(parameters));
    }
    const auto &restricted = std::get<RestrictedType>(notation);
    if (!restricted.choices.empty()) {
      std::vector<std::string> members;
      members.reserve(restricted.choices.size());
      for (const auto &choice : restricted.choices) {
        members.push_back(choice.name);
      }
      return RemoteTypeInformation::an_enum(restricted.descriptor.name, id,
                                            std::move(members));
    }
    switch (id.kind()) {
    case TypeIdentifier::Kind::PrimitiveArray:
      return RemoteTypeInformation::an_array(
          restricted.descriptor.name, id,
          RemoteTypeInformation::primitive(
              TypeIdentifier::unparameterised(id.erased_name())));
    case TypeIdentifier::Kind::Array: {
      PROTEUS_TRY(component, build(id.component()));
      return RemoteTypeInformation::an_array(restricted.descriptor.name, id,
                                             std::move(component));
    }
    case TypeIdentifier::Kind::Parameterised: {
      PROTEUS_TRY(parameters, build_all(id.parameters()));
      return RemoteTypeInformation::parameterised(restricted.descriptor.name,
                                                  id, std::move(parameters));
    }
    default:
      return RemoteTypeInformation::unknown(id);
    }
  }();
  in_progress_.erase(id.name());
  if (info.ok()) {
    built_.emplace(id.name(), info.value());
  }
  return info;
}

Result<std::vector<RemoteTypeInformationPtr>, Error>
RemoteTypeInformationBuilder::build_all(const std::vector<TypeIdentifier> &ids) {
  std::vector<RemoteTypeInformationPtr> infos;
  infos.reserve(ids.size());
  for (const auto &id : ids) {
    PROTEUS_TRY(info, build(id));
    infos.push_back(std::move(info));
  }
  return infos;
}

// ============================================================================
// CachingRemoteTypeResolver
// ============================================================================

CachingRemoteTypeResolver::CachingRemoteTypeResolver(
    std::shared_ptr<const ClassLoader> loader,
    std::shared_ptr<model::RemoteTypeCarpenter> carpenter,
    FingerprinterPtr fingerprinter)
    : loader_(std::move(loader)), carpenter_(std::move(carpenter)),
      fingerprinter_(std::move(fingerprinter)) {}

Result<RemoteType, Error>
CachingRemoteTypeResolver::resolve_locally(const TypeNotation &notation) {
  PROTEUS_TRY(type, TypeParser::parse(notation_name(notation), *loader_));
  PROTEUS_TRY(fingerprint, fingerprinter_->fingerprint(type));
  RemoteType remote;
  remote.type = std::move(type);
  remote.notation = notation;
  remote.local_descriptor = descriptor_for(fingerprint);
  return remote;
}

Result<std::vector<RemoteType>, Error>
CachingRemoteTypeResolver::resolve(const std::vector<TypeNotation> &notations) {
  std::vector<std::optional<RemoteType>> slots(notations.size());
  std::vector<const TypeNotation *> pending;
  std::vector<size_t> pending_slots;
  for (size_t i = 0; i < notations.size(); ++i) {
    const TypeNotation &notation = notations[i];
    const std::string &descriptor = notation_descriptor(notation);
    if (auto cached = cache_.get(descriptor)) {
      slots[i] = std::move(cached);
      continue;
    }
    auto local = resolve_locally(notation);
    if (local.ok()) {
      slots[i] = cache_.put_if_absent(descriptor, std::move(local).value());
      continue;
    }
    if (!local.error().is_class_not_found()) {
      return Unexpected(std::move(local).error());
    }
    if (carpenter_ == nullptr) {
      PROTEUS_LOG(DEBUG) << "action=\"resolve\" type="
                         << notation_name(notation) << " carpenter=disabled";
      return Unexpected(std::move(local).error());
    }
    pending.push_back(&notation);
    pending_slots.push_back(i);
  }

  if (!pending.empty()) {
    PROTEUS_RETURN_NOT_OK(carpent(notations, pending));
    for (size_t k = 0; k < pending.size(); ++k) {
      const TypeNotation &notation = *pending[k];
      auto local = resolve_locally(notation);
      if (!local.ok()) {
        PROTEUS_LOG(ERROR) << "action=\"resolve after carpentry\" type="
                           << notation_name(notation) << " error=\""
                           << local.error() << "\"";
        return Unexpected(std::move(local).error());
      }
      slots[pending_slots[k]] = cache_.put_if_absent(
          notation_descriptor(notation), std::move(local).value());
    }
  }

  std::vector<RemoteType> resolved;
  resolved.reserve(slots.size());
  for (auto &slot : slots) {
    resolved.push_back(std::move(*slot));
  }
  return resolved;
}

Result<void, Error> CachingRemoteTypeResolver::carpent(
    const std::vector<TypeNotation> &notations,
    const std::vector<const TypeNotation *> &pending) {
  RemoteTypeInformationBuilder builder(notations);
  std::vector<RemoteTypeInformationPtr> infos;
  infos.reserve(pending.size());
  for (const TypeNotation *notation : pending) {
    PROTEUS_TRY(info, builder.build(notation_name(*notation)));
    infos.push_back(std::move(info));
  }
  if (PROTEUS_LOG_ENABLED(DEBUG)) {
    for (const auto &info : infos) {
      PROTEUS_LOG(DEBUG) << "action=\"plan carpentry\" type="
                         << info->type_identifier().name() << " layout=\""
                         << info->pretty_print() << "\"";
    }
  }
  auto carpented = model::CarpentryDependencyGraph::carpent_in_order(
      *carpenter_, carpented_, infos);
  if (!carpented.ok()) {
    PROTEUS_LOG(ERROR) << "action=\"carpent\" error=\"" << carpented.error()
                       << "\"";
    return Unexpected(
        Error::not_serializable(carpented.error().message()));
  }
  return Result<void, Error>();
}

} // namespace serialization
} // namespace proteus
