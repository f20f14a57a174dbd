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

#include "proteus/carpenter/class_carpenter.h"

#include <algorithm>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/strings/str_cat.h"
#include "proteus/type/type_parser.h"
#include "proteus/util/logging.h"

namespace proteus {
namespace carpenter {

using model::RemoteTypeInformation;

namespace {

struct RequiredProperty {
  std::string type_name;
  std::string declared_by;
  // Typed by a type parameter of the declaring interface.
  bool generic = false;
};

// Collects the properties required by `interfaces` and everything they
// extend, failing on conflicting declarations.
Result<std::vector<std::pair<std::string, RequiredProperty>>, Error>
required_properties(const std::string &class_name,
                    const std::vector<std::string> &interfaces,
                    const ClassLoader &loader) {
  std::vector<std::pair<std::string, RequiredProperty>> required;
  absl::flat_hash_map<std::string, size_t> index;
  std::vector<std::string> pending(interfaces.rbegin(), interfaces.rend());
  absl::flat_hash_map<std::string, bool> visited;
  while (!pending.empty()) {
    std::string name = std::move(pending.back());
    pending.pop_back();
    if (!visited.emplace(name, true).second) {
      continue;
    }
    auto loaded = loader.load_class(name);
    if (!loaded.ok()) {
      return Unexpected(Error::carpentry_error(absl::StrCat(
          "Interface ", name, " of ", class_name, " cannot be resolved")));
    }
    const ClassPtr &iface = loaded.value();
    const auto &type_parameters = iface->type_parameters();
    for (const auto &property : iface->properties()) {
      bool generic = std::find(type_parameters.begin(), type_parameters.end(),
                               property.type_name) != type_parameters.end();
      auto it = index.find(property.name);
      if (it == index.end()) {
        index.emplace(property.name, required.size());
        required.emplace_back(
            property.name, RequiredProperty{property.type_name, name, generic});
        continue;
      }
      const RequiredProperty &seen = required[it->second].second;
      if (!generic && !seen.generic && seen.type_name != property.type_name) {
        return Unexpected(Error::carpentry_error(absl::StrCat(
            "Conflicting definitions of property ", property.name, " in ",
            required[it->second].second.declared_by, " and ", name,
            " implemented by ", class_name)));
      }
    }
    for (auto it = iface->interfaces().rbegin();
         it != iface->interfaces().rend(); ++it) {
      pending.push_back(*it);
    }
  }
  return required;
}

} // namespace

ClassCarpenter::ClassCarpenter(std::shared_ptr<const ClassLoader> parent,
                               bool lenient)
    : loader_(std::make_shared<ClassLoader>(std::move(parent))),
      lenient_(lenient) {}

Result<Type, Error> ClassCarpenter::resolve(const TypeIdentifier &id) const {
  auto type = TypeParser::resolve(id, *loader_);
  if (!type.ok()) {
    return Unexpected(Error::carpentry_error(absl::StrCat(
        "Cannot resolve type ", id.name(), ": ", type.error().to_string())));
  }
  return type;
}

Result<Type, Error>
ClassCarpenter::carpent(const RemoteTypeInformation &info) {
  PROTEUS_LOG(TRACE) << "action=\"carpent\" type="
                     << info.type_identifier().name()
                     << " kind=" << model::remote_kind_name(info.kind());
  switch (info.kind()) {
  case RemoteTypeInformation::Kind::Top:
    return Type::wildcard();
  case RemoteTypeInformation::Kind::Unknown:
  case RemoteTypeInformation::Kind::Primitive:
  case RemoteTypeInformation::Kind::AnArray:
  case RemoteTypeInformation::Kind::Parameterised:
    // Nothing to synthesize; the parts were carpented earlier in the batch.
    return resolve(info.type_identifier());
  case RemoteTypeInformation::Kind::Composable:
  case RemoteTypeInformation::Kind::AnInterface:
    return carpent_class(info);
  case RemoteTypeInformation::Kind::AnEnum:
    return carpent_enum(info);
  }
  return Unexpected(Error::carpentry_error(
      absl::StrCat("Cannot carpent ", info.type_identifier().name())));
}

Result<ClassPtr, Error>
ClassCarpenter::existing_synthesized(const std::string &name,
                                     ClassKind kind) const {
  auto loaded = loader_->load_class(name);
  if (!loaded.ok()) {
    return ClassPtr();
  }
  const ClassPtr &clazz = loaded.value();
  if (!clazz->is_synthesized() || clazz->kind() != kind) {
    return Unexpected(Error::carpentry_error(
        absl::StrCat("Cannot carpent ", name,
                     ": the name is taken by an existing ",
                     class_kind_name(clazz->kind()))));
  }
  return clazz;
}

Result<Type, Error>
ClassCarpenter::carpent_class(const RemoteTypeInformation &info) {
  const std::string &name = info.type_identifier().erased_name();
  ClassKind kind = info.kind() == RemoteTypeInformation::Kind::AnInterface
                       ? ClassKind::Interface
                       : ClassKind::Composite;
  {
    absl::MutexLock lock(&define_mu_);
    PROTEUS_TRY(existing, existing_synthesized(name, kind));
    if (existing == nullptr) {
      ClassBuilder builder(name, kind);
      builder.synthesized().serializable();
      std::vector<std::string> interfaces;
      for (const auto &iface : info.interfaces()) {
        const std::string &iface_name = iface->type_identifier().erased_name();
        interfaces.push_back(iface_name);
        builder.implements(iface_name);
      }
      absl::flat_hash_map<std::string, std::string> declared;
      for (const auto &property : info.properties()) {
        const std::string &type_name = property.type->type_identifier().name();
        if (!declared.emplace(property.name, type_name).second) {
          return Unexpected(Error::carpentry_error(
              absl::StrCat("Property ", property.name,
                           " is declared twice by ", name)));
        }
        builder.property(property.name, type_name, property.mandatory);
      }

      PROTEUS_TRY(required, required_properties(name, interfaces, *loader_));
      for (const auto &entry : required) {
        auto it = declared.find(entry.first);
        if (it == declared.end()) {
          if (!lenient_) {
            return Unexpected(Error::carpentry_error(absl::StrCat(
                name, " does not declare property ", entry.first,
                " required by ", entry.second.declared_by)));
          }
          PROTEUS_LOG(DEBUG) << "action=\"lenient carpentry\" class=" << name
                             << " property=" << entry.first;
          builder.property(entry.first,
                           entry.second.generic ? "?" : entry.second.type_name,
                           false);
        } else if (!entry.second.generic &&
                   it->second != entry.second.type_name) {
          return Unexpected(Error::carpentry_error(absl::StrCat(
              "Property ", entry.first, " of ", name, " has type ",
              it->second, " but ", entry.second.declared_by, " declares ",
              entry.second.type_name)));
        }
      }

      ClassPtr clazz = builder.build();
      // Check the property types in a scratch loader first so that a failed
      // build leaves nothing behind; self references resolve there too.
      ClassLoader scratch(loader_);
      PROTEUS_RETURN_NOT_OK(scratch.define_class(clazz));
      for (const auto &property : clazz->properties()) {
        auto property_type = TypeParser::parse(property.type_name, scratch);
        if (!property_type.ok()) {
          return Unexpected(Error::carpentry_error(absl::StrCat(
              "Cannot resolve type ", property.type_name, " of property ",
              property.name, " of ", name, ": ",
              property_type.error().to_string())));
        }
      }
      PROTEUS_RETURN_NOT_OK(loader_->define_class(clazz));
      PROTEUS_LOG(DEBUG) << "action=\"carpented\" class=" << name
                         << " kind=" << class_kind_name(kind);
    }
  }
  return resolve(info.type_identifier());
}

Result<Type, Error>
ClassCarpenter::carpent_enum(const RemoteTypeInformation &info) {
  const std::string &name = info.type_identifier().erased_name();
  {
    absl::MutexLock lock(&define_mu_);
    PROTEUS_TRY(existing, existing_synthesized(name, ClassKind::Enum));
    if (existing == nullptr) {
      ClassBuilder builder(name, ClassKind::Enum);
      builder.synthesized().serializable();
      for (const auto &member : info.enum_members()) {
        builder.constant(member);
      }
      PROTEUS_RETURN_NOT_OK(loader_->define_class(builder.build()));
      PROTEUS_LOG(DEBUG) << "action=\"carpented\" class=" << name
                         << " kind=enum";
    }
  }
  return resolve(info.type_identifier());
}

} // namespace carpenter
} // namespace proteus
