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

#include "proteus/type/type_parser.h"

#include "absl/strings/str_cat.h"
#include "proteus/type/primitive.h"

namespace proteus {

Result<Type, Error> TypeParser::parse(const std::string &name,
                                      const ClassLoader &loader,
                                      const TypeBindings &bindings) {
  PROTEUS_TRY(id, TypeIdentifier::parse(name));
  return resolve(id, loader, bindings);
}

Result<Type, Error> TypeParser::resolve(const TypeIdentifier &id,
                                        const ClassLoader &loader,
                                        const TypeBindings &bindings) {
  switch (id.kind()) {
  case TypeIdentifier::Kind::Top:
    return Type::wildcard();
  case TypeIdentifier::Kind::Unparameterised: {
    auto bound = bindings.find(id.erased_name());
    if (bound != bindings.end()) {
      return bound->second;
    }
    PROTEUS_TRY(clazz, loader.load_class(id.erased_name()));
    return Type::of(std::move(clazz));
  }
  case TypeIdentifier::Kind::Parameterised: {
    PROTEUS_TRY(raw, loader.load_class(id.erased_name()));
    std::vector<Type> arguments;
    arguments.reserve(id.parameters().size());
    for (const auto &parameter : id.parameters()) {
      PROTEUS_TRY(argument, resolve(parameter, loader, bindings));
      arguments.push_back(std::move(argument));
    }
    return Type::parameterized(std::move(raw), std::move(arguments));
  }
  case TypeIdentifier::Kind::Array: {
    PROTEUS_TRY(component, resolve(id.component(), loader, bindings));
    return Type::array(std::move(component));
  }
  case TypeIdentifier::Kind::PrimitiveArray: {
    if (!is_primitive_array_component(id.erased_name())) {
      return Unexpected(Error::not_serializable(
          absl::StrCat("Not able to deserialize array type: ", id.name())));
    }
    PROTEUS_TRY(component, loader.load_class(id.erased_name()));
    return Type::primitive_array(std::move(component));
  }
  }
  return Unexpected(Error::invalid(absl::StrCat("Unknown type ", id.name())));
}

TypeBindings TypeParser::bindings_for(const Type &type) {
  TypeBindings bindings;
  const ClassPtr &raw = type.raw_class();
  if (raw == nullptr) {
    return bindings;
  }
  const auto &parameters = raw->type_parameters();
  const auto &arguments = type.arguments();
  for (size_t i = 0; i < parameters.size(); ++i) {
    bindings.emplace(parameters[i],
                     i < arguments.size() ? arguments[i] : Type::wildcard());
  }
  return bindings;
}

Result<std::vector<ResolvedProperty>, Error>
TypeParser::resolve_properties(const Type &type, const ClassLoader &loader) {
  const ClassPtr &raw = type.raw_class();
  if (raw == nullptr) {
    return Unexpected(Error::invalid(
        absl::StrCat("Type ", type.name(), " has no properties")));
  }
  TypeBindings bindings = bindings_for(type);
  std::vector<ResolvedProperty> properties;
  properties.reserve(raw->properties().size());
  for (const auto &property : raw->properties()) {
    PROTEUS_TRY(property_type, parse(property.type_name, loader, bindings));
    properties.push_back(ResolvedProperty{property.name,
                                          std::move(property_type),
                                          property.mandatory,
                                          property.default_value});
  }
  return properties;
}

} // namespace proteus
