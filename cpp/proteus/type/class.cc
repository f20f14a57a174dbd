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

#include "proteus/type/class.h"

namespace proteus {

const char *class_kind_name(ClassKind kind) {
  switch (kind) {
  case ClassKind::Primitive:
    return "primitive";
  case ClassKind::Composite:
    return "composite";
  case ClassKind::Interface:
    return "interface";
  case ClassKind::Enum:
    return "enum";
  case ClassKind::Collection:
    return "collection";
  case ClassKind::Map:
    return "map";
  case ClassKind::Top:
    return "top";
  }
  return "unknown";
}

const Property *Class::find_property(const std::string &name) const {
  for (const auto &property : properties_) {
    if (property.name == name) {
      return &property;
    }
  }
  return nullptr;
}

std::optional<int32_t> Class::ordinal_of(const std::string &constant) const {
  for (size_t i = 0; i < enum_constants_.size(); ++i) {
    if (enum_constants_[i] == constant) {
      return static_cast<int32_t>(i);
    }
  }
  return std::nullopt;
}

ClassBuilder::ClassBuilder(std::string name, ClassKind kind)
    : clazz_(new Class()) {
  clazz_->name_ = std::move(name);
  clazz_->kind_ = kind;
}

ClassBuilder &ClassBuilder::property(std::string name, std::string type_name,
                                     bool mandatory) {
  clazz_->properties_.push_back(
      Property{std::move(name), std::move(type_name), mandatory, std::nullopt});
  return *this;
}

ClassBuilder &ClassBuilder::property_with_default(std::string name,
                                                  std::string type_name,
                                                  Value default_value) {
  clazz_->properties_.push_back(Property{std::move(name), std::move(type_name),
                                         true, std::move(default_value)});
  return *this;
}

ClassBuilder &ClassBuilder::implements(std::string interface_name) {
  clazz_->interfaces_.push_back(std::move(interface_name));
  return *this;
}

ClassBuilder &ClassBuilder::extends(std::string superclass_name) {
  clazz_->superclass_ = std::move(superclass_name);
  return *this;
}

ClassBuilder &ClassBuilder::type_parameter(std::string name) {
  clazz_->type_parameters_.push_back(std::move(name));
  return *this;
}

ClassBuilder &ClassBuilder::constant(std::string name) {
  clazz_->enum_constants_.push_back(std::move(name));
  return *this;
}

ClassBuilder &ClassBuilder::rename(std::string from, std::string to) {
  clazz_->enum_renames_.emplace_back(std::move(from), std::move(to));
  return *this;
}

ClassBuilder &ClassBuilder::default_constant(std::string from,
                                             std::string to) {
  clazz_->enum_defaults_.emplace_back(std::move(from), std::move(to));
  return *this;
}

ClassBuilder &ClassBuilder::synthetic(bool value) {
  clazz_->synthetic_ = value;
  return *this;
}

ClassBuilder &ClassBuilder::singleton(bool value) {
  clazz_->singleton_ = value;
  return *this;
}

ClassBuilder &ClassBuilder::synthesized(bool value) {
  clazz_->synthesized_ = value;
  return *this;
}

ClassBuilder &ClassBuilder::serializable(bool value) {
  clazz_->serializable_ = value;
  return *this;
}

ClassPtr ClassBuilder::build() {
  // Each build hands out an independent snapshot so the builder stays usable.
  return std::make_shared<const Class>(*clazz_);
}

} // namespace proteus
