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

#include "proteus/type/type.h"

#include "proteus/util/logging.h"

namespace proteus {

namespace {

std::string array_name(const std::string &component, bool primitive) {
  return component + (primitive ? "[p]" : "[]");
}

} // namespace

Type::Type() {
  static const std::shared_ptr<const Node> wildcard = [] {
    auto node = std::make_shared<Node>();
    node->kind = Kind::Wildcard;
    node->name = "?";
    return node;
  }();
  node_ = wildcard;
}

Type Type::of(ClassPtr clazz) {
  PROTEUS_CHECK(clazz != nullptr) << "Type::of requires a class";
  auto node = std::make_shared<Node>();
  node->kind = Kind::Class;
  node->name = clazz->name();
  node->clazz = std::move(clazz);
  return Type(std::move(node));
}

Type Type::parameterized(ClassPtr raw, std::vector<Type> arguments) {
  PROTEUS_CHECK(raw != nullptr) << "Type::parameterized requires a raw class";
  if (arguments.empty()) {
    return of(std::move(raw));
  }
  auto node = std::make_shared<Node>();
  node->kind = Kind::Parameterized;
  std::string name = raw->name() + "<";
  for (size_t i = 0; i < arguments.size(); ++i) {
    if (i > 0) {
      name += ", ";
    }
    name += arguments[i].name();
  }
  name += ">";
  node->name = std::move(name);
  node->clazz = std::move(raw);
  node->arguments = std::move(arguments);
  return Type(std::move(node));
}

Type Type::array(Type component) {
  auto node = std::make_shared<Node>();
  node->kind = Kind::Array;
  node->name = array_name(component.name(), false);
  node->component.push_back(std::move(component));
  return Type(std::move(node));
}

Type Type::primitive_array(ClassPtr component) {
  PROTEUS_CHECK(component != nullptr && component->is_primitive())
      << "Primitive arrays need a primitive component";
  auto node = std::make_shared<Node>();
  node->kind = Kind::Array;
  node->primitive_array = true;
  node->name = array_name(component->name(), true);
  node->component.push_back(Type::of(std::move(component)));
  return Type(std::move(node));
}

const Type &Type::component() const {
  PROTEUS_CHECK(node_->kind == Kind::Array)
      << "Type " << node_->name << " is not an array";
  return node_->component.front();
}

} // namespace proteus
