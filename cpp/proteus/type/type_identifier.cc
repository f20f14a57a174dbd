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

#include "proteus/type/type_identifier.h"

#include <cctype>

#include "absl/strings/str_cat.h"
#include "proteus/util/logging.h"

namespace proteus {

namespace {

bool is_delimiter(char c) {
  return c == '<' || c == '>' || c == ',' || c == '[' || c == ']' ||
         std::isspace(static_cast<unsigned char>(c));
}

std::string simple_name(const std::string &name) {
  auto pos = name.rfind('.');
  return pos == std::string::npos ? name : name.substr(pos + 1);
}

// Recursive descent over a canonical type name.
class IdentifierParser {
public:
  explicit IdentifierParser(std::string_view input) : input_(input) {}

  Result<TypeIdentifier, Error> parse_all() {
    PROTEUS_TRY(id, parse_type());
    skip_whitespace();
    if (pos_ != input_.size()) {
      return Unexpected(error("Unexpected trailing input"));
    }
    return id;
  }

private:
  Result<TypeIdentifier, Error> parse_type() {
    skip_whitespace();
    if (at_end()) {
      return Unexpected(error("Expected a type name"));
    }
    TypeIdentifier id;
    if (input_[pos_] == '?') {
      ++pos_;
    } else {
      size_t start = pos_;
      while (!at_end() && !is_delimiter(input_[pos_])) {
        ++pos_;
      }
      if (start == pos_) {
        return Unexpected(error("Expected a type name"));
      }
      std::string name(input_.substr(start, pos_ - start));
      skip_whitespace();
      if (!at_end() && input_[pos_] == '<') {
        ++pos_;
        std::vector<TypeIdentifier> parameters;
        while (true) {
          PROTEUS_TRY(parameter, parse_type());
          parameters.push_back(std::move(parameter));
          skip_whitespace();
          if (at_end()) {
            return Unexpected(error("Unterminated type parameter list"));
          }
          if (input_[pos_] == ',') {
            ++pos_;
            continue;
          }
          if (input_[pos_] == '>') {
            ++pos_;
            break;
          }
          return Unexpected(error("Expected ',' or '>'"));
        }
        id = TypeIdentifier::parameterised(std::move(name),
                                           std::move(parameters));
      } else {
        id = TypeIdentifier::unparameterised(std::move(name));
      }
    }
    return parse_array_suffixes(std::move(id));
  }

  Result<TypeIdentifier, Error> parse_array_suffixes(TypeIdentifier id) {
    while (true) {
      skip_whitespace();
      if (at_end() || input_[pos_] != '[') {
        return id;
      }
      if (input_.substr(pos_, 2) == "[]") {
        pos_ += 2;
        id = TypeIdentifier::array(std::move(id));
      } else if (input_.substr(pos_, 3) == "[p]") {
        if (id.kind() != TypeIdentifier::Kind::Unparameterised) {
          return Unexpected(
              error("Primitive array suffix applied to a non-primitive type"));
        }
        pos_ += 3;
        id = TypeIdentifier::primitive_array(id.name());
      } else {
        return Unexpected(error("Malformed array suffix"));
      }
    }
  }

  void skip_whitespace() {
    while (!at_end() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
      ++pos_;
    }
  }

  bool at_end() const { return pos_ >= input_.size(); }

  Error error(const std::string &what) const {
    return Error::invalid(absl::StrCat(what, " at offset ", pos_, " in \"",
                                       absl::string_view(input_.data(), input_.size()), "\""));
  }

  std::string_view input_;
  size_t pos_ = 0;
};

} // namespace

TypeIdentifier::TypeIdentifier() {
  static const std::shared_ptr<const Node> top = [] {
    auto node = std::make_shared<Node>();
    node->kind = Kind::Top;
    node->erased_name = "?";
    node->name = "?";
    return node;
  }();
  node_ = top;
}

TypeIdentifier TypeIdentifier::unparameterised(std::string name) {
  auto node = std::make_shared<Node>();
  node->kind = Kind::Unparameterised;
  node->erased_name = name;
  node->name = std::move(name);
  return TypeIdentifier(std::move(node));
}

TypeIdentifier
TypeIdentifier::parameterised(std::string name,
                              std::vector<TypeIdentifier> parameters) {
  if (parameters.empty()) {
    return unparameterised(std::move(name));
  }
  auto node = std::make_shared<Node>();
  node->kind = Kind::Parameterised;
  node->name = name + "<";
  for (size_t i = 0; i < parameters.size(); ++i) {
    if (i > 0) {
      node->name += ", ";
    }
    node->name += parameters[i].name();
  }
  node->name += ">";
  node->erased_name = std::move(name);
  node->parameters = std::move(parameters);
  return TypeIdentifier(std::move(node));
}

TypeIdentifier TypeIdentifier::array(TypeIdentifier component) {
  auto node = std::make_shared<Node>();
  node->kind = Kind::Array;
  node->name = component.name() + "[]";
  node->erased_name = component.erased_name() + "[]";
  node->component.push_back(std::move(component));
  return TypeIdentifier(std::move(node));
}

TypeIdentifier TypeIdentifier::primitive_array(std::string component) {
  auto node = std::make_shared<Node>();
  node->kind = Kind::PrimitiveArray;
  node->name = component + "[p]";
  node->erased_name = std::move(component);
  return TypeIdentifier(std::move(node));
}

Result<TypeIdentifier, Error> TypeIdentifier::parse(std::string_view name) {
  return IdentifierParser(name).parse_all();
}

TypeIdentifier TypeIdentifier::for_type(const Type &type) {
  switch (type.kind()) {
  case Type::Kind::Wildcard:
    return top();
  case Type::Kind::Class:
    return unparameterised(type.raw_class()->name());
  case Type::Kind::Parameterized: {
    std::vector<TypeIdentifier> parameters;
    parameters.reserve(type.arguments().size());
    for (const auto &argument : type.arguments()) {
      parameters.push_back(for_type(argument));
    }
    return parameterised(type.raw_class()->name(), std::move(parameters));
  }
  case Type::Kind::Array:
    if (type.is_primitive_array()) {
      return primitive_array(type.component().raw_class()->name());
    }
    return array(for_type(type.component()));
  }
  return top();
}

const TypeIdentifier &TypeIdentifier::component() const {
  PROTEUS_CHECK(node_->kind == Kind::Array)
      << "Type identifier " << node_->name << " is not an array";
  return node_->component.front();
}

std::string TypeIdentifier::pretty_print(bool simplified) const {
  switch (kind()) {
  case Kind::Top:
    return "?";
  case Kind::Unparameterised:
    return simplified ? simple_name(erased_name()) : erased_name();
  case Kind::Parameterised: {
    std::string out = simplified ? simple_name(erased_name()) : erased_name();
    out += "<";
    for (size_t i = 0; i < parameters().size(); ++i) {
      if (i > 0) {
        out += ", ";
      }
      out += parameters()[i].pretty_print(simplified);
    }
    return out + ">";
  }
  case Kind::Array:
    return component().pretty_print(simplified) + "[]";
  case Kind::PrimitiveArray:
    return erased_name() + "[p]";
  }
  return name();
}

} // namespace proteus
