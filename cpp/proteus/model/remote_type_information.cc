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

#include "proteus/model/remote_type_information.h"

#include <sstream>

namespace proteus {
namespace model {

RemoteTypeInformationPtr RemoteTypeInformation::top() {
  static const RemoteTypeInformationPtr instance(
      new RemoteTypeInformation(Kind::Top, "", TypeIdentifier::top()));
  return instance;
}

RemoteTypeInformationPtr RemoteTypeInformation::unknown(TypeIdentifier id) {
  return RemoteTypeInformationPtr(
      new RemoteTypeInformation(Kind::Unknown, "", std::move(id)));
}

RemoteTypeInformationPtr RemoteTypeInformation::primitive(TypeIdentifier id) {
  return RemoteTypeInformationPtr(
      new RemoteTypeInformation(Kind::Primitive, "", std::move(id)));
}

RemoteTypeInformationPtr RemoteTypeInformation::composable(
    std::string descriptor, TypeIdentifier id,
    std::vector<RemotePropertyInformation> properties,
    std::vector<RemoteTypeInformationPtr> interfaces,
    std::vector<RemoteTypeInformationPtr> type_parameters) {
  auto *info = new RemoteTypeInformation(Kind::Composable,
                                         std::move(descriptor), std::move(id));
  info->properties_ = std::move(properties);
  info->interfaces_ = std::move(interfaces);
  info->type_parameters_ = std::move(type_parameters);
  return RemoteTypeInformationPtr(info);
}

RemoteTypeInformationPtr RemoteTypeInformation::an_interface(
    std::string descriptor, TypeIdentifier id,
    std::vector<RemotePropertyInformation> properties,
    std::vector<RemoteTypeInformationPtr> interfaces,
    std::vector<RemoteTypeInformationPtr> type_parameters) {
  auto *info = new RemoteTypeInformation(Kind::AnInterface,
                                         std::move(descriptor), std::move(id));
  info->properties_ = std::move(properties);
  info->interfaces_ = std::move(interfaces);
  info->type_parameters_ = std::move(type_parameters);
  return RemoteTypeInformationPtr(info);
}

RemoteTypeInformationPtr
RemoteTypeInformation::an_enum(std::string descriptor, TypeIdentifier id,
                               std::vector<std::string> members) {
  auto *info = new RemoteTypeInformation(Kind::AnEnum, std::move(descriptor),
                                         std::move(id));
  info->enum_members_ = std::move(members);
  return RemoteTypeInformationPtr(info);
}

RemoteTypeInformationPtr
RemoteTypeInformation::an_array(std::string descriptor, TypeIdentifier id,
                                RemoteTypeInformationPtr component) {
  auto *info = new RemoteTypeInformation(Kind::AnArray, std::move(descriptor),
                                         std::move(id));
  info->component_type_ = std::move(component);
  return RemoteTypeInformationPtr(info);
}

RemoteTypeInformationPtr RemoteTypeInformation::parameterised(
    std::string descriptor, TypeIdentifier id,
    std::vector<RemoteTypeInformationPtr> type_parameters) {
  auto *info = new RemoteTypeInformation(Kind::Parameterised,
                                         std::move(descriptor), std::move(id));
  info->type_parameters_ = std::move(type_parameters);
  return RemoteTypeInformationPtr(info);
}

std::vector<RemoteTypeInformationPtr>
RemoteTypeInformation::dependencies() const {
  std::vector<RemoteTypeInformationPtr> result;
  switch (kind_) {
  case Kind::Composable:
  case Kind::AnInterface:
    for (const auto &property : properties_) {
      result.push_back(property.type);
    }
    result.insert(result.end(), type_parameters_.begin(),
                  type_parameters_.end());
    result.insert(result.end(), interfaces_.begin(), interfaces_.end());
    break;
  case Kind::AnArray:
    result.push_back(component_type_);
    break;
  case Kind::Parameterised:
    result = type_parameters_;
    break;
  case Kind::Top:
  case Kind::Unknown:
  case Kind::Primitive:
  case Kind::AnEnum:
    break;
  }
  return result;
}

std::string RemoteTypeInformation::pretty_print() const {
  std::ostringstream os;
  os << type_identifier_.pretty_print(false);
  switch (kind_) {
  case Kind::Composable:
  case Kind::AnInterface: {
    if (kind_ == Kind::AnInterface) {
      os << " (interface)";
    }
    if (!interfaces_.empty()) {
      os << ":";
      const char *sep = " ";
      for (const auto &iface : interfaces_) {
        os << sep << iface->type_identifier().pretty_print(false);
        sep = ", ";
      }
    }
    os << " {\n";
    for (const auto &property : properties_) {
      os << "  " << property.name << ": "
         << property.type->type_identifier().pretty_print(false)
         << (property.mandatory ? "" : "?") << "\n";
    }
    os << "}";
    break;
  }
  case Kind::AnEnum: {
    os << " (enum) {";
    const char *sep = " ";
    for (const auto &member : enum_members_) {
      os << sep << member;
      sep = ", ";
    }
    os << " }";
    break;
  }
  default:
    break;
  }
  return os.str();
}

const char *remote_kind_name(RemoteTypeInformation::Kind kind) {
  switch (kind) {
  case RemoteTypeInformation::Kind::Top:
    return "top";
  case RemoteTypeInformation::Kind::Unknown:
    return "unknown";
  case RemoteTypeInformation::Kind::Primitive:
    return "primitive";
  case RemoteTypeInformation::Kind::Composable:
    return "composable";
  case RemoteTypeInformation::Kind::AnInterface:
    return "interface";
  case RemoteTypeInformation::Kind::AnEnum:
    return "enum";
  case RemoteTypeInformation::Kind::AnArray:
    return "array";
  case RemoteTypeInformation::Kind::Parameterised:
    return "parameterised";
  }
  return "unknown";
}

} // namespace model
} // namespace proteus
