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

#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "proteus/type/type_identifier.h"

namespace proteus {
namespace model {

class RemoteTypeInformation;

using RemoteTypeInformationPtr = std::shared_ptr<const RemoteTypeInformation>;

struct RemotePropertyInformation {
  std::string name;
  RemoteTypeInformationPtr type;
  bool mandatory = true;
};

/// The structure of a type as a remote peer declared it, interpreted from
/// the schema it sent. A closed set of shapes; every dispatch on it handles
/// each kind explicitly.
///
/// Instances are immutable and live for one resolution pass.
class RemoteTypeInformation {
public:
  enum class Kind {
    /// The wildcard.
    Top,
    /// Named but not described by the schema; expected to be resolvable
    /// locally.
    Unknown,
    Primitive,
    /// A concrete class with properties.
    Composable,
    AnInterface,
    AnEnum,
    AnArray,
    /// A generic type whose raw class is not itself being described.
    Parameterised,
  };

  static RemoteTypeInformationPtr top();
  static RemoteTypeInformationPtr unknown(TypeIdentifier id);
  static RemoteTypeInformationPtr primitive(TypeIdentifier id);
  static RemoteTypeInformationPtr
  composable(std::string descriptor, TypeIdentifier id,
             std::vector<RemotePropertyInformation> properties,
             std::vector<RemoteTypeInformationPtr> interfaces,
             std::vector<RemoteTypeInformationPtr> type_parameters);
  static RemoteTypeInformationPtr
  an_interface(std::string descriptor, TypeIdentifier id,
               std::vector<RemotePropertyInformation> properties,
               std::vector<RemoteTypeInformationPtr> interfaces,
               std::vector<RemoteTypeInformationPtr> type_parameters);
  static RemoteTypeInformationPtr an_enum(std::string descriptor,
                                          TypeIdentifier id,
                                          std::vector<std::string> members);
  static RemoteTypeInformationPtr an_array(std::string descriptor,
                                           TypeIdentifier id,
                                           RemoteTypeInformationPtr component);
  static RemoteTypeInformationPtr
  parameterised(std::string descriptor, TypeIdentifier id,
                std::vector<RemoteTypeInformationPtr> type_parameters);

  Kind kind() const { return kind_; }
  /// Wire descriptor; empty for kinds the schema does not describe.
  const std::string &type_descriptor() const { return type_descriptor_; }
  const TypeIdentifier &type_identifier() const { return type_identifier_; }

  const std::vector<RemotePropertyInformation> &properties() const {
    return properties_;
  }
  const std::vector<RemoteTypeInformationPtr> &interfaces() const {
    return interfaces_;
  }
  const std::vector<RemoteTypeInformationPtr> &type_parameters() const {
    return type_parameters_;
  }
  /// Component of an AnArray.
  const RemoteTypeInformationPtr &component_type() const {
    return component_type_;
  }
  const std::vector<std::string> &enum_members() const {
    return enum_members_;
  }

  /// Every other type this one structurally refers to.
  std::vector<RemoteTypeInformationPtr> dependencies() const;

  /// Multi-line rendering for diagnostics.
  std::string pretty_print() const;

private:
  RemoteTypeInformation(Kind kind, std::string descriptor, TypeIdentifier id)
      : kind_(kind), type_descriptor_(std::move(descriptor)),
        type_identifier_(std::move(id)) {}

  Kind kind_;
  std::string type_descriptor_;
  TypeIdentifier type_identifier_;
  std::vector<RemotePropertyInformation> properties_;
  std::vector<RemoteTypeInformationPtr> interfaces_;
  std::vector<RemoteTypeInformationPtr> type_parameters_;
  RemoteTypeInformationPtr component_type_;
  std::vector<std::string> enum_members_;
};

const char *remote_kind_name(RemoteTypeInformation::Kind kind);

} // namespace model
} // namespace proteus
