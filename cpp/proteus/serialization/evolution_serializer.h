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
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"

#include "proteus/serialization/enum_serializer.h"
#include "proteus/serialization/object_serializer.h"
#include "proteus/serialization/schema.h"
#include "proteus/serialization/serializer.h"

namespace proteus {
namespace serialization {

class SerializerFactory;

/// How the fields of a remote composite populate the local properties.
struct EvolutionPlan {
  /// Per remote field, the index of the local property it populates, or
  /// nullopt when the field is read and dropped.
  std::vector<std::optional<size_t>> remote_to_local;
  /// Per local property, the value used when no remote field populates it.
  std::vector<Value> defaults;
};

/// Decides how remote fields map onto a local class.
class EvolutionPolicy {
public:
  virtual ~EvolutionPolicy() = default;

  virtual Result<EvolutionPlan, Error> plan(const CompositeType &remote,
                                            const ObjectSerializer &local) const = 0;
};

using EvolutionPolicyPtr = std::shared_ptr<const EvolutionPolicy>;

/// Matches fields by name.
///
/// A remote field without a local property is dropped. A local property
/// without a remote field takes its declared default, else null when it is
/// not mandatory, else the zero value of its primitive type. A property
/// whose type changed, or a mandatory non-primitive property without a
/// default, cannot be evolved.
class DefaultEvolutionPolicy : public EvolutionPolicy {
public:
  Result<EvolutionPlan, Error> plan(const CompositeType &remote,
                                    const ObjectSerializer &local) const override;

  /// Zero value of a primitive type, nullopt for other types.
  static std::optional<Value> zero_value(const Type &type);
};

/// Reads a composite written under a remote shape into the local class.
/// Read only.
class EvolutionSerializer : public Serializer {
public:
  EvolutionSerializer(std::shared_ptr<ObjectSerializer> local,
                      std::string remote_descriptor, EvolutionPlan plan);

  const Type &type() const override { return local_->type(); }
  const std::string &type_descriptor() const override {
    return remote_descriptor_;
  }

  Result<void, Error> write_class_info(SerializationOutput &output) override;

  Result<void, Error> write_object(const Value &value, const Type &declared,
                                   SerializationOutput &output) override;

  Result<Value, Error> read_object(DeserializationInput &input) override;

private:
  std::shared_ptr<ObjectSerializer> local_;
  std::string remote_descriptor_;
  EvolutionPlan plan_;
};

/// Reads enum constants written under a remote constant list into the local
/// enum. Read only.
class EnumEvolutionSerializer : public Serializer {
public:
  /// Maps every remote constant onto a local one, or fails with
  /// NotSerializable.
  static Result<std::shared_ptr<EnumEvolutionSerializer>, Error>
  make(const RestrictedType &remote, std::shared_ptr<EnumSerializer> local,
       const TransformsSchema &transforms);

  EnumEvolutionSerializer(
      std::shared_ptr<EnumSerializer> local, std::string remote_descriptor,
      absl::flat_hash_map<std::string, std::string> conversions);

  const Type &type() const override { return local_->type(); }
  const std::string &type_descriptor() const override {
    return remote_descriptor_;
  }

  Result<void, Error> write_class_info(SerializationOutput &output) override;

  Result<void, Error> write_object(const Value &value, const Type &declared,
                                   SerializationOutput &output) override;

  Result<Value, Error> read_object(DeserializationInput &input) override;

private:
  std::shared_ptr<EnumSerializer> local_;
  std::string remote_descriptor_;
  absl::flat_hash_map<std::string, std::string> conversions_;
};

/// Builds the serializer that reads data described by a remote notation
/// whose descriptor differs from the local one.
class EvolutionSerializerGetter {
public:
  virtual ~EvolutionSerializerGetter() = default;

  /// Returns `local` itself when no evolution is needed.
  virtual Result<SerializerPtr, Error>
  get_evolution_serializer(SerializerFactory &factory,
                           const TypeNotation &remote,
                           const SerializerPtr &local,
                           const SerializationSchemas &schemas) = 0;
};

using EvolutionSerializerGetterPtr = std::shared_ptr<EvolutionSerializerGetter>;

/// Composites evolve through the policy, enums through their constants and
/// transforms; anything else is read with the local serializer.
class DefaultEvolutionSerializerGetter : public EvolutionSerializerGetter {
public:
  explicit DefaultEvolutionSerializerGetter(
      EvolutionPolicyPtr policy = std::make_shared<DefaultEvolutionPolicy>())
      : policy_(std::move(policy)) {}

  Result<SerializerPtr, Error>
  get_evolution_serializer(SerializerFactory &factory,
                           const TypeNotation &remote,
                           const SerializerPtr &local,
                           const SerializationSchemas &schemas) override;

  const EvolutionPolicy &policy() const { return *policy_; }

private:
  EvolutionPolicyPtr policy_;
};

} // namespace serialization
} // namespace proteus
