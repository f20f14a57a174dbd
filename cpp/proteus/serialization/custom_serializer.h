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

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

#include "proteus/serialization/schema.h"
#include "proteus/serialization/serializer.h"
#include "proteus/type/class.h"
#include "proteus/type/class_loader.h"
#include "proteus/type/type.h"
#include "proteus/type/value.h"
#include "proteus/util/error.h"
#include "proteus/util/result.h"

namespace proteus {
namespace serialization {

class ObjectSerializer;
class SerializerFactory;

class CustomSerializer;
using CustomSerializerPtr = std::shared_ptr<CustomSerializer>;

/// Base of user supplied serializers, registered with a factory and chosen
/// for the classes `is_serializer_for` accepts, in registration order.
///
/// The descriptor of a custom serializer is derived from the custom marker
/// and the class name only, so peers agree on it without comparing shapes.
class CustomSerializer : public Serializer {
public:
  virtual bool is_serializer_for(const Class &clazz,
                                 const ClassLoader &loader) const = 0;

  /// Whether subclasses of the handled class should be described by a
  /// SubClassSerializer rather than under the base class name.
  virtual bool reveal_subclasses_in_schema() const { return false; }

  /// Serializers registered along with this one.
  virtual std::vector<CustomSerializerPtr> additional_serializers() const {
    return {};
  }

  /// Writes the body, without the descriptor.
  virtual Result<void, Error> write_described_object(
      const Value &value, const Type &declared, SerializationOutput &output) = 0;

  /// Reads the body.
  virtual Result<Value, Error>
  read_described_object(DeserializationInput &input) = 0;

  Result<void, Error> write_object(const Value &value, const Type &declared,
                                   SerializationOutput &output) final;

  Result<Value, Error> read_object(DeserializationInput &input) final {
    return read_described_object(input);
  }
};

/// Converts a value to and from a proxy object whose properties form the
/// schema.
///
/// With `Matching::Is` only the class itself is handled; with
/// `Matching::Implements` every class assignable to it is.
class ProxySerializer : public CustomSerializer {
public:
  enum class Matching { Is, Implements };

  using Conversion = std::function<Result<Value, Error>(const Value &)>;

  ProxySerializer(ClassPtr clazz, ClassPtr proxy_class, Conversion to_proxy,
                  Conversion from_proxy, Matching matching = Matching::Is,
                  bool reveal_subclasses = false,
                  std::vector<CustomSerializerPtr> additional = {});

  const Type &type() const override { return type_; }
  const std::string &type_descriptor() const override { return descriptor_; }

  const ClassPtr &proxy_class() const { return proxy_class_; }

  bool is_serializer_for(const Class &clazz,
                         const ClassLoader &loader) const override;

  bool reveal_subclasses_in_schema() const override {
    return reveal_subclasses_;
  }

  std::vector<CustomSerializerPtr> additional_serializers() const override {
    return additional_;
  }

  Result<void, Error> write_class_info(SerializationOutput &output) override;

  Result<void, Error> write_described_object(
      const Value &value, const Type &declared,
      SerializationOutput &output) override;

  Result<Value, Error>
  read_described_object(DeserializationInput &input) override;

private:
  Result<std::shared_ptr<ObjectSerializer>, Error>
  proxy_serializer(SerializerFactory &factory);

  ClassPtr clazz_;
  ClassPtr proxy_class_;
  Type type_;
  std::string descriptor_;
  Conversion to_proxy_;
  Conversion from_proxy_;
  Matching matching_;
  bool reveal_subclasses_;
  std::vector<CustomSerializerPtr> additional_;

  absl::Mutex mu_;
  std::shared_ptr<ObjectSerializer> proxy_serializer_ ABSL_GUARDED_BY(mu_);
};

/// Describes a subclass written by a base class custom serializer: the
/// notation names the subclass and points at the base notation through its
/// source, the body is the base serializer's.
class SubClassSerializer : public CustomSerializer {
public:
  SubClassSerializer(ClassPtr clazz, CustomSerializerPtr base);

  const Type &type() const override { return type_; }
  const std::string &type_descriptor() const override { return descriptor_; }

  bool is_serializer_for(const Class &clazz,
                         const ClassLoader &) const override {
    return clazz.name() == clazz_->name();
  }

  Result<void, Error> write_class_info(SerializationOutput &output) override;

  Result<void, Error> write_described_object(
      const Value &value, const Type &declared,
      SerializationOutput &output) override {
    return base_->write_described_object(value, declared, output);
  }

  Result<Value, Error>
  read_described_object(DeserializationInput &input) override {
    return base_->read_described_object(input);
  }

private:
  ClassPtr clazz_;
  CustomSerializerPtr base_;
  Type type_;
  std::string descriptor_;
};

/// Custom serializer contract for code the application does not trust:
/// a pair of conversions between the target class and a proxy class, both
/// named rather than resolved.
class SerializationCustomSerializer {
public:
  virtual ~SerializationCustomSerializer() = default;

  virtual std::string type_name() const = 0;

  virtual std::string proxy_type_name() const = 0;

  virtual Result<Value, Error> to_proxy(const Value &value) const = 0;

  virtual Result<Value, Error> from_proxy(const Value &proxy) const = 0;
};

/// Adapts a SerializationCustomSerializer to a proxy serializer handling
/// exactly the target class.
class ExternalSerializer : public ProxySerializer {
public:
  static Result<std::shared_ptr<ExternalSerializer>, Error>
  make(std::shared_ptr<const SerializationCustomSerializer> plugin,
       const ClassLoader &loader);

  ExternalSerializer(std::shared_ptr<const SerializationCustomSerializer> plugin,
                     ClassPtr clazz, ClassPtr proxy_class);

  const SerializationCustomSerializer &plugin() const { return *plugin_; }

private:
  std::shared_ptr<const SerializationCustomSerializer> plugin_;
};

} // namespace serialization
} // namespace proteus
