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

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "proteus/serialization/collection_serializer.h"
#include "proteus/serialization/custom_serializer.h"
#include "proteus/serialization/object_serializer.h"
#include "proteus/serialization/serializer_factory.h"
#include "proteus/util/logging.h"
#include "gtest/gtest.h"

namespace proteus {
namespace serialization {

namespace {

class CountingWhitelist : public ClassWhitelist {
public:
  bool has_listed(const Class &) const override {
    ++calls;
    return true;
  }

  mutable std::atomic<int> calls{0};
};

class MoneyPlugin : public SerializationCustomSerializer {
public:
  std::string type_name() const override { return "com.example.Money"; }
  std::string proxy_type_name() const override {
    return "com.example.MoneyProxy";
  }
  Result<Value, Error> to_proxy(const Value &value) const override {
    return Value::object("com.example.MoneyProxy",
                         {{"text", Value::of_string(value.to_string())}});
  }
  Result<Value, Error> from_proxy(const Value &) const override {
    return Unexpected(Error::unsupported("not needed"));
  }
};

class SerializerFactoryTest : public ::testing::Test {
protected:
  void SetUp() override {
    define(ClassBuilder("com.example.Point")
               .property("x", "int")
               .property("y", "int")
               .build());
    define(ClassBuilder("com.example.Money")
               .property("amount", "long")
               .property("currency", "string")
               .build());
    define(ClassBuilder("com.example.MoneyProxy")
               .property("text", "string")
               .build());
    define(ClassBuilder("com.example.Base").property("id", "int").build());
    define(ClassBuilder("com.example.Derived")
               .property("id", "int")
               .extends("com.example.Base")
               .build());
    define(ClassBuilder("com.example.Lambda").synthetic().build());
    define(ClassBuilder("com.example.Nothing").singleton().build());
  }

  void define(ClassPtr clazz) {
    ASSERT_TRUE(app_->define_class(std::move(clazz)).ok());
  }

  std::unique_ptr<SerializerFactory>
  make_factory(ClassWhitelistPtr whitelist = std::make_shared<AllWhitelist>(),
               Config config = Config()) {
    return std::make_unique<SerializerFactory>(config, app_,
                                               std::move(whitelist));
  }

  ClassPtr load(const std::string &name) {
    return app_->load_class(name).value();
  }

  Type type(SerializerFactory &factory, const std::string &name) {
    return factory.type_for_name(name).value();
  }

  CustomSerializerPtr money_serializer(
      std::vector<CustomSerializerPtr> additional = {}) {
    return std::make_shared<ProxySerializer>(
        load("com.example.Money"), load("com.example.MoneyProxy"),
        [](const Value &value) -> Result<Value, Error> {
          return Value::object("com.example.MoneyProxy",
                               {{"text", Value::of_string(value.to_string())}});
        },
        [](const Value &) -> Result<Value, Error> {
          return Value::object("com.example.Money", {});
        },
        ProxySerializer::Matching::Is, false, std::move(additional));
  }

  std::shared_ptr<ClassLoader> app_ = ClassLoader::create();
};

} // namespace

TEST_F(SerializerFactoryTest, SerializersAreCachedByType) {
  auto factory = make_factory();
  Type point = type(*factory, "com.example.Point");
  auto first = factory->get(point.raw_class(), point);
  ASSERT_TRUE(first.ok()) << first.error();
  auto second = factory->get(nullptr, point);
  ASSERT_TRUE(second.ok()) << second.error();
  EXPECT_EQ(first.value(), second.value());
  EXPECT_NE(std::dynamic_pointer_cast<ObjectSerializer>(first.value()), nullptr);
}

TEST_F(SerializerFactoryTest, ConcurrentRequestsBuildOnce) {
  auto whitelist = std::make_shared<CountingWhitelist>();
  auto factory = make_factory(whitelist);
  Type point = type(*factory, "com.example.Point");
  std::vector<SerializerPtr> results(8);
  std::vector<std::thread> threads;
  for (size_t i = 0; i < results.size(); ++i) {
    threads.emplace_back([&, i]() {
      auto serializer = factory->get(point.raw_class(), point);
      if (serializer.ok()) {
        results[i] = serializer.value();
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }
  ASSERT_NE(results[0], nullptr);
  for (const auto &serializer : results) {
    EXPECT_EQ(serializer, results[0]);
  }
  EXPECT_EQ(whitelist->calls.load(), 1);
}

TEST_F(SerializerFactoryTest, CollectionsAreNormalised) {
  auto factory = make_factory();
  Type list = type(*factory, "List<int>");
  auto from_array_list = factory->get(load("ArrayList"), list);
  ASSERT_TRUE(from_array_list.ok()) << from_array_list.error();
  EXPECT_EQ(from_array_list.value()->type().name(), "List<int>");
  auto declared_only = factory->get(nullptr, type(*factory, "ArrayList<int>"));
  ASSERT_TRUE(declared_only.ok()) << declared_only.error();
  EXPECT_EQ(declared_only.value(), from_array_list.value());
  EXPECT_NE(std::dynamic_pointer_cast<CollectionSerializer>(
                declared_only.value()),
            nullptr);
}

TEST_F(SerializerFactoryTest, HashMapIsUnsupported) {
  auto factory = make_factory();
  auto serializer =
      factory->get(load("HashMap"), type(*factory, "Map<string, int>"));
  ASSERT_FALSE(serializer.ok());
  EXPECT_EQ(serializer.error().code(), ErrorCode::Unsupported);
  EXPECT_NE(serializer.error().message().find("use LinkedHashMap"),
            std::string::npos);
}

TEST_F(SerializerFactoryTest, SyntheticClassesAreRejected) {
  auto factory = make_factory();
  auto serializer =
      factory->get(load("com.example.Lambda"), Type::wildcard());
  ASSERT_FALSE(serializer.ok());
  EXPECT_EQ(serializer.error().code(), ErrorCode::NotSerializable);
}

TEST_F(SerializerFactoryTest, UnlistedClassesAreRejected) {
  auto factory = make_factory(std::make_shared<EmptyWhitelist>());
  Type point = type(*factory, "com.example.Point");
  auto serializer = factory->get(point.raw_class(), point);
  ASSERT_FALSE(serializer.ok());
  EXPECT_EQ(serializer.error().code(), ErrorCode::NotWhitelisted);
  // Nothing was published; a later request tries again.
  EXPECT_FALSE(factory->get(point.raw_class(), point).ok());
}

TEST_F(SerializerFactoryTest, SingletonSerializer) {
  auto factory = make_factory();
  Type nothing = type(*factory, "com.example.Nothing");
  auto serializer = factory->get(nothing.raw_class(), nothing);
  ASSERT_TRUE(serializer.ok()) << serializer.error();
  EXPECT_EQ(std::dynamic_pointer_cast<ObjectSerializer>(serializer.value()),
            nullptr);
}

TEST_F(SerializerFactoryTest, OnlyCustomSerializers) {
  Config config;
  config.only_custom_serializers = true;
  auto factory = make_factory(std::make_shared<AllWhitelist>(), config);
  Type point = type(*factory, "com.example.Point");
  auto serializer = factory->get(point.raw_class(), point);
  ASSERT_FALSE(serializer.ok());
  EXPECT_EQ(serializer.error().code(), ErrorCode::NotSerializable);
  EXPECT_TRUE(factory->get(nullptr, type(*factory, "int")).ok());

  factory->register_serializer(money_serializer());
  Type money = type(*factory, "com.example.Money");
  EXPECT_TRUE(factory->get(money.raw_class(), money).ok());
}

TEST_F(SerializerFactoryTest, CustomSerializerIsSelected) {
  auto factory = make_factory();
  CustomSerializerPtr custom = money_serializer();
  factory->register_serializer(custom);
  Type money = type(*factory, "com.example.Money");
  auto serializer = factory->get(money.raw_class(), money);
  ASSERT_TRUE(serializer.ok()) << serializer.error();
  EXPECT_EQ(serializer.value(), custom);
  EXPECT_EQ(serializer.value()->type_descriptor(),
            descriptor_for(custom_fingerprint("com.example.Money")));
  EXPECT_EQ(factory->descriptor_for(money).value(),
            custom->type_descriptor());
}

TEST_F(SerializerFactoryTest, RegistrationIsIdempotent) {
  auto factory = make_factory();
  auto point_proxy = std::make_shared<ProxySerializer>(
      load("com.example.Point"), load("com.example.MoneyProxy"),
      [](const Value &value) -> Result<Value, Error> { return value; },
      [](const Value &value) -> Result<Value, Error> { return value; });
  factory->register_serializer(money_serializer({point_proxy}));
  EXPECT_EQ(factory->custom_serializer_count(), 2);

  // A second registration with different dependents changes nothing.
  factory->register_serializer(money_serializer());
  factory->register_serializer(point_proxy);
  EXPECT_EQ(factory->custom_serializer_count(), 2);
  EXPECT_TRUE(factory->has_custom_serializer(*load("com.example.Point")));
}

TEST_F(SerializerFactoryTest, ConflictingRegistrationIsLoggedAsKeyValues) {
  auto factory = make_factory();
  auto point_proxy = std::make_shared<ProxySerializer>(
      load("com.example.Point"), load("com.example.MoneyProxy"),
      [](const Value &value) -> Result<Value, Error> { return value; },
      [](const Value &value) -> Result<Value, Error> { return value; });
  factory->register_serializer(money_serializer({point_proxy}));

  LogLevel saved = Logger::level();
  Logger::set_level(LogLevel::WARNING);
  testing::internal::CaptureStderr();
  factory->register_serializer(money_serializer());
  std::string output = testing::internal::GetCapturedStderr();
  Logger::set_level(saved);

  EXPECT_NE(output.find("WARNING serializer_factory.cc:"), std::string::npos)
      << output;
  EXPECT_NE(output.find("action=\"ignore additional serializers\" "
                        "type=com.example.Money descriptor=proteus:"),
            std::string::npos)
      << output;
  EXPECT_NE(output.find("reason=\"already registered\""), std::string::npos);
}

TEST_F(SerializerFactoryTest, ExternalRegistration) {
  auto factory = make_factory();
  auto plugin = std::make_shared<MoneyPlugin>();
  ASSERT_TRUE(factory->register_external(plugin).ok());
  ASSERT_TRUE(factory->register_external(plugin).ok());
  EXPECT_EQ(factory->custom_serializer_count(), 1);
  Type money = type(*factory, "com.example.Money");
  auto serializer = factory->get(money.raw_class(), money);
  ASSERT_TRUE(serializer.ok()) << serializer.error();
  EXPECT_NE(std::dynamic_pointer_cast<ExternalSerializer>(serializer.value()),
            nullptr);
}

TEST_F(SerializerFactoryTest, ExternalRegistrationNeedsItsClasses) {
  class MissingPlugin : public MoneyPlugin {
  public:
    std::string type_name() const override { return "com.example.Missing"; }
  };
  auto factory = make_factory();
  auto registered = factory->register_external(std::make_shared<MissingPlugin>());
  ASSERT_FALSE(registered.ok());
  EXPECT_EQ(registered.error().code(), ErrorCode::ClassNotFound);
  EXPECT_EQ(factory->custom_serializer_count(), 0);
}

TEST_F(SerializerFactoryTest, SubclassesOfRevealingSerializer) {
  auto factory = make_factory();
  auto base = std::make_shared<ProxySerializer>(
      load("com.example.Base"), load("com.example.MoneyProxy"),
      [](const Value &) -> Result<Value, Error> {
        return Value::object("com.example.MoneyProxy",
                             {{"text", Value::of_string("base")}});
      },
      [](const Value &) -> Result<Value, Error> {
        return Value::object("com.example.Base", {});
      },
      ProxySerializer::Matching::Implements, true);
  factory->register_serializer(base);

  Type derived = type(*factory, "com.example.Derived");
  auto serializer = factory->get(derived.raw_class(), derived);
  ASSERT_TRUE(serializer.ok()) << serializer.error();
  auto subclass =
      std::dynamic_pointer_cast<SubClassSerializer>(serializer.value());
  ASSERT_NE(subclass, nullptr);
  EXPECT_EQ(subclass->type().name(), "com.example.Derived");

  // Declared as the base class, the base serializer is used directly.
  Type base_type = type(*factory, "com.example.Base");
  EXPECT_EQ(factory->find_custom_serializer(derived.raw_class(), base_type),
            base);
}

TEST_F(SerializerFactoryTest, UnknownDescriptor) {
  auto factory = make_factory();
  auto serializer = factory->get("proteus:0000000000000000",
                                 SerializationSchemas());
  ASSERT_FALSE(serializer.ok());
  EXPECT_EQ(serializer.error().code(), ErrorCode::DescriptorNotFound);
}

TEST_F(SerializerFactoryTest, DecodePathFindsEncodeSerializers) {
  auto factory = make_factory();
  Type point = type(*factory, "com.example.Point");
  auto encoded = factory->get(point.raw_class(), point);
  ASSERT_TRUE(encoded.ok()) << encoded.error();
  auto decoded =
      factory->get(encoded.value()->type_descriptor(), SerializationSchemas());
  ASSERT_TRUE(decoded.ok()) << decoded.error();
  EXPECT_EQ(decoded.value(), encoded.value());
}

} // namespace serialization
} // namespace proteus
