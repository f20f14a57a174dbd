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

#include <memory>
#include <string>

#include "proteus/serialization/fingerprinter.h"
#include "proteus/type/type_parser.h"
#include "gtest/gtest.h"

namespace proteus {
namespace serialization {

namespace {

static_assert(fnv1a_64("") == 14695981039346656037ULL, "fnv1a offset basis");

class FingerprinterTest : public ::testing::Test {
protected:
  void SetUp() override {
    define(ClassBuilder("com.example.Point")
               .property("x", "int")
               .property("y", "int")
               .build());
    define(ClassBuilder("com.example.Shape", ClassKind::Interface)
               .property("area", "double")
               .build());
    define(ClassBuilder("com.example.Circle")
               .property("area", "double")
               .property("label", "string", false)
               .implements("com.example.Shape")
               .build());
    define(ClassBuilder("com.example.Color", ClassKind::Enum)
               .constant("RED")
               .constant("GREEN")
               .build());
    define(ClassBuilder("com.example.Node")
               .property("value", "int")
               .property("next", "com.example.Node", false)
               .build());
    define(ClassBuilder("com.example.Box")
               .type_parameter("T")
               .property("value", "T")
               .build());
  }

  void define(ClassPtr clazz) {
    ASSERT_TRUE(loader_->define_class(std::move(clazz)).ok());
  }

  Type type(const std::string &name) {
    return TypeParser::parse(name, *loader_).value();
  }

  std::string shape(const std::string &name) {
    auto result = fingerprinter_.shape(type(name));
    EXPECT_TRUE(result.ok()) << result.error();
    return result.ok() ? result.value() : "";
  }

  std::shared_ptr<ClassLoader> loader_ = ClassLoader::create();
  SerializerFingerprinter fingerprinter_{loader_};
};

} // namespace

TEST_F(FingerprinterTest, PrimitivesAndCollections) {
  EXPECT_EQ(shape("int"), "int");
  EXPECT_EQ(shape("List<string>"), "List<string>");
  EXPECT_EQ(shape("Map<string, List<int>>"), "Map<string,List<int>>");
  EXPECT_EQ(shape("int[p]"), "int[p]");
  EXPECT_EQ(fingerprinter_.shape(Type::wildcard()).value(), "?");
}

TEST_F(FingerprinterTest, CompositeShape) {
  EXPECT_EQ(shape("com.example.Point"), "com.example.Point{x:int;y:int;}");
  EXPECT_EQ(shape("com.example.Circle"),
            "com.example.Circle{area:double;label:string?;}:com.example.Shape");
  EXPECT_EQ(shape("com.example.Point[]"), "com.example.Point{x:int;y:int;}[]");
}

TEST_F(FingerprinterTest, EnumShapeListsConstants) {
  EXPECT_EQ(shape("com.example.Color"), "enum:com.example.Color[RED,GREEN]");
}

TEST_F(FingerprinterTest, SelfReferenceIsBackReference) {
  EXPECT_EQ(shape("com.example.Node"),
            "com.example.Node{value:int;next:^com.example.Node?;}");
}

TEST_F(FingerprinterTest, GenericBindingsApply) {
  EXPECT_EQ(shape("com.example.Box<int>"), "com.example.Box<int>{value:int;}");
  EXPECT_NE(fingerprinter_.fingerprint(type("com.example.Box<int>")).value(),
            fingerprinter_.fingerprint(type("com.example.Box<string>")).value());
}

TEST_F(FingerprinterTest, CustomSerializedClassesUseTheirName) {
  SerializerFingerprinter custom(
      loader_, [](const Class &clazz) { return clazz.name() == "com.example.Point"; });
  EXPECT_EQ(custom.shape(type("com.example.Point")).value(),
            "custom:com.example.Point");
  EXPECT_EQ(custom.fingerprint(type("com.example.Point")).value(),
            custom_fingerprint("com.example.Point"));
}

TEST_F(FingerprinterTest, FingerprintIsHexOfShape) {
  std::string fingerprint =
      fingerprinter_.fingerprint(type("com.example.Point")).value();
  EXPECT_EQ(fingerprint.size(), 16);
  EXPECT_EQ(fingerprint, fingerprint_of("com.example.Point{x:int;y:int;}"));
  EXPECT_EQ(descriptor_for(fingerprint), "proteus:" + fingerprint);
}

TEST_F(FingerprinterTest, SameShapeInAnotherLoader) {
  auto other = ClassLoader::create();
  ASSERT_TRUE(other
                  ->define_class(ClassBuilder("com.example.Point")
                                     .property("x", "int")
                                     .property("y", "int")
                                     .synthesized()
                                     .build())
                  .ok());
  SerializerFingerprinter remote(other);
  EXPECT_EQ(remote.fingerprint(TypeParser::parse("com.example.Point", *other).value())
                .value(),
            fingerprinter_.fingerprint(type("com.example.Point")).value());
}

TEST_F(FingerprinterTest, ChangedShapeChangesFingerprint) {
  auto other = ClassLoader::create();
  ASSERT_TRUE(other
                  ->define_class(ClassBuilder("com.example.Point")
                                     .property("x", "int")
                                     .build())
                  .ok());
  SerializerFingerprinter remote(other);
  EXPECT_NE(remote.fingerprint(TypeParser::parse("com.example.Point", *other).value())
                .value(),
            fingerprinter_.fingerprint(type("com.example.Point")).value());
}

} // namespace serialization
} // namespace proteus
