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
#include <utility>
#include <vector>

#include "proteus/carpenter/class_carpenter.h"
#include "proteus/serialization/remote_type_resolver.h"
#include "gtest/gtest.h"

namespace proteus {
namespace serialization {

using model::RemoteTypeInformation;

namespace {

Field field(const std::string &name, const std::string &type,
            bool mandatory = true) {
  Field result;
  result.name = name;
  result.type = type;
  result.mandatory = mandatory;
  return result;
}

// A composite notation whose descriptor matches the local fingerprint of a
// class with the same shape.
TypeNotation composite(const std::string &name, const std::string &shape,
                       std::vector<Field> fields) {
  CompositeType type;
  type.name = name;
  type.descriptor = Descriptor{descriptor_for(fingerprint_of(shape))};
  type.fields = std::move(fields);
  return type;
}

TypeNotation enumeration(const std::string &name,
                         std::vector<std::string> constants) {
  RestrictedType type;
  type.name = name;
  type.source = "list";
  type.descriptor = Descriptor{"proteus:enum-" + name};
  for (size_t i = 0; i < constants.size(); ++i) {
    type.choices.push_back({constants[i], std::to_string(i)});
  }
  return type;
}

TypeNotation restricted(const std::string &name, const std::string &source) {
  RestrictedType type;
  type.name = name;
  type.source = source;
  type.descriptor = Descriptor{"proteus:restricted-" + name};
  return type;
}

class RemoteTypeResolverTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(app_->define_class(ClassBuilder("com.example.Local")
                                       .property("x", "int")
                                       .build())
                    .ok());
  }

  std::unique_ptr<CachingRemoteTypeResolver> make_resolver(bool carpentry) {
    fingerprinter_ = std::make_shared<SerializerFingerprinter>(
        carpenter_->class_loader());
    return std::make_unique<CachingRemoteTypeResolver>(
        carpenter_->class_loader(),
        carpentry ? carpenter_ : nullptr, fingerprinter_);
  }

  std::shared_ptr<ClassLoader> app_ = ClassLoader::create();
  std::shared_ptr<carpenter::ClassCarpenter> carpenter_ =
      std::make_shared<carpenter::ClassCarpenter>(app_);
  std::shared_ptr<SerializerFingerprinter> fingerprinter_;
};

} // namespace

TEST_F(RemoteTypeResolverTest, ResolvesLocalTypes) {
  auto resolver = make_resolver(true);
  std::vector<TypeNotation> notations = {
      composite("com.example.Local", "com.example.Local{x:int;}",
                {field("x", "int")}),
      restricted("List<string>", "list")};
  auto resolved = resolver->resolve(notations);
  ASSERT_TRUE(resolved.ok()) << resolved.error();
  ASSERT_EQ(resolved->size(), 2);
  EXPECT_EQ((*resolved)[0].type.name(), "com.example.Local");
  EXPECT_EQ((*resolved)[0].local_descriptor,
            (*resolved)[0].remote_descriptor());
  EXPECT_EQ((*resolved)[1].type.name(), "List<string>");
  EXPECT_EQ(resolver->cached_count(), 2);
  EXPECT_FALSE(carpenter_->class_loader()->has_class("com.example.Remote"));
}

TEST_F(RemoteTypeResolverTest, CarpentsMissingTypesInInputOrder) {
  auto resolver = make_resolver(true);
  std::vector<TypeNotation> notations = {
      composite("com.example.Outer",
                "com.example.Outer{inner:com.example.Inner{y:string;};"
                "color:enum:com.example.Color[RED,GREEN]?;}",
                {field("inner", "com.example.Inner"),
                 field("color", "com.example.Color", false)}),
      composite("com.example.Local", "com.example.Local{x:int;}",
                {field("x", "int")}),
      composite("com.example.Inner", "com.example.Inner{y:string;}",
                {field("y", "string")}),
      enumeration("com.example.Color", {"RED", "GREEN"})};
  auto resolved = resolver->resolve(notations);
  ASSERT_TRUE(resolved.ok()) << resolved.error();
  ASSERT_EQ(resolved->size(), 4);
  for (size_t i = 0; i < notations.size(); ++i) {
    EXPECT_EQ((*resolved)[i].type.name(), notation_name(notations[i]));
  }
  EXPECT_TRUE((*resolved)[0].type.raw_class()->is_synthesized());
  EXPECT_FALSE((*resolved)[1].type.raw_class()->is_synthesized());
  EXPECT_TRUE((*resolved)[3].type.raw_class()->is_enum());
  // Carpented composites have the shape they were described with.
  EXPECT_EQ((*resolved)[0].local_descriptor,
            (*resolved)[0].remote_descriptor());
  EXPECT_EQ((*resolved)[2].local_descriptor,
            (*resolved)[2].remote_descriptor());
  EXPECT_TRUE(carpenter_->class_loader()->has_class("com.example.Inner"));
}

TEST_F(RemoteTypeResolverTest, CachesByDescriptor) {
  auto resolver = make_resolver(true);
  std::vector<TypeNotation> notations = {composite(
      "com.example.Remote", "com.example.Remote{z:long;}", {field("z", "long")})};
  ASSERT_TRUE(resolver->resolve(notations).ok());
  ASSERT_TRUE(resolver->resolve(notations).ok());
  EXPECT_EQ(resolver->cached_count(), 1);
}

TEST_F(RemoteTypeResolverTest, CarpentryDisabled) {
  auto resolver = make_resolver(false);
  std::vector<TypeNotation> notations = {composite(
      "com.example.Remote", "com.example.Remote{z:long;}", {field("z", "long")})};
  auto resolved = resolver->resolve(notations);
  ASSERT_FALSE(resolved.ok());
  EXPECT_EQ(resolved.error().code(), ErrorCode::ClassNotFound);
}

TEST_F(RemoteTypeResolverTest, CyclicBatchIsNotSerializable) {
  auto resolver = make_resolver(true);
  std::vector<TypeNotation> notations = {
      composite("com.example.A", "a", {field("b", "com.example.B")}),
      composite("com.example.B", "b", {field("a", "com.example.A")})};
  auto resolved = resolver->resolve(notations);
  ASSERT_FALSE(resolved.ok());
  EXPECT_EQ(resolved.error().code(), ErrorCode::NotSerializable);
  EXPECT_FALSE(carpenter_->class_loader()->has_class("com.example.A"));
}

TEST(RemoteTypeInformationBuilderTest, InterpretsNotations) {
  CompositeType shape;
  shape.name = "com.example.Shape";
  shape.label = "interface";
  shape.descriptor = Descriptor{"proteus:shape"};
  shape.fields = {field("area", "double")};
  std::vector<TypeNotation> notations = {
      shape, enumeration("com.example.Color", {"RED"}),
      composite("com.example.Node", "node",
                {field("next", "com.example.Node", false),
                 field("shapes", "List<com.example.Shape>")})};
  RemoteTypeInformationBuilder builder(notations);

  auto iface = builder.build("com.example.Shape");
  ASSERT_TRUE(iface.ok()) << iface.error();
  EXPECT_EQ((*iface)->kind(), RemoteTypeInformation::Kind::AnInterface);

  auto color = builder.build("com.example.Color");
  ASSERT_TRUE(color.ok()) << color.error();
  EXPECT_EQ((*color)->kind(), RemoteTypeInformation::Kind::AnEnum);
  EXPECT_EQ((*color)->enum_members(), std::vector<std::string>{"RED"});

  auto node = builder.build("com.example.Node");
  ASSERT_TRUE(node.ok()) << node.error();
  const auto &properties = (*node)->properties();
  ASSERT_EQ(properties.size(), 2);
  // The self reference is a placeholder.
  EXPECT_EQ(properties[0].type->kind(), RemoteTypeInformation::Kind::Unknown);
  EXPECT_FALSE(properties[0].mandatory);
  EXPECT_EQ(properties[1].type->kind(),
            RemoteTypeInformation::Kind::Parameterised);
  EXPECT_EQ(properties[1].type->type_parameters()[0]->kind(),
            RemoteTypeInformation::Kind::AnInterface);

  auto array = builder.build("int[p]");
  ASSERT_TRUE(array.ok());
  EXPECT_EQ((*array)->kind(), RemoteTypeInformation::Kind::AnArray);
  EXPECT_EQ((*array)->component_type()->kind(),
            RemoteTypeInformation::Kind::Primitive);
}

} // namespace serialization
} // namespace proteus
