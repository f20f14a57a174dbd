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

#include <string>
#include <vector>

#include "proteus/carpenter/class_carpenter.h"
#include "gtest/gtest.h"

namespace proteus {
namespace carpenter {

using model::RemotePropertyInformation;
using model::RemoteTypeInformation;
using model::RemoteTypeInformationPtr;

namespace {

TypeIdentifier id(const std::string &name) {
  return TypeIdentifier::parse(name).value();
}

RemoteTypeInformationPtr primitive(const std::string &name) {
  return RemoteTypeInformation::primitive(id(name));
}

RemotePropertyInformation property(const std::string &name,
                                   RemoteTypeInformationPtr type,
                                   bool mandatory = true) {
  return RemotePropertyInformation{name, std::move(type), mandatory};
}

RemoteTypeInformationPtr
composable(const std::string &name,
           std::vector<RemotePropertyInformation> properties,
           std::vector<RemoteTypeInformationPtr> interfaces = {}) {
  return RemoteTypeInformation::composable("proteus:" + name, id(name),
                                           std::move(properties),
                                           std::move(interfaces), {});
}

RemoteTypeInformationPtr
an_interface(const std::string &name,
             std::vector<RemotePropertyInformation> properties) {
  return RemoteTypeInformation::an_interface(
      "proteus:" + name, id(name), std::move(properties), {}, {});
}

class ClassCarpenterTest : public ::testing::Test {
protected:
  std::shared_ptr<ClassLoader> app_ = ClassLoader::create();
};

} // namespace

TEST_F(ClassCarpenterTest, CarpentsComposite) {
  ClassCarpenter carpenter(app_);
  auto info = composable("com.example.Foo",
                         {property("a", primitive("int")),
                          property("b", primitive("string"), false)});
  auto type = carpenter.carpent(*info);
  ASSERT_TRUE(type.ok()) << type.error();
  EXPECT_EQ(type->name(), "com.example.Foo");

  const ClassPtr &clazz = type->raw_class();
  ASSERT_NE(clazz, nullptr);
  EXPECT_TRUE(clazz->is_synthesized());
  EXPECT_TRUE(clazz->is_serializable());
  ASSERT_EQ(clazz->properties().size(), 2u);
  EXPECT_EQ(clazz->properties()[0].name, "a");
  EXPECT_EQ(clazz->properties()[0].type_name, "int");
  EXPECT_TRUE(clazz->properties()[0].mandatory);
  EXPECT_EQ(clazz->properties()[1].name, "b");
  EXPECT_FALSE(clazz->properties()[1].mandatory);

  EXPECT_TRUE(carpenter.class_loader()->has_class("com.example.Foo"));
  EXPECT_FALSE(app_->has_class("com.example.Foo"));
}

TEST_F(ClassCarpenterTest, ReusesCarpentedClass) {
  ClassCarpenter carpenter(app_);
  auto info = composable("com.example.Foo", {property("a", primitive("int"))});
  auto first = carpenter.carpent(*info);
  auto second = carpenter.carpent(*info);
  ASSERT_TRUE(first.ok()) << first.error();
  ASSERT_TRUE(second.ok()) << second.error();
  EXPECT_EQ(first->raw_class(), second->raw_class());
}

TEST_F(ClassCarpenterTest, CarpentsGenericErased) {
  ClassCarpenter carpenter(app_);
  auto ints =
      composable("com.example.Box<int>", {property("value", primitive("int"))});
  auto strings = composable("com.example.Box<string>",
                            {property("value", primitive("string"))});
  auto box_of_int = carpenter.carpent(*ints);
  ASSERT_TRUE(box_of_int.ok()) << box_of_int.error();
  auto box_of_string = carpenter.carpent(*strings);
  ASSERT_TRUE(box_of_string.ok()) << box_of_string.error();

  EXPECT_EQ(box_of_int->name(), "com.example.Box<int>");
  EXPECT_EQ(box_of_string->name(), "com.example.Box<string>");
  EXPECT_EQ(box_of_int->raw_class(), box_of_string->raw_class());
  EXPECT_EQ(box_of_int->raw_class()->name(), "com.example.Box");
}

TEST_F(ClassCarpenterTest, CarpentsEnum) {
  ClassCarpenter carpenter(app_);
  auto info = RemoteTypeInformation::an_enum(
      "proteus:Colour", id("com.example.Colour"), {"RED", "GREEN", "BLUE"});
  auto type = carpenter.carpent(*info);
  ASSERT_TRUE(type.ok()) << type.error();
  const ClassPtr &clazz = type->raw_class();
  ASSERT_TRUE(clazz->is_enum());
  EXPECT_EQ(clazz->enum_constants(),
            (std::vector<std::string>{"RED", "GREEN", "BLUE"}));
  EXPECT_EQ(clazz->ordinal_of("BLUE").value_or(-1), 2);
}

TEST_F(ClassCarpenterTest, ResolvesApplicationClasses) {
  ASSERT_TRUE(
      app_->define_class(ClassBuilder("com.example.Local")
                             .property("x", "int")
                             .serializable()
                             .build())
          .ok());
  ClassCarpenter carpenter(app_);
  auto info = composable(
      "com.example.Holder",
      {property("local",
                RemoteTypeInformation::unknown(id("com.example.Local")))});
  auto type = carpenter.carpent(*info);
  ASSERT_TRUE(type.ok()) << type.error();
  EXPECT_EQ(type->raw_class()->properties()[0].type_name, "com.example.Local");
}

TEST_F(ClassCarpenterTest, SelfReference) {
  ClassCarpenter carpenter(app_);
  auto info = composable(
      "com.example.Node",
      {property("value", primitive("int")),
       property("next", RemoteTypeInformation::unknown(id("com.example.Node")),
                false)});
  auto type = carpenter.carpent(*info);
  ASSERT_TRUE(type.ok()) << type.error();
  EXPECT_EQ(type->raw_class()->properties()[1].type_name, "com.example.Node");
}

TEST_F(ClassCarpenterTest, UnresolvablePropertyDefinesNothing) {
  ClassCarpenter carpenter(app_);
  auto info = composable(
      "com.example.Foo",
      {property("missing",
                RemoteTypeInformation::unknown(id("com.example.Missing")))});
  auto type = carpenter.carpent(*info);
  ASSERT_FALSE(type.ok());
  EXPECT_EQ(type.error().code(), ErrorCode::CarpentryError);
  EXPECT_FALSE(carpenter.class_loader()->has_class("com.example.Foo"));
}

TEST_F(ClassCarpenterTest, NameTakenByApplicationClass) {
  ASSERT_TRUE(
      app_->define_class(ClassBuilder("com.example.Foo").serializable().build())
          .ok());
  ClassCarpenter carpenter(app_);
  auto info = composable("com.example.Foo", {property("a", primitive("int"))});
  auto type = carpenter.carpent(*info);
  ASSERT_FALSE(type.ok());
  EXPECT_EQ(type.error().code(), ErrorCode::CarpentryError);
}

TEST_F(ClassCarpenterTest, ImplementsCarpentedInterface) {
  ClassCarpenter carpenter(app_);
  auto named =
      an_interface("com.example.Named", {property("name", primitive("string"))});
  auto person = composable("com.example.Person",
                           {property("name", primitive("string")),
                            property("age", primitive("int"))},
                           {named});
  ASSERT_TRUE(carpenter.carpent(*named).ok());
  auto type = carpenter.carpent(*person);
  ASSERT_TRUE(type.ok()) << type.error();
  EXPECT_TRUE(type->raw_class()->is_synthesized());
  EXPECT_TRUE(carpenter.class_loader()->is_assignable(*type->raw_class(),
                                                      "com.example.Named"));
}

TEST_F(ClassCarpenterTest, MissingInterfacePropertyStrict) {
  ClassCarpenter carpenter(app_);
  auto named =
      an_interface("com.example.Named", {property("name", primitive("string"))});
  auto anonymous = composable("com.example.Anonymous",
                              {property("age", primitive("int"))}, {named});
  ASSERT_TRUE(carpenter.carpent(*named).ok());
  auto type = carpenter.carpent(*anonymous);
  ASSERT_FALSE(type.ok());
  EXPECT_EQ(type.error().code(), ErrorCode::CarpentryError);
}

TEST_F(ClassCarpenterTest, MissingInterfacePropertyLenient) {
  ClassCarpenter carpenter(app_, /*lenient=*/true);
  auto named =
      an_interface("com.example.Named", {property("name", primitive("string"))});
  auto anonymous = composable("com.example.Anonymous",
                              {property("age", primitive("int"))}, {named});
  ASSERT_TRUE(carpenter.carpent(*named).ok());
  auto type = carpenter.carpent(*anonymous);
  ASSERT_TRUE(type.ok()) << type.error();
  const Property *name = type->raw_class()->find_property("name");
  ASSERT_NE(name, nullptr);
  EXPECT_FALSE(name->mandatory);
  EXPECT_EQ(name->type_name, "string");
}

TEST_F(ClassCarpenterTest, ConflictingInterfaceProperties) {
  ClassCarpenter carpenter(app_, /*lenient=*/true);
  auto by_string =
      an_interface("com.example.A", {property("id", primitive("string"))});
  auto by_long = an_interface("com.example.B", {property("id", primitive("long"))});
  ASSERT_TRUE(carpenter.carpent(*by_string).ok());
  ASSERT_TRUE(carpenter.carpent(*by_long).ok());
  auto both = composable("com.example.Both", {property("id", primitive("long"))},
                         {by_string, by_long});
  auto type = carpenter.carpent(*both);
  ASSERT_FALSE(type.ok());
  EXPECT_EQ(type.error().code(), ErrorCode::CarpentryError);
}

TEST_F(ClassCarpenterTest, StructuralKinds) {
  ClassCarpenter carpenter(app_);
  auto foo = composable("com.example.Foo", {property("a", primitive("int"))});
  ASSERT_TRUE(carpenter.carpent(*foo).ok());

  auto array = RemoteTypeInformation::an_array("proteus:Foo[]",
                                               id("com.example.Foo[]"), foo);
  auto array_type = carpenter.carpent(*array);
  ASSERT_TRUE(array_type.ok()) << array_type.error();
  EXPECT_TRUE(array_type->is_array());
  EXPECT_EQ(array_type->component().name(), "com.example.Foo");

  auto list = RemoteTypeInformation::parameterised(
      "proteus:List<Foo>", id("List<com.example.Foo>"), {foo});
  auto list_type = carpenter.carpent(*list);
  ASSERT_TRUE(list_type.ok()) << list_type.error();
  EXPECT_EQ(list_type->name(), "List<com.example.Foo>");

  auto top = carpenter.carpent(*RemoteTypeInformation::top());
  ASSERT_TRUE(top.ok());
  EXPECT_TRUE(top->is_wildcard());
}

} // namespace carpenter
} // namespace proteus
