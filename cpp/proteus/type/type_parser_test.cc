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

#include "proteus/type/type_parser.h"
#include "gtest/gtest.h"

namespace proteus {

namespace {

std::shared_ptr<ClassLoader> example_loader() {
  auto loader = ClassLoader::create();
  EXPECT_TRUE(loader
                  ->define_class(ClassBuilder("com.example.Foo")
                                     .property("x", "int")
                                     .serializable()
                                     .build())
                  .ok());
  EXPECT_TRUE(loader
                  ->define_class(ClassBuilder("com.example.Box")
                                     .type_parameter("T")
                                     .property("value", "T")
                                     .property("values", "List<T>")
                                     .serializable()
                                     .build())
                  .ok());
  return loader;
}

} // namespace

TEST(TypeParserTest, PrimitiveArray) {
  auto loader = example_loader();
  auto type = TypeParser::parse("int[p]", *loader);
  ASSERT_TRUE(type.ok()) << type.error();
  EXPECT_TRUE(type->is_primitive_array());
  EXPECT_EQ(type->component().raw_class()->name(), "int");
  EXPECT_EQ(type->name(), "int[p]");
}

TEST(TypeParserTest, ReferenceArray) {
  auto loader = example_loader();
  auto type = TypeParser::parse("com.example.Foo[]", *loader);
  ASSERT_TRUE(type.ok()) << type.error();
  EXPECT_TRUE(type->is_array());
  EXPECT_FALSE(type->is_primitive_array());
  EXPECT_EQ(type->component().raw_class()->name(), "com.example.Foo");
}

TEST(TypeParserTest, NestedArray) {
  auto loader = example_loader();
  auto type = TypeParser::parse("com.example.Foo[][]", *loader);
  ASSERT_TRUE(type.ok()) << type.error();
  ASSERT_TRUE(type->is_array());
  ASSERT_TRUE(type->component().is_array());
  EXPECT_EQ(type->component().component().raw_class()->name(),
            "com.example.Foo");
  EXPECT_EQ(type->name(), "com.example.Foo[][]");
}

TEST(TypeParserTest, BoxedPrimitiveArrayIsReferenceArray) {
  auto loader = example_loader();
  auto type = TypeParser::parse("int[]", *loader);
  ASSERT_TRUE(type.ok());
  EXPECT_TRUE(type->is_array());
  EXPECT_FALSE(type->is_primitive_array());
}

TEST(TypeParserTest, RejectsUnsupportedPrimitiveArray) {
  auto loader = example_loader();
  for (const char *name : {"byte[p]", "string[p]", "ubyte[p]"}) {
    auto type = TypeParser::parse(name, *loader);
    ASSERT_FALSE(type.ok()) << name;
    EXPECT_EQ(type.error().code(), ErrorCode::NotSerializable);
    EXPECT_EQ(type.error().message(),
              std::string("Not able to deserialize array type: ") + name);
  }
}

TEST(TypeParserTest, Parameterized) {
  auto loader = example_loader();
  auto type = TypeParser::parse("Map<string, List<com.example.Foo>>", *loader);
  ASSERT_TRUE(type.ok()) << type.error();
  EXPECT_TRUE(type->is_parameterized());
  EXPECT_EQ(type->arguments().size(), 2);
  EXPECT_EQ(type->arguments()[1].raw_class()->name(), "List");
  EXPECT_EQ(type->name(), "Map<string, List<com.example.Foo>>");
}

TEST(TypeParserTest, UnknownClass) {
  auto loader = example_loader();
  auto type = TypeParser::parse("List<com.example.Missing>", *loader);
  ASSERT_FALSE(type.ok());
  EXPECT_TRUE(type.error().is_class_not_found());
  EXPECT_EQ(type.error().message(), "com.example.Missing");
}

TEST(TypeParserTest, ResolvePropertiesAppliesBindings) {
  auto loader = example_loader();
  auto box = TypeParser::parse("com.example.Box<string>", *loader);
  ASSERT_TRUE(box.ok());
  auto properties = TypeParser::resolve_properties(*box, *loader);
  ASSERT_TRUE(properties.ok()) << properties.error();
  ASSERT_EQ(properties->size(), 2);
  EXPECT_EQ((*properties)[0].type.name(), "string");
  EXPECT_EQ((*properties)[1].type.name(), "List<string>");

  auto raw = TypeParser::parse("com.example.Box", *loader);
  auto erased = TypeParser::resolve_properties(*raw, *loader);
  ASSERT_TRUE(erased.ok());
  EXPECT_TRUE((*erased)[0].type.is_wildcard());
  EXPECT_EQ((*erased)[1].type.name(), "List<?>");
}

} // namespace proteus
