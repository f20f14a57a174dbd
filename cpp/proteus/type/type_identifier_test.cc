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

#include "proteus/type/class_loader.h"
#include "proteus/type/type_identifier.h"
#include "gtest/gtest.h"

namespace proteus {

TEST(TypeIdentifierTest, ParseCanonicalNames) {
  auto id = TypeIdentifier::parse("com.example.Box<int, com.example.Foo[]>");
  ASSERT_TRUE(id.ok()) << id.error();
  EXPECT_EQ(id->kind(), TypeIdentifier::Kind::Parameterised);
  EXPECT_EQ(id->erased_name(), "com.example.Box");
  ASSERT_EQ(id->parameters().size(), 2);
  EXPECT_EQ(id->parameters()[1].kind(), TypeIdentifier::Kind::Array);
  EXPECT_EQ(id->name(), "com.example.Box<int, com.example.Foo[]>");
}

TEST(TypeIdentifierTest, WhitespaceIsNormalised) {
  auto a = TypeIdentifier::parse(" Map < string ,List<?> > ");
  auto b = TypeIdentifier::parse("Map<string, List<?>>");
  ASSERT_TRUE(a.ok()) << a.error();
  ASSERT_TRUE(b.ok());
  EXPECT_EQ(*a, *b);
}

TEST(TypeIdentifierTest, ArraySuffixes) {
  auto prim = TypeIdentifier::parse("long[p]");
  ASSERT_TRUE(prim.ok());
  EXPECT_EQ(prim->kind(), TypeIdentifier::Kind::PrimitiveArray);
  EXPECT_EQ(prim->erased_name(), "long");

  auto nested = TypeIdentifier::parse("int[p][]");
  ASSERT_TRUE(nested.ok());
  EXPECT_EQ(nested->kind(), TypeIdentifier::Kind::Array);
  EXPECT_EQ(nested->component().kind(), TypeIdentifier::Kind::PrimitiveArray);
}

TEST(TypeIdentifierTest, EqualityIsByCanonicalName) {
  auto ab = TypeIdentifier::parse("Map<string, int>");
  auto ba = TypeIdentifier::parse("Map<int, string>");
  EXPECT_NE(*ab, *ba);
  EXPECT_EQ(TypeIdentifier::parse("?").value(), TypeIdentifier::top());
  EXPECT_NE(TypeIdentifier::parse("int[]").value(),
            TypeIdentifier::parse("int[p]").value());
}

TEST(TypeIdentifierTest, Malformed) {
  for (const char *name : {"", "List<", "List<int", "Foo[x]", "List<int>[p]",
                           "a b"}) {
    auto id = TypeIdentifier::parse(name);
    EXPECT_FALSE(id.ok()) << name;
  }
}

TEST(TypeIdentifierTest, PrettyPrint) {
  auto id = TypeIdentifier::parse("com.example.Box<com.example.Foo>[]").value();
  EXPECT_EQ(id.pretty_print(true), "Box<Foo>[]");
  EXPECT_EQ(id.pretty_print(false), "com.example.Box<com.example.Foo>[]");
}

TEST(TypeIdentifierTest, ForType) {
  auto loader = ClassLoader::create();
  auto list = loader->load_class("List").value();
  auto string = loader->load_class("string").value();
  Type type = Type::array(Type::parameterized(list, {Type::of(string)}));
  EXPECT_EQ(TypeIdentifier::for_type(type).name(), "List<string>[]");
  EXPECT_EQ(TypeIdentifier::for_type(type).name(), type.name());
}

} // namespace proteus
