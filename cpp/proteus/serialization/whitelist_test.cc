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

#include "proteus/serialization/whitelist.h"
#include "proteus/type/type_parser.h"
#include "gtest/gtest.h"

namespace proteus {
namespace serialization {

namespace {

class WhitelistTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(loader_
                    ->define_class(ClassBuilder("com.example.Plain")
                                       .property("x", "int")
                                       .build())
                    .ok());
    ASSERT_TRUE(loader_
                    ->define_class(ClassBuilder("com.example.Marker",
                                                ClassKind::Interface)
                                       .serializable()
                                       .build())
                    .ok());
    ASSERT_TRUE(loader_
                    ->define_class(ClassBuilder("com.example.Base")
                                       .implements("com.example.Marker")
                                       .build())
                    .ok());
    ASSERT_TRUE(loader_
                    ->define_class(ClassBuilder("com.example.Derived")
                                       .extends("com.example.Base")
                                       .build())
                    .ok());
  }

  Result<void, Error> check(const ClassWhitelist &whitelist,
                            const std::string &name) {
    return require_whitelisted(whitelist, *loader_,
                               TypeParser::parse(name, *loader_).value());
  }

  std::shared_ptr<ClassLoader> loader_ = ClassLoader::create();
};

} // namespace

TEST_F(WhitelistTest, EmptyWhitelistRejectsUnmarkedClasses) {
  EmptyWhitelist whitelist;
  auto result = check(whitelist, "com.example.Plain");
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().code(), ErrorCode::NotWhitelisted);
  EXPECT_EQ(result.error().message(),
            "Class com.example.Plain is not on the whitelist or marked "
            "serializable.");
}

TEST_F(WhitelistTest, MarkerIsInherited) {
  EmptyWhitelist whitelist;
  EXPECT_TRUE(check(whitelist, "com.example.Base").ok());
  EXPECT_TRUE(check(whitelist, "com.example.Derived").ok());
}

TEST_F(WhitelistTest, ExplicitWhitelist) {
  ExplicitWhitelist whitelist({"com.example.Plain"});
  EXPECT_TRUE(check(whitelist, "com.example.Plain").ok());
  EXPECT_TRUE(check(AllWhitelist(), "com.example.Plain").ok());
}

TEST_F(WhitelistTest, ArgumentsAndComponentsAreChecked) {
  EmptyWhitelist whitelist;
  EXPECT_TRUE(check(whitelist, "List<int>").ok());
  EXPECT_TRUE(check(whitelist, "?").ok());
  EXPECT_FALSE(check(whitelist, "List<com.example.Plain>").ok());
  EXPECT_FALSE(check(whitelist, "com.example.Plain[]").ok());
  EXPECT_TRUE(check(whitelist, "com.example.Derived[]").ok());
}

} // namespace serialization
} // namespace proteus
