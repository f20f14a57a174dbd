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

#include "proteus/util/error.h"
#include "gtest/gtest.h"

namespace proteus {

class ErrorTest : public ::testing::Test {};

TEST_F(ErrorTest, Basic) {
  Error err = Error::not_serializable("synthetic class");
  ASSERT_EQ(err.code(), ErrorCode::NotSerializable);
  ASSERT_EQ(err.message(), "synthetic class");
  ASSERT_EQ(err.to_string(), "Not serializable: synthetic class");
}

TEST_F(ErrorTest, ClassNotFoundCarriesName) {
  Error err = Error::class_not_found("com.example.Foo");
  ASSERT_TRUE(err.is_class_not_found());
  ASSERT_EQ(err.message(), "com.example.Foo");
  ASSERT_FALSE(Error::carpentry_error("cycle").is_class_not_found());
}

TEST_F(ErrorTest, DescriptorNotFoundMessage) {
  Error err = Error::descriptor_not_found("proteus:abc");
  ASSERT_EQ(err.code(), ErrorCode::DescriptorNotFound);
  ASSERT_EQ(err.message(),
            "Could not find type matching descriptor proteus:abc.");
}

TEST_F(ErrorTest, CodeStringRoundTrip) {
  ASSERT_EQ(Error::string_to_code("Not whitelisted"),
            ErrorCode::NotWhitelisted);
  ASSERT_EQ(Error::string_to_code("Carpentry error"),
            ErrorCode::CarpentryError);
  ASSERT_EQ(Error::string_to_code("no such code"), ErrorCode::UnknownError);
  ASSERT_EQ(Error::unsupported("x").code_as_string(), "Unsupported");
}

TEST_F(ErrorTest, CopyAndMove) {
  Error err = Error::not_whitelisted("com.example.Secret");
  Error copy = err;
  ASSERT_EQ(copy.code(), ErrorCode::NotWhitelisted);
  ASSERT_EQ(copy.message(), err.message());

  Error moved = std::move(copy);
  ASSERT_EQ(moved.message(), "com.example.Secret");

  Error other = Error::invalid("other");
  other = err;
  ASSERT_EQ(other.code(), ErrorCode::NotWhitelisted);
}

TEST_F(ErrorTest, BufferOutOfBoundMessage) {
  Error err = Error::buffer_out_of_bound(10, 4, 12);
  ASSERT_EQ(err.code(), ErrorCode::BufferOutOfBound);
  ASSERT_EQ(err.message(), "Buffer out of bound: 10 + 4 > 12");
}

} // namespace proteus
