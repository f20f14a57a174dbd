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

#include "proteus/util/result.h"
#include "gtest/gtest.h"

namespace proteus {

namespace {

Result<int, Error> parse_positive(int value) {
  if (value <= 0) {
    return Unexpected(Error::invalid("not positive"));
  }
  return value;
}

Result<int, Error> doubled(int value) {
  PROTEUS_TRY(parsed, parse_positive(value));
  return parsed * 2;
}

Result<void, Error> check_all(int a, int b) {
  PROTEUS_RETURN_NOT_OK(parse_positive(a));
  PROTEUS_RETURN_NOT_OK(parse_positive(b));
  return Result<void, Error>();
}

struct Base {
  virtual ~Base() = default;
};
struct Derived : Base {};

} // namespace

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, BasicValue) {
  Result<int, Error> res(42);
  ASSERT_TRUE(res.ok());
  ASSERT_TRUE(res.has_value());
  ASSERT_EQ(res.value(), 42);
  ASSERT_EQ(*res, 42);
}

TEST_F(ResultTest, BasicError) {
  Result<int, Error> res = Unexpected(Error::class_not_found("a.B"));
  ASSERT_FALSE(res.ok());
  ASSERT_EQ(res.error().code(), ErrorCode::ClassNotFound);
  ASSERT_EQ(res.value_or(5), 5);
}

TEST_F(ResultTest, CopyAndMove) {
  Result<std::string, Error> res1(std::string("hello"));
  Result<std::string, Error> res2 = res1;
  ASSERT_EQ(res1.value(), "hello");
  ASSERT_EQ(res2.value(), "hello");

  Result<std::string, Error> res3 = std::move(res2);
  ASSERT_EQ(res3->size(), 5);

  Result<std::string, Error> err = Unexpected(Error::key_error("missing"));
  res3 = err;
  ASSERT_FALSE(res3.ok());
  ASSERT_EQ(res3.error().message(), "missing");
}

TEST_F(ResultTest, ConvertingConstruction) {
  Result<std::shared_ptr<Base>, Error> res = std::make_shared<Derived>();
  ASSERT_TRUE(res.ok());
  ASSERT_NE(std::dynamic_pointer_cast<Derived>(res.value()), nullptr);
}

TEST_F(ResultTest, TryMacroPropagates) {
  ASSERT_EQ(doubled(4).value(), 8);
  auto failed = doubled(-1);
  ASSERT_FALSE(failed.ok());
  ASSERT_EQ(failed.error().code(), ErrorCode::Invalid);
}

TEST_F(ResultTest, VoidResult) {
  ASSERT_TRUE(check_all(1, 2).ok());
  auto failed = check_all(1, 0);
  ASSERT_FALSE(failed.ok());
  ASSERT_EQ(failed.error().message(), "not positive");
}

} // namespace proteus
