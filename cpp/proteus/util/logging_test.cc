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

#include "proteus/util/logging.h"
#include "gtest/gtest.h"

namespace proteus {

TEST(LoggingTest, ParseLevel) {
  EXPECT_EQ(Logger::parse_level("trace"), LogLevel::TRACE);
  EXPECT_EQ(Logger::parse_level("DEBUG"), LogLevel::DEBUG);
  EXPECT_EQ(Logger::parse_level("Warning"), LogLevel::WARNING);
  EXPECT_EQ(Logger::parse_level("warn"), LogLevel::WARNING);
  EXPECT_EQ(Logger::parse_level("error"), LogLevel::ERROR);
  EXPECT_EQ(Logger::parse_level("fatal"), LogLevel::FATAL);
  EXPECT_EQ(Logger::parse_level("bogus"), LogLevel::INFO);
}

TEST(LoggingTest, ThresholdFiltersLowerLevels) {
  LogLevel saved = Logger::level();
  Logger::set_level(LogLevel::WARNING);
  EXPECT_FALSE(PROTEUS_LOG_ENABLED(INFO));
  EXPECT_TRUE(PROTEUS_LOG_ENABLED(WARNING));
  EXPECT_TRUE(PROTEUS_LOG_ENABLED(ERROR));

  int evaluated = 0;
  auto count = [&evaluated]() { return ++evaluated; };
  PROTEUS_LOG(DEBUG) << "skipped " << count();
  EXPECT_EQ(evaluated, 0);
  Logger::set_level(saved);
}

TEST(LoggingTest, LogStatementsStream) {
  LogLevel saved = Logger::level();
  Logger::set_level(LogLevel::TRACE);
  testing::internal::CaptureStderr();
  PROTEUS_LOG(INFO) << "action=\"build\" count=" << 3;
  std::string output = testing::internal::GetCapturedStderr();
  Logger::set_level(saved);
  EXPECT_NE(output.find("INFO logging_test.cc:"), std::string::npos);
  EXPECT_NE(output.find("action=\"build\" count=3"), std::string::npos);
}

TEST(LoggingDeathTest, CheckFailureAborts) {
  EXPECT_DEATH(PROTEUS_CHECK(1 + 1 == 3) << "arithmetic", "Check failed");
}

} // namespace proteus
