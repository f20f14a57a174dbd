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

#pragma once

#include <sstream>
#include <string>

#include "proteus/util/macros.h"

namespace proteus {

enum class LogLevel : int {
  TRACE = -2,
  DEBUG = -1,
  INFO = 0,
  WARNING = 1,
  ERROR = 2,
  FATAL = 3,
};

/// One log statement. The message is buffered and emitted to stderr as a
/// single line when the Logger is destroyed; FATAL aborts the process after
/// emitting.
class Logger {
public:
  Logger(const char *file, int line, LogLevel level);
  ~Logger();

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  template <typename T> Logger &operator<<(const T &t) {
    stream_ << t;
    return *this;
  }

  /// Threshold is read from PROTEUS_LOG_LEVEL on first use.
  static bool is_level_enabled(LogLevel level);
  static void set_level(LogLevel level);
  static LogLevel level();

  /// Parses trace|debug|info|warning|error|fatal; unknown names give INFO.
  static LogLevel parse_level(const std::string &name);

private:
  LogLevel level_;
  std::ostringstream stream_;
};

// Lets PROTEUS_CHECK be used as an expression whose streamed message is
// discarded when the condition holds.
class LogVoidify {
public:
  void operator&(const Logger &) {}
};

} // namespace proteus

#define PROTEUS_LOG_INTERNAL(level) ::proteus::Logger(__FILE__, __LINE__, level)

#define PROTEUS_LOG_ENABLED(level)                                             \
  ::proteus::Logger::is_level_enabled(::proteus::LogLevel::level)

#define PROTEUS_LOG(level)                                                     \
  !PROTEUS_LOG_ENABLED(level)                                                  \
      ? static_cast<void>(0)                                                   \
      : ::proteus::LogVoidify() &                                              \
            PROTEUS_LOG_INTERNAL(::proteus::LogLevel::level)

#define PROTEUS_CHECK(condition)                                               \
  (condition) ? static_cast<void>(0)                                           \
              : ::proteus::LogVoidify() &                                      \
                    PROTEUS_LOG_INTERNAL(::proteus::LogLevel::FATAL)           \
                        << " Check failed: " #condition " "
