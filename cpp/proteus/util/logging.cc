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

#include "proteus/util/logging.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace proteus {

namespace {

const char *level_name(LogLevel level) {
  switch (level) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARNING:
    return "WARNING";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::FATAL:
    return "FATAL";
  }
  return "UNKNOWN";
}

std::atomic<int> &threshold() {
  static std::atomic<int> value([] {
    const char *env = std::getenv("PROTEUS_LOG_LEVEL");
    if (env == nullptr) {
      return static_cast<int>(LogLevel::INFO);
    }
    return static_cast<int>(Logger::parse_level(env));
  }());
  return value;
}

// Strip directories so lines read "file.cc:42".
const char *base_name(const char *file) {
  const char *base = file;
  for (const char *p = file; *p != '\0'; ++p) {
    if (*p == '/' || *p == '\\') {
      base = p + 1;
    }
  }
  return base;
}

} // namespace

Logger::Logger(const char *file, int line, LogLevel level) : level_(level) {
  auto now = std::chrono::system_clock::now();
  std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now.time_since_epoch())
                    .count() %
                1000;
  std::tm tm_buf{};
#if defined(_WIN32)
  localtime_s(&tm_buf, &seconds);
#else
  localtime_r(&seconds, &tm_buf);
#endif
  stream_ << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << ","
          << std::setw(3) << std::setfill('0') << millis << " "
          << level_name(level) << " " << base_name(file) << ":" << line
          << "] ";
}

Logger::~Logger() {
  stream_ << '\n';
  std::cerr << stream_.str();
  if (level_ == LogLevel::FATAL) {
    std::cerr.flush();
    std::abort();
  }
}

bool Logger::is_level_enabled(LogLevel level) {
  return static_cast<int>(level) >= threshold().load(std::memory_order_relaxed);
}

void Logger::set_level(LogLevel level) {
  threshold().store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel Logger::level() {
  return static_cast<LogLevel>(threshold().load(std::memory_order_relaxed));
}

LogLevel Logger::parse_level(const std::string &name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "trace") {
    return LogLevel::TRACE;
  }
  if (lower == "debug") {
    return LogLevel::DEBUG;
  }
  if (lower == "warning" || lower == "warn") {
    return LogLevel::WARNING;
  }
  if (lower == "error") {
    return LogLevel::ERROR;
  }
  if (lower == "fatal") {
    return LogLevel::FATAL;
  }
  return LogLevel::INFO;
}

} // namespace proteus
