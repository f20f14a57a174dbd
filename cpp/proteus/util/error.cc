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

#include <array>
#include <string>
#include <utility>

#include "absl/container/flat_hash_map.h"

namespace proteus {

namespace {

constexpr std::array<std::pair<ErrorCode, const char *>, 15> kCodeNames = {{
    {ErrorCode::OK, "OK"},
    {ErrorCode::NotSerializable, "Not serializable"},
    {ErrorCode::ClassNotFound, "Class not found"},
    {ErrorCode::CarpentryError, "Carpentry error"},
    {ErrorCode::NotWhitelisted, "Not whitelisted"},
    {ErrorCode::DescriptorNotFound, "Descriptor not found"},
    {ErrorCode::Unsupported, "Unsupported"},
    {ErrorCode::InvalidData, "Invalid data"},
    {ErrorCode::BufferOutOfBound, "Buffer out of bound"},
    {ErrorCode::TypeMismatch, "Type mismatch"},
    {ErrorCode::UnknownEnum, "Unknown enum"},
    {ErrorCode::DepthExceed, "Depth exceed"},
    {ErrorCode::Invalid, "Invalid"},
    {ErrorCode::KeyError, "Key error"},
    {ErrorCode::UnknownError, "Unknown error"},
}};

} // namespace

std::string Error::to_string() const {
  std::string result = code_as_string();
  if (!state_->msg_.empty()) {
    result += ": ";
    result += state_->msg_;
  }
  return result;
}

std::string Error::code_as_string() const {
  for (const auto &entry : kCodeNames) {
    if (entry.first == state_->code_) {
      return entry.second;
    }
  }
  return "Unknown error";
}

ErrorCode Error::string_to_code(const std::string &str) {
  static const absl::flat_hash_map<std::string, ErrorCode> str_to_code = [] {
    absl::flat_hash_map<std::string, ErrorCode> m;
    for (const auto &entry : kCodeNames) {
      m.emplace(entry.second, entry.first);
    }
    return m;
  }();

  auto it = str_to_code.find(str);
  if (it == str_to_code.end()) {
    return ErrorCode::UnknownError;
  }
  return it->second;
}

} // namespace proteus
