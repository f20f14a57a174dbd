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

#include <cstddef>
#include <memory>
#include <ostream>
#include <string>
#include <utility>

namespace proteus {

/// Error codes for Proteus operations.
enum class ErrorCode : char {
  OK = 0,
  NotSerializable = 1,
  ClassNotFound = 2,
  CarpentryError = 3,
  NotWhitelisted = 4,
  DescriptorNotFound = 5,
  Unsupported = 6,
  InvalidData = 7,
  BufferOutOfBound = 8,
  TypeMismatch = 9,
  UnknownEnum = 10,
  DepthExceed = 11,
  Invalid = 12,
  KeyError = 13,
  UnknownError = 14,
};

/// Error class for every fallible Proteus operation.
///
/// Always create errors through the static factory functions:
///
/// ```cpp
/// auto err = Error::not_serializable("Serializer does not support synthetic "
///                                    "classes");
/// auto err = Error::class_not_found("com.example.Foo");
/// ```
///
/// The error kinds that matter to the serializer factory:
/// - Error::not_serializable() - a type can never be serialized, or a remote
///   type could not be reconstructed
/// - Error::class_not_found() - a name is unknown to the class loader; the
///   trigger for carpentry
/// - Error::carpentry_error() - type synthesis failed; never leaves the remote
///   type resolver
/// - Error::not_whitelisted() - security rejection, always surfaced verbatim
/// - Error::descriptor_not_found() - a schema did not describe the requested
///   descriptor
/// - Error::unsupported() - unsupported map/collection implementation or
///   operation
class Error {
public:
  static Error not_serializable(const std::string &msg) {
    return Error(ErrorCode::NotSerializable, msg);
  }

  static Error class_not_found(const std::string &class_name) {
    return Error(ErrorCode::ClassNotFound, class_name);
  }

  static Error carpentry_error(const std::string &msg) {
    return Error(ErrorCode::CarpentryError, msg);
  }

  static Error not_whitelisted(const std::string &msg) {
    return Error(ErrorCode::NotWhitelisted, msg);
  }

  static Error descriptor_not_found(const std::string &descriptor) {
    return Error(ErrorCode::DescriptorNotFound,
                 "Could not find type matching descriptor " + descriptor +
                     ".");
  }

  static Error unsupported(const std::string &msg) {
    return Error(ErrorCode::Unsupported, msg);
  }

  static Error invalid_data(const std::string &msg) {
    return Error(ErrorCode::InvalidData, msg);
  }

  static Error buffer_out_of_bound(size_t offset, size_t length,
                                   size_t capacity) {
    return Error(ErrorCode::BufferOutOfBound,
                 "Buffer out of bound: " + std::to_string(offset) + " + " +
                     std::to_string(length) + " > " + std::to_string(capacity));
  }

  static Error type_mismatch(const std::string &msg) {
    return Error(ErrorCode::TypeMismatch, msg);
  }

  static Error unknown_enum(const std::string &msg) {
    return Error(ErrorCode::UnknownEnum, msg);
  }

  static Error depth_exceed(const std::string &msg) {
    return Error(ErrorCode::DepthExceed, msg);
  }

  static Error invalid(const std::string &msg) {
    return Error(ErrorCode::Invalid, msg);
  }

  static Error key_error(const std::string &msg) {
    return Error(ErrorCode::KeyError, msg);
  }

  static Error unknown(const std::string &msg) {
    return Error(ErrorCode::UnknownError, msg);
  }

  ErrorCode code() const { return state_->code_; }
  const std::string &message() const { return state_->msg_; }

  bool is_class_not_found() const {
    return state_->code_ == ErrorCode::ClassNotFound;
  }

  /// Returns "<code>: <message>".
  std::string to_string() const;

  std::string code_as_string() const;

  static ErrorCode string_to_code(const std::string &str);

  Error(const Error &other) : state_(new ErrorState(*other.state_)) {}
  Error(Error &&) noexcept = default;
  Error &operator=(const Error &other) {
    if (this != &other) {
      state_.reset(new ErrorState(*other.state_));
    }
    return *this;
  }
  Error &operator=(Error &&) noexcept = default;

  ~Error() = default;

private:
  // Kept behind a pointer so Result<T, Error> stays small.
  struct ErrorState {
    ErrorCode code_;
    std::string msg_;

    ErrorState(ErrorCode code, std::string msg)
        : code_(code), msg_(std::move(msg)) {}
  };

  Error(ErrorCode code, std::string msg)
      : state_(new ErrorState(code, std::move(msg))) {}

  std::unique_ptr<ErrorState> state_;
};

inline std::ostream &operator<<(std::ostream &os, const Error &e) {
  return os << e.to_string();
}

} // namespace proteus
