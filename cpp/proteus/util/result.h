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

#include "proteus/util/error.h"
#include "proteus/util/logging.h"
#include "proteus/util/macros.h"

#include <new>
#include <ostream>
#include <type_traits>
#include <utility>

namespace proteus {

/// Wraps an error so it can be returned where a Result is expected, like
/// std::unexpected in C++23.
template <typename E> class Unexpected {
public:
  explicit Unexpected(const E &e) : error_(e) {}
  explicit Unexpected(E &&e) : error_(std::move(e)) {}

  const E &error() const & { return error_; }
  E &error() & { return error_; }
  E &&error() && { return std::move(error_); }

private:
  E error_;
};

/// Result<T, E> holds either a value of T or an error of E.
///
/// ```cpp
/// Result<Type, Error> parse(const std::string &name) {
///   if (name.empty()) {
///     return Unexpected(Error::invalid("empty type name"));
///   }
///   return Type::wildcard();
/// }
/// ```
template <typename T, typename E> class Result {
private:
  union Storage {
    T value_;
    E error_;

    Storage() {}
    ~Storage() {}
  };

  Storage storage_;
  bool has_value_;

  void destroy() {
    if (has_value_) {
      storage_.value_.~T();
    } else {
      storage_.error_.~E();
    }
  }

  void construct_from(const Result &other) {
    if (has_value_) {
      new (&storage_.value_) T(other.storage_.value_);
    } else {
      new (&storage_.error_) E(other.storage_.error_);
    }
  }

  void construct_from(Result &&other) {
    if (has_value_) {
      new (&storage_.value_) T(std::move(other.storage_.value_));
    } else {
      new (&storage_.error_) E(std::move(other.storage_.error_));
    }
  }

public:
  using value_type = T;
  using error_type = E;

  Result(const T &value) : has_value_(true) { new (&storage_.value_) T(value); }

  Result(T &&value) : has_value_(true) {
    new (&storage_.value_) T(std::move(value));
  }

  /// Converting construction, e.g. Result<shared_ptr<Base>> from
  /// shared_ptr<Derived>.
  template <typename U,
            typename = std::enable_if_t<
                !std::is_same_v<std::decay_t<U>, T> &&
                !std::is_same_v<std::decay_t<U>, Result> &&
                !std::is_same_v<std::decay_t<U>, Unexpected<E>> &&
                std::is_constructible_v<T, U &&>>>
  Result(U &&value) : has_value_(true) {
    new (&storage_.value_) T(std::forward<U>(value));
  }

  Result(const Unexpected<E> &unexpected) : has_value_(false) {
    new (&storage_.error_) E(unexpected.error());
  }

  Result(Unexpected<E> &&unexpected) : has_value_(false) {
    new (&storage_.error_) E(std::move(unexpected).error());
  }

  ~Result() { destroy(); }

  Result(const Result &other) : has_value_(other.has_value_) {
    construct_from(other);
  }

  Result(Result &&other) noexcept(
      std::is_nothrow_move_constructible<T>::value &&
      std::is_nothrow_move_constructible<E>::value)
      : has_value_(other.has_value_) {
    construct_from(std::move(other));
  }

  Result &operator=(const Result &other) {
    if (this != &other) {
      destroy();
      has_value_ = other.has_value_;
      construct_from(other);
    }
    return *this;
  }

  Result &operator=(Result &&other) noexcept(
      std::is_nothrow_move_constructible<T>::value &&
      std::is_nothrow_move_constructible<E>::value) {
    if (this != &other) {
      destroy();
      has_value_ = other.has_value_;
      construct_from(std::move(other));
    }
    return *this;
  }

  constexpr bool has_value() const noexcept { return has_value_; }
  constexpr bool ok() const noexcept { return has_value_; }
  constexpr explicit operator bool() const noexcept { return has_value_; }

  T &value() & {
    PROTEUS_CHECK(has_value_) << "Cannot access value of error Result: "
                              << storage_.error_.to_string();
    return storage_.value_;
  }

  const T &value() const & {
    PROTEUS_CHECK(has_value_) << "Cannot access value of error Result: "
                              << storage_.error_.to_string();
    return storage_.value_;
  }

  T &&value() && {
    PROTEUS_CHECK(has_value_) << "Cannot access value of error Result: "
                              << storage_.error_.to_string();
    return std::move(storage_.value_);
  }

  template <typename U> T value_or(U &&default_value) const & {
    return has_value_ ? storage_.value_
                      : static_cast<T>(std::forward<U>(default_value));
  }

  E &error() & {
    PROTEUS_CHECK(!has_value_) << "Cannot access error of successful Result";
    return storage_.error_;
  }

  const E &error() const & {
    PROTEUS_CHECK(!has_value_) << "Cannot access error of successful Result";
    return storage_.error_;
  }

  E &&error() && {
    PROTEUS_CHECK(!has_value_) << "Cannot access error of successful Result";
    return std::move(storage_.error_);
  }

  T &operator*() & { return value(); }
  const T &operator*() const & { return value(); }
  T *operator->() { return &value(); }
  const T *operator->() const { return &value(); }
};

/// Result<void, E> - success carries no value.
template <typename E> class Result<void, E> {
private:
  union Storage {
    char dummy_;
    E error_;

    Storage() : dummy_(0) {}
    ~Storage() {}
  };

  Storage storage_;
  bool has_value_;

  void destroy() {
    if (!has_value_) {
      storage_.error_.~E();
    }
  }

public:
  using error_type = E;

  Result() : has_value_(true) {}

  Result(const Unexpected<E> &unexpected) : has_value_(false) {
    new (&storage_.error_) E(unexpected.error());
  }

  Result(Unexpected<E> &&unexpected) : has_value_(false) {
    new (&storage_.error_) E(std::move(unexpected).error());
  }

  ~Result() { destroy(); }

  Result(const Result &other) : has_value_(other.has_value_) {
    if (!has_value_) {
      new (&storage_.error_) E(other.storage_.error_);
    }
  }

  Result(Result &&other) noexcept(std::is_nothrow_move_constructible<E>::value)
      : has_value_(other.has_value_) {
    if (!has_value_) {
      new (&storage_.error_) E(std::move(other.storage_.error_));
    }
  }

  Result &operator=(const Result &other) {
    if (this != &other) {
      destroy();
      has_value_ = other.has_value_;
      if (!has_value_) {
        new (&storage_.error_) E(other.storage_.error_);
      }
    }
    return *this;
  }

  Result &operator=(Result &&other) noexcept(
      std::is_nothrow_move_constructible<E>::value) {
    if (this != &other) {
      destroy();
      has_value_ = other.has_value_;
      if (!has_value_) {
        new (&storage_.error_) E(std::move(other.storage_.error_));
      }
    }
    return *this;
  }

  constexpr bool has_value() const noexcept { return has_value_; }
  constexpr bool ok() const noexcept { return has_value_; }
  constexpr explicit operator bool() const noexcept { return has_value_; }

  E &error() & {
    PROTEUS_CHECK(!has_value_) << "Cannot access error of successful Result";
    return storage_.error_;
  }

  const E &error() const & {
    PROTEUS_CHECK(!has_value_) << "Cannot access error of successful Result";
    return storage_.error_;
  }

  E &&error() && {
    PROTEUS_CHECK(!has_value_) << "Cannot access error of successful Result";
    return std::move(storage_.error_);
  }
};

template <typename E> Unexpected(E) -> Unexpected<E>;

} // namespace proteus

// Propagate the error of an expression returning Result.
#define PROTEUS_RETURN_NOT_OK(expr)                                            \
  do {                                                                         \
    auto _result = (expr);                                                     \
    if (PROTEUS_PREDICT_FALSE(!_result.ok())) {                                \
      return ::proteus::Unexpected(std::move(_result).error());                \
    }                                                                          \
  } while (0)

#define PROTEUS_CHECK_OK_PREPEND(expr, msg)                                    \
  do {                                                                         \
    auto _result = (expr);                                                     \
    PROTEUS_CHECK(_result.ok()) << (msg) << ": "                               \
                                << _result.error().to_string();                \
  } while (0)

#define PROTEUS_CHECK_OK(expr) PROTEUS_CHECK_OK_PREPEND(expr, "Bad result")

#define PROTEUS_ASSIGN_OR_RETURN(lhs, rexpr)                                   \
  do {                                                                         \
    auto _result = (rexpr);                                                    \
    if (PROTEUS_PREDICT_FALSE(!_result.ok())) {                                \
      return ::proteus::Unexpected(std::move(_result).error());                \
    }                                                                          \
    lhs = std::move(_result).value();                                          \
  } while (0)

// Declares `var` holding the value of `expr`, or returns its error.
#define PROTEUS_TRY(var, expr)                                                 \
  auto _result_##var = (expr);                                                 \
  if (PROTEUS_PREDICT_FALSE(!_result_##var.ok())) {                            \
    return ::proteus::Unexpected(std::move(_result_##var).error());            \
  }                                                                            \
  auto var = std::move(_result_##var).value()

namespace proteus {

template <typename T, typename E>
inline std::ostream &operator<<(std::ostream &os, const Result<T, E> &r) {
  if (r.ok()) {
    return os << "Ok(" << r.value() << ")";
  }
  return os << "Err(" << r.error() << ")";
}

template <typename E>
inline std::ostream &operator<<(std::ostream &os, const Result<void, E> &r) {
  if (r.ok()) {
    return os << "Ok()";
  }
  return os << "Err(" << r.error() << ")";
}

} // namespace proteus
