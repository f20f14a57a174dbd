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

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include "proteus/util/error.h"
#include "proteus/util/logging.h"
#include "proteus/util/macros.h"
#include "proteus/util/result.h"

namespace proteus {

namespace detail {

template <typename T> PROTEUS_ALWAYS_INLINE T to_big_endian(T value) {
#if PROTEUS_LITTLE_ENDIAN
  if constexpr (sizeof(T) == 2) {
    return static_cast<T>(PROTEUS_BYTE_SWAP16(static_cast<uint16_t>(value)));
  } else if constexpr (sizeof(T) == 4) {
    return static_cast<T>(PROTEUS_BYTE_SWAP32(static_cast<uint32_t>(value)));
  } else if constexpr (sizeof(T) == 8) {
    return static_cast<T>(PROTEUS_BYTE_SWAP64(static_cast<uint64_t>(value)));
  } else {
    return value;
  }
#else
  return value;
#endif
}

} // namespace detail

// A byte buffer with independent reader and writer indices. Multi-byte values
// are stored in network (big-endian) order as the AMQP encoding requires.
//
// A default constructed buffer owns a growable storage; a buffer constructed
// over external bytes is a read-only view that never grows.
class Buffer {
public:
  Buffer() : data_(nullptr), size_(0), writer_index_(0), reader_index_(0) {}

  Buffer(const uint8_t *data, uint32_t size)
      : data_(const_cast<uint8_t *>(data)), size_(size), writer_index_(size),
        reader_index_(0), read_only_(true) {}

  Buffer(const Buffer &) = delete;
  Buffer &operator=(const Buffer &) = delete;

  PROTEUS_ALWAYS_INLINE const uint8_t *data() const { return data_; }

  PROTEUS_ALWAYS_INLINE uint32_t size() const { return size_; }

  PROTEUS_ALWAYS_INLINE uint32_t writer_index() const { return writer_index_; }

  PROTEUS_ALWAYS_INLINE uint32_t reader_index() const { return reader_index_; }

  PROTEUS_ALWAYS_INLINE uint32_t remaining_size() const {
    return writer_index_ - reader_index_;
  }

  /// Move the reader to an absolute position previously obtained from
  /// reader_index().
  Result<void, Error> seek(uint32_t reader_index) {
    if (reader_index > writer_index_) {
      return Unexpected(
          Error::buffer_out_of_bound(reader_index, 0, writer_index_));
    }
    reader_index_ = reader_index;
    return Result<void, Error>();
  }

  // ===========================================================================
  // Write methods. The buffer grows as needed.
  // ===========================================================================

  PROTEUS_ALWAYS_INLINE void write_uint8(uint8_t value) {
    grow(1);
    data_[writer_index_++] = value;
  }

  PROTEUS_ALWAYS_INLINE void write_int8(int8_t value) {
    write_uint8(static_cast<uint8_t>(value));
  }

  PROTEUS_ALWAYS_INLINE void write_uint16(uint16_t value) {
    write_fixed(value);
  }

  PROTEUS_ALWAYS_INLINE void write_int16(int16_t value) { write_fixed(value); }

  PROTEUS_ALWAYS_INLINE void write_uint32(uint32_t value) {
    write_fixed(value);
  }

  PROTEUS_ALWAYS_INLINE void write_int32(int32_t value) { write_fixed(value); }

  PROTEUS_ALWAYS_INLINE void write_uint64(uint64_t value) {
    write_fixed(value);
  }

  PROTEUS_ALWAYS_INLINE void write_int64(int64_t value) { write_fixed(value); }

  PROTEUS_ALWAYS_INLINE void write_float(float value) {
    uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    write_fixed(bits);
  }

  PROTEUS_ALWAYS_INLINE void write_double(double value) {
    uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    write_fixed(bits);
  }

  PROTEUS_ALWAYS_INLINE void write_bytes(const void *data, uint32_t length) {
    if (length == 0) {
      return;
    }
    grow(length);
    std::memcpy(data_ + writer_index_, data, length);
    writer_index_ += length;
  }

  /// Overwrite four bytes at an absolute offset, used to back-patch sizes.
  void put_uint32(uint32_t offset, uint32_t value) {
    PROTEUS_CHECK(offset + 4 <= writer_index_)
        << "Out of range " << offset << " should be less than "
        << writer_index_;
    uint32_t be = detail::to_big_endian(value);
    std::memcpy(data_ + offset, &be, sizeof(be));
  }

  // ===========================================================================
  // Read methods with bounds checking.
  // ===========================================================================

  Result<uint8_t, Error> read_uint8() {
    if (PROTEUS_PREDICT_FALSE(reader_index_ + 1 > writer_index_)) {
      return Unexpected(
          Error::buffer_out_of_bound(reader_index_, 1, writer_index_));
    }
    return data_[reader_index_++];
  }

  Result<uint8_t, Error> peek_uint8() const {
    if (PROTEUS_PREDICT_FALSE(reader_index_ + 1 > writer_index_)) {
      return Unexpected(
          Error::buffer_out_of_bound(reader_index_, 1, writer_index_));
    }
    return data_[reader_index_];
  }

  Result<int8_t, Error> read_int8() {
    PROTEUS_TRY(value, read_uint8());
    return static_cast<int8_t>(value);
  }

  Result<uint16_t, Error> read_uint16() { return read_fixed<uint16_t>(); }

  Result<int16_t, Error> read_int16() { return read_fixed<int16_t>(); }

  Result<uint32_t, Error> read_uint32() { return read_fixed<uint32_t>(); }

  Result<int32_t, Error> read_int32() { return read_fixed<int32_t>(); }

  Result<uint64_t, Error> read_uint64() { return read_fixed<uint64_t>(); }

  Result<int64_t, Error> read_int64() { return read_fixed<int64_t>(); }

  Result<float, Error> read_float() {
    PROTEUS_TRY(bits, read_fixed<uint32_t>());
    float value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
  }

  Result<double, Error> read_double() {
    PROTEUS_TRY(bits, read_fixed<uint64_t>());
    double value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
  }

  Result<void, Error> read_bytes(void *data, uint32_t length) {
    PROTEUS_RETURN_NOT_OK(check_readable(length));
    if (length > 0) {
      std::memcpy(data, data_ + reader_index_, length);
    }
    reader_index_ += length;
    return Result<void, Error>();
  }

  Result<std::string, Error> read_string(uint32_t length) {
    PROTEUS_RETURN_NOT_OK(check_readable(length));
    std::string value(reinterpret_cast<const char *>(data_ + reader_index_),
                      length);
    reader_index_ += length;
    return value;
  }

  Result<void, Error> skip(uint32_t length) {
    PROTEUS_RETURN_NOT_OK(check_readable(length));
    reader_index_ += length;
    return Result<void, Error>();
  }

  /// Copy of the written bytes.
  std::vector<uint8_t> to_vector() const {
    return std::vector<uint8_t>(data_, data_ + writer_index_);
  }

  std::string hex() const;

  ~Buffer() {
    if (!read_only_) {
      std::free(data_);
    }
  }

private:
  template <typename T> PROTEUS_ALWAYS_INLINE void write_fixed(T value) {
    grow(sizeof(T));
    T be = detail::to_big_endian(value);
    std::memcpy(data_ + writer_index_, &be, sizeof(T));
    writer_index_ += sizeof(T);
  }

  template <typename T> Result<T, Error> read_fixed() {
    if (PROTEUS_PREDICT_FALSE(reader_index_ + sizeof(T) > writer_index_)) {
      return Unexpected(
          Error::buffer_out_of_bound(reader_index_, sizeof(T), writer_index_));
    }
    T be;
    std::memcpy(&be, data_ + reader_index_, sizeof(T));
    reader_index_ += sizeof(T);
    return detail::to_big_endian(be);
  }

  PROTEUS_ALWAYS_INLINE Result<void, Error> check_readable(uint32_t length) {
    if (PROTEUS_PREDICT_FALSE(static_cast<uint64_t>(reader_index_) + length >
                              writer_index_)) {
      return Unexpected(
          Error::buffer_out_of_bound(reader_index_, length, writer_index_));
    }
    return Result<void, Error>();
  }

  void grow(uint32_t min_capacity);

  uint8_t *data_;
  uint32_t size_;
  uint32_t writer_index_;
  uint32_t reader_index_;
  bool read_only_ = false;
};

} // namespace proteus
