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
#include <optional>
#include <string>
#include <vector>

#include "proteus/type/primitive.h"
#include "proteus/type/value.h"
#include "proteus/util/buffer.h"
#include "proteus/util/error.h"
#include "proteus/util/result.h"

namespace proteus {
namespace serialization {

/// Writes AMQP 1.0 encoded values into a Buffer.
///
/// Only the fixed-width 32 bit variants of the variable-width encodings are
/// produced (str32, sym32, vbin32, list32, map32). Compound values are
/// written by opening them with `begin_list`/`begin_map`, writing the
/// elements and closing them with the element count, which back-patches
/// the size and count fields.
class Encoder {
public:
  explicit Encoder(Buffer &buffer) : buffer_(buffer) {}

  Buffer &buffer() { return buffer_; }

  void write_null() { write_code(FormatCode::NULL_VALUE); }
  void write_boolean(bool value) {
    write_code(value ? FormatCode::BOOLEAN_TRUE : FormatCode::BOOLEAN_FALSE);
  }
  void write_byte(int8_t value);
  void write_ubyte(uint8_t value);
  void write_short(int16_t value);
  void write_ushort(uint16_t value);
  void write_int(int32_t value);
  void write_uint(uint32_t value);
  void write_long(int64_t value);
  void write_ulong(uint64_t value);
  void write_float(float value);
  void write_double(double value);
  void write_char(uint32_t value);
  void write_timestamp(int64_t millis);
  void write_uuid(const Uuid &value);
  void write_binary(const std::vector<uint8_t> &value);
  void write_string(const std::string &value);
  void write_symbol(const std::string &value);

  /// Writes the descriptor prefix of a described value. The described value
  /// itself must follow.
  void write_described(const std::string &descriptor);

  /// Opens a list and returns the offset to pass to `end_list`.
  uint32_t begin_list();
  void end_list(uint32_t start, uint32_t count);

  /// Opens a map and returns the offset to pass to `end_map`.
  uint32_t begin_map();
  /// `entries` counts key/value pairs.
  void end_map(uint32_t start, uint32_t entries);

  /// Writes a null or primitive value, choosing the encoding from its kind.
  Result<void, Error> write_primitive(const Value &value);

  void write_optional_string(const std::optional<std::string> &value) {
    if (value.has_value()) {
      write_string(*value);
    } else {
      write_null();
    }
  }

private:
  void write_code(FormatCode code) {
    buffer_.write_uint8(static_cast<uint8_t>(code));
  }

  uint32_t begin_compound(FormatCode code);
  void end_compound(uint32_t start, uint32_t count);

  Buffer &buffer_;
};

/// Reads AMQP 1.0 encoded values from a Buffer.
///
/// Besides the encodings the Encoder writes, the short forms of strings,
/// symbols, binaries, lists and maps (str8, sym8, vbin8, list0, list8,
/// map8) and the compact integer forms are accepted.
class Decoder {
public:
  explicit Decoder(Buffer &buffer) : buffer_(buffer) {}

  Buffer &buffer() { return buffer_; }

  Result<uint8_t, Error> peek_format_code() const {
    return buffer_.peek_uint8();
  }

  /// Consumes a null if one is next.
  Result<bool, Error> read_null_if_present();

  /// Whether a described value is next.
  Result<bool, Error> next_is_described() const;

  /// Reads the descriptor prefix of a described value.
  Result<std::string, Error> read_descriptor();

  /// Reads a list header and returns the element count.
  Result<uint32_t, Error> read_list_header();

  /// Reads a map header and returns the number of key/value pairs.
  Result<uint32_t, Error> read_map_header();

  Result<bool, Error> read_boolean();
  Result<int64_t, Error> read_long();
  Result<uint64_t, Error> read_ulong();
  Result<std::string, Error> read_string();
  Result<std::string, Error> read_symbol();
  Result<std::optional<std::string>, Error> read_optional_string();

  /// Reads a null or primitive value.
  Result<Value, Error> read_primitive();

  /// Steps over the next value, described values included.
  Result<void, Error> skip_value();

private:
  Result<uint32_t, Error> read_variable_length(uint8_t code);

  Buffer &buffer_;
};

/// Format code name for diagnostics, e.g. "0x71".
std::string format_code_name(uint8_t code);

} // namespace serialization
} // namespace proteus
