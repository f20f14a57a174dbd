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

#include "proteus/serialization/codec.h"

#include <cstdio>

#include "absl/strings/str_cat.h"

namespace proteus {
namespace serialization {

namespace {

// Compact encodings only the Decoder understands.
constexpr uint8_t kUint0 = 0x43;
constexpr uint8_t kUlong0 = 0x44;
constexpr uint8_t kList0 = 0x45;
constexpr uint8_t kSmallUint = 0x52;
constexpr uint8_t kSmallUlong = 0x53;
constexpr uint8_t kSmallInt = 0x54;
constexpr uint8_t kSmallLong = 0x55;
constexpr uint8_t kBoolean = 0x56;
constexpr uint8_t kVbin8 = 0xa0;
constexpr uint8_t kStr8 = 0xa1;
constexpr uint8_t kSym8 = 0xa3;
constexpr uint8_t kList8 = 0xc0;
constexpr uint8_t kMap8 = 0xc1;

constexpr uint8_t code(FormatCode c) { return static_cast<uint8_t>(c); }

Error unexpected_code(const char *expected, uint8_t found) {
  return Error::invalid_data(absl::StrCat("Expected ", expected,
                                          " but found format code ",
                                          format_code_name(found)));
}

} // namespace

std::string format_code_name(uint8_t value) {
  char text[5];
  std::snprintf(text, sizeof(text), "0x%02x", value);
  return text;
}

// ============================================================================
// Encoder
// ============================================================================

void Encoder::write_byte(int8_t value) {
  write_code(FormatCode::BYTE);
  buffer_.write_int8(value);
}

void Encoder::write_ubyte(uint8_t value) {
  write_code(FormatCode::UBYTE);
  buffer_.write_uint8(value);
}

void Encoder::write_short(int16_t value) {
  write_code(FormatCode::SHORT);
  buffer_.write_int16(value);
}

void Encoder::write_ushort(uint16_t value) {
  write_code(FormatCode::USHORT);
  buffer_.write_uint16(value);
}

void Encoder::write_int(int32_t value) {
  write_code(FormatCode::INT);
  buffer_.write_int32(value);
}

void Encoder::write_uint(uint32_t value) {
  write_code(FormatCode::UINT);
  buffer_.write_uint32(value);
}

void Encoder::write_long(int64_t value) {
  write_code(FormatCode::LONG);
  buffer_.write_int64(value);
}

void Encoder::write_ulong(uint64_t value) {
  write_code(FormatCode::ULONG);
  buffer_.write_uint64(value);
}

void Encoder::write_float(float value) {
  write_code(FormatCode::FLOAT);
  buffer_.write_float(value);
}

void Encoder::write_double(double value) {
  write_code(FormatCode::DOUBLE);
  buffer_.write_double(value);
}

void Encoder::write_char(uint32_t value) {
  write_code(FormatCode::CHAR);
  buffer_.write_uint32(value);
}

void Encoder::write_timestamp(int64_t millis) {
  write_code(FormatCode::TIMESTAMP);
  buffer_.write_int64(millis);
}

void Encoder::write_uuid(const Uuid &value) {
  write_code(FormatCode::UUID);
  buffer_.write_uint64(value.most_significant);
  buffer_.write_uint64(value.least_significant);
}

void Encoder::write_binary(const std::vector<uint8_t> &value) {
  write_code(FormatCode::VBIN32);
  buffer_.write_uint32(static_cast<uint32_t>(value.size()));
  buffer_.write_bytes(value.data(), static_cast<uint32_t>(value.size()));
}

void Encoder::write_string(const std::string &value) {
  write_code(FormatCode::STR32);
  buffer_.write_uint32(static_cast<uint32_t>(value.size()));
  buffer_.write_bytes(value.data(), static_cast<uint32_t>(value.size()));
}

void Encoder::write_symbol(const std::string &value) {
  write_code(FormatCode::SYM32);
  buffer_.write_uint32(static_cast<uint32_t>(value.size()));
  buffer_.write_bytes(value.data(), static_cast<uint32_t>(value.size()));
}

void Encoder::write_described(const std::string &descriptor) {
  write_code(FormatCode::DESCRIBED);
  write_symbol(descriptor);
}

uint32_t Encoder::begin_compound(FormatCode format) {
  write_code(format);
  uint32_t start = buffer_.writer_index();
  // size and count, patched by end_compound
  buffer_.write_uint32(0);
  buffer_.write_uint32(0);
  return start;
}

void Encoder::end_compound(uint32_t start, uint32_t count) {
  // The size covers the count field and the elements.
  buffer_.put_uint32(start, buffer_.writer_index() - start - 4);
  buffer_.put_uint32(start + 4, count);
}

uint32_t Encoder::begin_list() { return begin_compound(FormatCode::LIST32); }

void Encoder::end_list(uint32_t start, uint32_t count) {
  end_compound(start, count);
}

uint32_t Encoder::begin_map() { return begin_compound(FormatCode::MAP32); }

void Encoder::end_map(uint32_t start, uint32_t entries) {
  end_compound(start, entries * 2);
}

Result<void, Error> Encoder::write_primitive(const Value &value) {
  switch (value.kind()) {
  case ValueKind::Null:
    write_null();
    break;
  case ValueKind::Boolean:
    write_boolean(value.as_boolean());
    break;
  case ValueKind::Byte:
    write_byte(static_cast<int8_t>(value.as_int64()));
    break;
  case ValueKind::UByte:
    write_ubyte(static_cast<uint8_t>(value.as_uint64()));
    break;
  case ValueKind::Short:
    write_short(static_cast<int16_t>(value.as_int64()));
    break;
  case ValueKind::UShort:
    write_ushort(static_cast<uint16_t>(value.as_uint64()));
    break;
  case ValueKind::Int:
    write_int(static_cast<int32_t>(value.as_int64()));
    break;
  case ValueKind::UInt:
    write_uint(static_cast<uint32_t>(value.as_uint64()));
    break;
  case ValueKind::Long:
    write_long(value.as_int64());
    break;
  case ValueKind::ULong:
    write_ulong(value.as_uint64());
    break;
  case ValueKind::Float:
    write_float(value.as_float());
    break;
  case ValueKind::Double:
    write_double(value.as_double());
    break;
  case ValueKind::Char:
    write_char(static_cast<uint32_t>(value.as_uint64()));
    break;
  case ValueKind::Timestamp:
    write_timestamp(value.as_int64());
    break;
  case ValueKind::Uuid:
    write_uuid(value.as_uuid());
    break;
  case ValueKind::Binary:
    write_binary(value.as_binary());
    break;
  case ValueKind::String:
    write_string(value.as_string());
    break;
  case ValueKind::Symbol:
    write_symbol(value.as_string());
    break;
  default:
    return Unexpected(Error::invalid(absl::StrCat(
        "Value of kind ", value_kind_name(value.kind()), " is not primitive")));
  }
  return Result<void, Error>();
}

// ============================================================================
// Decoder
// ============================================================================

Result<bool, Error> Decoder::read_null_if_present() {
  PROTEUS_TRY(next, buffer_.peek_uint8());
  if (next != code(FormatCode::NULL_VALUE)) {
    return false;
  }
  PROTEUS_RETURN_NOT_OK(buffer_.skip(1));
  return true;
}

Result<bool, Error> Decoder::next_is_described() const {
  PROTEUS_TRY(next, buffer_.peek_uint8());
  return next == code(FormatCode::DESCRIBED);
}

Result<std::string, Error> Decoder::read_descriptor() {
  PROTEUS_TRY(format, buffer_.read_uint8());
  if (format != code(FormatCode::DESCRIBED)) {
    return Unexpected(unexpected_code("a described value", format));
  }
  return read_symbol();
}

Result<uint32_t, Error> Decoder::read_list_header() {
  PROTEUS_TRY(format, buffer_.read_uint8());
  uint32_t count = 0;
  switch (format) {
  case kList0:
    return 0u;
  case kList8: {
    PROTEUS_RETURN_NOT_OK(buffer_.skip(1));
    PROTEUS_TRY(small_count, buffer_.read_uint8());
    count = small_count;
    break;
  }
  case code(FormatCode::LIST32): {
    PROTEUS_RETURN_NOT_OK(buffer_.skip(4));
    PROTEUS_ASSIGN_OR_RETURN(count, buffer_.read_uint32());
    break;
  }
  default:
    return Unexpected(unexpected_code("a list", format));
  }
  // Every element occupies at least one byte.
  if (count > buffer_.remaining_size()) {
    return Unexpected(Error::invalid_data(
        absl::StrCat("List count ", count, " exceeds the ",
                     buffer_.remaining_size(), " remaining bytes")));
  }
  return count;
}

Result<uint32_t, Error> Decoder::read_map_header() {
  PROTEUS_TRY(format, buffer_.read_uint8());
  uint32_t count = 0;
  if (format == kMap8) {
    PROTEUS_RETURN_NOT_OK(buffer_.skip(1));
    PROTEUS_TRY(small_count, buffer_.read_uint8());
    count = small_count;
  } else if (format == code(FormatCode::MAP32)) {
    PROTEUS_RETURN_NOT_OK(buffer_.skip(4));
    PROTEUS_ASSIGN_OR_RETURN(count, buffer_.read_uint32());
  } else {
    return Unexpected(unexpected_code("a map", format));
  }
  if (count % 2 != 0) {
    return Unexpected(Error::invalid_data(
        absl::StrCat("Map with an odd element count ", count)));
  }
  // Each entry occupies at least one byte for its key and one for its value.
  if (count > buffer_.remaining_size()) {
    return Unexpected(Error::invalid_data(
        absl::StrCat("Map entry count ", count / 2, " exceeds the ",
                     buffer_.remaining_size(), " remaining bytes")));
  }
  return count / 2;
}

Result<bool, Error> Decoder::read_boolean() {
  PROTEUS_TRY(format, buffer_.read_uint8());
  switch (format) {
  case code(FormatCode::BOOLEAN_TRUE):
    return true;
  case code(FormatCode::BOOLEAN_FALSE):
    return false;
  case kBoolean: {
    PROTEUS_TRY(value, buffer_.read_uint8());
    return value != 0;
  }
  default:
    return Unexpected(unexpected_code("a boolean", format));
  }
}

Result<int64_t, Error> Decoder::read_long() {
  PROTEUS_TRY(format, buffer_.read_uint8());
  switch (format) {
  case kSmallLong: {
    PROTEUS_TRY(value, buffer_.read_int8());
    return static_cast<int64_t>(value);
  }
  case code(FormatCode::LONG):
    return buffer_.read_int64();
  default:
    return Unexpected(unexpected_code("a long", format));
  }
}

Result<uint64_t, Error> Decoder::read_ulong() {
  PROTEUS_TRY(format, buffer_.read_uint8());
  switch (format) {
  case kUlong0:
    return static_cast<uint64_t>(0);
  case kSmallUlong: {
    PROTEUS_TRY(value, buffer_.read_uint8());
    return static_cast<uint64_t>(value);
  }
  case code(FormatCode::ULONG):
    return buffer_.read_uint64();
  default:
    return Unexpected(unexpected_code("an ulong", format));
  }
}

Result<uint32_t, Error> Decoder::read_variable_length(uint8_t format) {
  if ((format & 0xf0) == 0xa0) {
    PROTEUS_TRY(length, buffer_.read_uint8());
    return static_cast<uint32_t>(length);
  }
  return buffer_.read_uint32();
}

Result<std::string, Error> Decoder::read_string() {
  PROTEUS_TRY(format, buffer_.read_uint8());
  if (format != kStr8 && format != code(FormatCode::STR32)) {
    return Unexpected(unexpected_code("a string", format));
  }
  PROTEUS_TRY(length, read_variable_length(format));
  return buffer_.read_string(length);
}

Result<std::string, Error> Decoder::read_symbol() {
  PROTEUS_TRY(format, buffer_.read_uint8());
  if (format != kSym8 && format != code(FormatCode::SYM32)) {
    return Unexpected(unexpected_code("a symbol", format));
  }
  PROTEUS_TRY(length, read_variable_length(format));
  return buffer_.read_string(length);
}

Result<std::optional<std::string>, Error> Decoder::read_optional_string() {
  PROTEUS_TRY(is_null, read_null_if_present());
  if (is_null) {
    return std::optional<std::string>();
  }
  PROTEUS_TRY(value, read_string());
  return std::optional<std::string>(std::move(value));
}

Result<Value, Error> Decoder::read_primitive() {
  PROTEUS_TRY(format, buffer_.read_uint8());
  switch (format) {
  case code(FormatCode::NULL_VALUE):
    return Value::null();
  case code(FormatCode::BOOLEAN_TRUE):
    return Value::of_boolean(true);
  case code(FormatCode::BOOLEAN_FALSE):
    return Value::of_boolean(false);
  case kBoolean: {
    PROTEUS_TRY(value, buffer_.read_uint8());
    return Value::of_boolean(value != 0);
  }
  case code(FormatCode::UBYTE): {
    PROTEUS_TRY(value, buffer_.read_uint8());
    return Value::of_ubyte(value);
  }
  case code(FormatCode::BYTE): {
    PROTEUS_TRY(value, buffer_.read_int8());
    return Value::of_byte(value);
  }
  case code(FormatCode::USHORT): {
    PROTEUS_TRY(value, buffer_.read_uint16());
    return Value::of_ushort(value);
  }
  case code(FormatCode::SHORT): {
    PROTEUS_TRY(value, buffer_.read_int16());
    return Value::of_short(value);
  }
  case kUint0:
    return Value::of_uint(0);
  case kSmallUint: {
    PROTEUS_TRY(value, buffer_.read_uint8());
    return Value::of_uint(value);
  }
  case code(FormatCode::UINT): {
    PROTEUS_TRY(value, buffer_.read_uint32());
    return Value::of_uint(value);
  }
  case kSmallInt: {
    PROTEUS_TRY(value, buffer_.read_int8());
    return Value::of_int(value);
  }
  case code(FormatCode::INT): {
    PROTEUS_TRY(value, buffer_.read_int32());
    return Value::of_int(value);
  }
  case code(FormatCode::FLOAT): {
    PROTEUS_TRY(value, buffer_.read_float());
    return Value::of_float(value);
  }
  case code(FormatCode::CHAR): {
    PROTEUS_TRY(value, buffer_.read_uint32());
    return Value::of_char(value);
  }
  case kUlong0:
    return Value::of_ulong(0);
  case kSmallUlong: {
    PROTEUS_TRY(value, buffer_.read_uint8());
    return Value::of_ulong(value);
  }
  case code(FormatCode::ULONG): {
    PROTEUS_TRY(value, buffer_.read_uint64());
    return Value::of_ulong(value);
  }
  case kSmallLong: {
    PROTEUS_TRY(value, buffer_.read_int8());
    return Value::of_long(value);
  }
  case code(FormatCode::LONG): {
    PROTEUS_TRY(value, buffer_.read_int64());
    return Value::of_long(value);
  }
  case code(FormatCode::DOUBLE): {
    PROTEUS_TRY(value, buffer_.read_double());
    return Value::of_double(value);
  }
  case code(FormatCode::TIMESTAMP): {
    PROTEUS_TRY(value, buffer_.read_int64());
    return Value::of_timestamp(value);
  }
  case code(FormatCode::UUID): {
    Uuid uuid;
    PROTEUS_ASSIGN_OR_RETURN(uuid.most_significant, buffer_.read_uint64());
    PROTEUS_ASSIGN_OR_RETURN(uuid.least_significant, buffer_.read_uint64());
    return Value::of_uuid(uuid);
  }
  case kVbin8:
  case code(FormatCode::VBIN32): {
    PROTEUS_TRY(length, read_variable_length(format));
    std::vector<uint8_t> bytes(length);
    PROTEUS_RETURN_NOT_OK(buffer_.read_bytes(bytes.data(), length));
    return Value::of_binary(std::move(bytes));
  }
  case kStr8:
  case code(FormatCode::STR32): {
    PROTEUS_TRY(length, read_variable_length(format));
    PROTEUS_TRY(text, buffer_.read_string(length));
    return Value::of_string(std::move(text));
  }
  case kSym8:
  case code(FormatCode::SYM32): {
    PROTEUS_TRY(length, read_variable_length(format));
    PROTEUS_TRY(text, buffer_.read_string(length));
    return Value::of_symbol(std::move(text));
  }
  default:
    return Unexpected(unexpected_code("a primitive", format));
  }
}

Result<void, Error> Decoder::skip_value() {
  PROTEUS_TRY(format, buffer_.read_uint8());
  if (format == code(FormatCode::DESCRIBED)) {
    PROTEUS_RETURN_NOT_OK(skip_value());
    return skip_value();
  }
  // The high nibble of a format code fixes the width category.
  switch (format & 0xf0) {
  case 0x40:
    return Result<void, Error>();
  case 0x50:
    return buffer_.skip(1);
  case 0x60:
    return buffer_.skip(2);
  case 0x70:
    return buffer_.skip(4);
  case 0x80:
    return buffer_.skip(8);
  case 0x90:
    return buffer_.skip(16);
  case 0xa0:
  case 0xc0:
  case 0xe0: {
    PROTEUS_TRY(size, buffer_.read_uint8());
    return buffer_.skip(size);
  }
  case 0xb0:
  case 0xd0:
  case 0xf0: {
    PROTEUS_TRY(size, buffer_.read_uint32());
    return buffer_.skip(size);
  }
  default:
    return Unexpected(unexpected_code("a value", format));
  }
}

} // namespace serialization
} // namespace proteus
