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
#include <string>
#include <string_view>
#include <vector>

namespace proteus {

/// Kind of a dynamic value. The primitive kinds line up one to one with the
/// AMQP primitive types; List, Map, Enum and Object are composite.
enum class ValueKind : uint8_t {
  Null,
  Boolean,
  Byte,
  UByte,
  Short,
  UShort,
  Int,
  UInt,
  Long,
  ULong,
  Float,
  Double,
  Char,
  Timestamp,
  Uuid,
  Binary,
  String,
  Symbol,
  List,
  Map,
  Enum,
  Object,
};

/// AMQP 1.0 format codes used by the codec.
enum class FormatCode : uint8_t {
  DESCRIBED = 0x00,
  NULL_VALUE = 0x40,
  BOOLEAN_TRUE = 0x41,
  BOOLEAN_FALSE = 0x42,
  UBYTE = 0x50,
  BYTE = 0x51,
  USHORT = 0x60,
  SHORT = 0x61,
  UINT = 0x70,
  INT = 0x71,
  FLOAT = 0x72,
  CHAR = 0x73,
  ULONG = 0x80,
  LONG = 0x81,
  DOUBLE = 0x82,
  TIMESTAMP = 0x83,
  UUID = 0x98,
  VBIN32 = 0xb0,
  STR32 = 0xb1,
  SYM32 = 0xb3,
  LIST32 = 0xd0,
  MAP32 = 0xd1,
};

struct PrimitiveInfo {
  std::string_view name;
  ValueKind kind;
  FormatCode format_code;
  // Whether `name[p]` is a legal primitive array.
  bool array_component;
};

/// The process-wide primitive table, in a fixed order.
const std::vector<PrimitiveInfo> &primitive_table();

/// Returns nullptr when `name` is not a primitive type name.
const PrimitiveInfo *find_primitive(std::string_view name);

/// Returns nullptr for the non-primitive kinds.
const PrimitiveInfo *find_primitive(ValueKind kind);

inline bool is_primitive_name(std::string_view name) {
  return find_primitive(name) != nullptr;
}

/// True for int, char, boolean, float, double, short and long. Byte arrays
/// are never primitive arrays since they are the binary primitive.
bool is_primitive_array_component(std::string_view name);

const char *value_kind_name(ValueKind kind);

} // namespace proteus
