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

#include "proteus/type/primitive.h"

#include "absl/container/flat_hash_map.h"

namespace proteus {

const std::vector<PrimitiveInfo> &primitive_table() {
  static const std::vector<PrimitiveInfo> table = {
      {"char", ValueKind::Char, FormatCode::CHAR, true},
      {"boolean", ValueKind::Boolean, FormatCode::BOOLEAN_TRUE, true},
      {"byte", ValueKind::Byte, FormatCode::BYTE, false},
      {"ubyte", ValueKind::UByte, FormatCode::UBYTE, false},
      {"short", ValueKind::Short, FormatCode::SHORT, true},
      {"ushort", ValueKind::UShort, FormatCode::USHORT, false},
      {"int", ValueKind::Int, FormatCode::INT, true},
      {"uint", ValueKind::UInt, FormatCode::UINT, false},
      {"long", ValueKind::Long, FormatCode::LONG, true},
      {"ulong", ValueKind::ULong, FormatCode::ULONG, false},
      {"float", ValueKind::Float, FormatCode::FLOAT, true},
      {"double", ValueKind::Double, FormatCode::DOUBLE, true},
      {"timestamp", ValueKind::Timestamp, FormatCode::TIMESTAMP, false},
      {"uuid", ValueKind::Uuid, FormatCode::UUID, false},
      {"binary", ValueKind::Binary, FormatCode::VBIN32, false},
      {"string", ValueKind::String, FormatCode::STR32, false},
      {"symbol", ValueKind::Symbol, FormatCode::SYM32, false},
  };
  return table;
}

const PrimitiveInfo *find_primitive(std::string_view name) {
  static const absl::flat_hash_map<std::string_view, const PrimitiveInfo *>
      by_name = [] {
        absl::flat_hash_map<std::string_view, const PrimitiveInfo *> m;
        for (const auto &info : primitive_table()) {
          m.emplace(info.name, &info);
        }
        return m;
      }();
  auto it = by_name.find(name);
  return it == by_name.end() ? nullptr : it->second;
}

const PrimitiveInfo *find_primitive(ValueKind kind) {
  for (const auto &info : primitive_table()) {
    if (info.kind == kind) {
      return &info;
    }
  }
  return nullptr;
}

bool is_primitive_array_component(std::string_view name) {
  const PrimitiveInfo *info = find_primitive(name);
  return info != nullptr && info->array_component;
}

const char *value_kind_name(ValueKind kind) {
  switch (kind) {
  case ValueKind::Null:
    return "null";
  case ValueKind::List:
    return "list";
  case ValueKind::Map:
    return "map";
  case ValueKind::Enum:
    return "enum";
  case ValueKind::Object:
    return "object";
  default:
    break;
  }
  const PrimitiveInfo *info = find_primitive(kind);
  return info == nullptr ? "unknown" : info->name.data();
}

} // namespace proteus
