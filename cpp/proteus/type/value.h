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
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "proteus/type/primitive.h"

namespace proteus {

struct Uuid {
  uint64_t most_significant = 0;
  uint64_t least_significant = 0;

  bool operator==(const Uuid &other) const {
    return most_significant == other.most_significant &&
           least_significant == other.least_significant;
  }
  bool operator!=(const Uuid &other) const { return !(*this == other); }
};

/// A dynamically typed value, the in-memory form of everything the
/// serializers write and read.
///
/// Lists stand for collections and arrays, maps keep their entries in
/// insertion order, enum constants carry their class, name and ordinal, and
/// objects carry their class name and named field values. Lists and maps may
/// carry the name of a concrete implementation class (e.g. "TreeMap") as a
/// hint for serializer selection; the hint does not take part in equality.
///
/// Composite payloads are shared and immutable, so copying a Value is cheap.
class Value {
public:
  using List = std::vector<Value>;
  using Entries = std::vector<std::pair<Value, Value>>;
  using Fields = std::vector<std::pair<std::string, Value>>;

  Value() : kind_(ValueKind::Null) {}

  static Value null() { return Value(); }
  static Value of_boolean(bool v);
  static Value of_byte(int8_t v);
  static Value of_ubyte(uint8_t v);
  static Value of_short(int16_t v);
  static Value of_ushort(uint16_t v);
  static Value of_int(int32_t v);
  static Value of_uint(uint32_t v);
  static Value of_long(int64_t v);
  static Value of_ulong(uint64_t v);
  static Value of_float(float v);
  static Value of_double(double v);
  static Value of_char(uint32_t v);
  /// Milliseconds since the epoch.
  static Value of_timestamp(int64_t millis);
  static Value of_uuid(Uuid v);
  static Value of_binary(std::vector<uint8_t> v);
  static Value of_string(std::string v);
  static Value of_symbol(std::string v);

  static Value list(List items, std::string class_name = "");
  static Value map(Entries entries, std::string class_name = "");
  static Value enum_constant(std::string class_name, std::string constant,
                             int32_t ordinal);
  static Value object(std::string class_name, Fields fields);

  ValueKind kind() const { return kind_; }
  bool is_null() const { return kind_ == ValueKind::Null; }
  bool is_primitive() const;

  /// The primitive type name for primitive kinds, empty otherwise.
  std::string primitive_name() const;

  bool as_boolean() const;
  /// Byte, Short, Int, Long and Timestamp.
  int64_t as_int64() const;
  /// UByte, UShort, UInt, ULong and Char.
  uint64_t as_uint64() const;
  float as_float() const;
  double as_double() const;
  const Uuid &as_uuid() const;
  const std::vector<uint8_t> &as_binary() const;
  /// String and Symbol.
  const std::string &as_string() const;

  const List &as_list() const;
  const Entries &as_entries() const;
  /// Implementation class hint of a list or map, possibly empty.
  const std::string &collection_class() const;

  const std::string &enum_class() const;
  const std::string &enum_name() const;
  int32_t enum_ordinal() const;

  const std::string &object_class() const;
  const Fields &fields() const;
  /// Returns nullptr when the object has no field called `name`.
  const Value *field(const std::string &name) const;

  std::string to_string() const;

  bool operator==(const Value &other) const;
  bool operator!=(const Value &other) const { return !(*this == other); }

private:
  struct ListData;
  struct MapData;
  struct EnumData;
  struct ObjectData;

  using Storage =
      std::variant<std::monostate, bool, int64_t, uint64_t, float, double,
                   Uuid, std::string, std::vector<uint8_t>,
                   std::shared_ptr<const ListData>,
                   std::shared_ptr<const MapData>,
                   std::shared_ptr<const EnumData>,
                   std::shared_ptr<const ObjectData>>;

  Value(ValueKind kind, Storage data) : kind_(kind), data_(std::move(data)) {}

  ValueKind kind_;
  Storage data_;
};

inline std::ostream &operator<<(std::ostream &os, const Value &value) {
  return os << value.to_string();
}

} // namespace proteus
