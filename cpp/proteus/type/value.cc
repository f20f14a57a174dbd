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

#include "proteus/type/value.h"

#include <iomanip>
#include <sstream>

#include "proteus/util/logging.h"

namespace proteus {

struct Value::ListData {
  std::string class_name;
  List items;
};

struct Value::MapData {
  std::string class_name;
  Entries entries;
};

struct Value::EnumData {
  std::string class_name;
  std::string constant;
  int32_t ordinal;
};

struct Value::ObjectData {
  std::string class_name;
  Fields fields;
};

Value Value::of_boolean(bool v) {
  return Value(ValueKind::Boolean, Storage(std::in_place_type<bool>, v));
}

Value Value::of_byte(int8_t v) {
  return Value(ValueKind::Byte, Storage(std::in_place_type<int64_t>, v));
}

Value Value::of_ubyte(uint8_t v) {
  return Value(ValueKind::UByte, Storage(std::in_place_type<uint64_t>, v));
}

Value Value::of_short(int16_t v) {
  return Value(ValueKind::Short, Storage(std::in_place_type<int64_t>, v));
}

Value Value::of_ushort(uint16_t v) {
  return Value(ValueKind::UShort, Storage(std::in_place_type<uint64_t>, v));
}

Value Value::of_int(int32_t v) {
  return Value(ValueKind::Int, Storage(std::in_place_type<int64_t>, v));
}

Value Value::of_uint(uint32_t v) {
  return Value(ValueKind::UInt, Storage(std::in_place_type<uint64_t>, v));
}

Value Value::of_long(int64_t v) {
  return Value(ValueKind::Long, Storage(std::in_place_type<int64_t>, v));
}

Value Value::of_ulong(uint64_t v) {
  return Value(ValueKind::ULong, Storage(std::in_place_type<uint64_t>, v));
}

Value Value::of_float(float v) {
  return Value(ValueKind::Float, Storage(std::in_place_type<float>, v));
}

Value Value::of_double(double v) {
  return Value(ValueKind::Double, Storage(std::in_place_type<double>, v));
}

Value Value::of_char(uint32_t v) {
  return Value(ValueKind::Char, Storage(std::in_place_type<uint64_t>, v));
}

Value Value::of_timestamp(int64_t millis) {
  return Value(ValueKind::Timestamp,
               Storage(std::in_place_type<int64_t>, millis));
}

Value Value::of_uuid(Uuid v) {
  return Value(ValueKind::Uuid, Storage(std::in_place_type<Uuid>, v));
}

Value Value::of_binary(std::vector<uint8_t> v) {
  return Value(ValueKind::Binary,
               Storage(std::in_place_type<std::vector<uint8_t>>, std::move(v)));
}

Value Value::of_string(std::string v) {
  return Value(ValueKind::String,
               Storage(std::in_place_type<std::string>, std::move(v)));
}

Value Value::of_symbol(std::string v) {
  return Value(ValueKind::Symbol,
               Storage(std::in_place_type<std::string>, std::move(v)));
}

Value Value::list(List items, std::string class_name) {
  auto data = std::make_shared<const ListData>(
      ListData{std::move(class_name), std::move(items)});
  return Value(ValueKind::List,
               Storage(std::in_place_type<std::shared_ptr<const ListData>>,
                       std::move(data)));
}

Value Value::map(Entries entries, std::string class_name) {
  auto data = std::make_shared<const MapData>(
      MapData{std::move(class_name), std::move(entries)});
  return Value(ValueKind::Map,
               Storage(std::in_place_type<std::shared_ptr<const MapData>>,
                       std::move(data)));
}

Value Value::enum_constant(std::string class_name, std::string constant,
                           int32_t ordinal) {
  auto data = std::make_shared<const EnumData>(
      EnumData{std::move(class_name), std::move(constant), ordinal});
  return Value(ValueKind::Enum,
               Storage(std::in_place_type<std::shared_ptr<const EnumData>>,
                       std::move(data)));
}

Value Value::object(std::string class_name, Fields fields) {
  auto data = std::make_shared<const ObjectData>(
      ObjectData{std::move(class_name), std::move(fields)});
  return Value(ValueKind::Object,
               Storage(std::in_place_type<std::shared_ptr<const ObjectData>>,
                       std::move(data)));
}

bool Value::is_primitive() const { return find_primitive(kind_) != nullptr; }

std::string Value::primitive_name() const {
  const PrimitiveInfo *info = find_primitive(kind_);
  return info == nullptr ? std::string() : std::string(info->name);
}

bool Value::as_boolean() const {
  PROTEUS_CHECK(kind_ == ValueKind::Boolean)
      << "Value of kind " << value_kind_name(kind_) << " is not a boolean";
  return std::get<bool>(data_);
}

int64_t Value::as_int64() const {
  PROTEUS_CHECK(std::holds_alternative<int64_t>(data_))
      << "Value of kind " << value_kind_name(kind_)
      << " is not a signed integer";
  return std::get<int64_t>(data_);
}

uint64_t Value::as_uint64() const {
  PROTEUS_CHECK(std::holds_alternative<uint64_t>(data_))
      << "Value of kind " << value_kind_name(kind_)
      << " is not an unsigned integer";
  return std::get<uint64_t>(data_);
}

float Value::as_float() const {
  PROTEUS_CHECK(kind_ == ValueKind::Float)
      << "Value of kind " << value_kind_name(kind_) << " is not a float";
  return std::get<float>(data_);
}

double Value::as_double() const {
  PROTEUS_CHECK(kind_ == ValueKind::Double)
      << "Value of kind " << value_kind_name(kind_) << " is not a double";
  return std::get<double>(data_);
}

const Uuid &Value::as_uuid() const {
  PROTEUS_CHECK(kind_ == ValueKind::Uuid)
      << "Value of kind " << value_kind_name(kind_) << " is not a uuid";
  return std::get<Uuid>(data_);
}

const std::vector<uint8_t> &Value::as_binary() const {
  PROTEUS_CHECK(kind_ == ValueKind::Binary)
      << "Value of kind " << value_kind_name(kind_) << " is not binary";
  return std::get<std::vector<uint8_t>>(data_);
}

const std::string &Value::as_string() const {
  PROTEUS_CHECK(kind_ == ValueKind::String || kind_ == ValueKind::Symbol)
      << "Value of kind " << value_kind_name(kind_) << " is not a string";
  return std::get<std::string>(data_);
}

const Value::List &Value::as_list() const {
  PROTEUS_CHECK(kind_ == ValueKind::List)
      << "Value of kind " << value_kind_name(kind_) << " is not a list";
  return std::get<std::shared_ptr<const ListData>>(data_)->items;
}

const Value::Entries &Value::as_entries() const {
  PROTEUS_CHECK(kind_ == ValueKind::Map)
      << "Value of kind " << value_kind_name(kind_) << " is not a map";
  return std::get<std::shared_ptr<const MapData>>(data_)->entries;
}

const std::string &Value::collection_class() const {
  if (kind_ == ValueKind::Map) {
    return std::get<std::shared_ptr<const MapData>>(data_)->class_name;
  }
  PROTEUS_CHECK(kind_ == ValueKind::List)
      << "Value of kind " << value_kind_name(kind_) << " is not a collection";
  return std::get<std::shared_ptr<const ListData>>(data_)->class_name;
}

const std::string &Value::enum_class() const {
  PROTEUS_CHECK(kind_ == ValueKind::Enum)
      << "Value of kind " << value_kind_name(kind_) << " is not an enum";
  return std::get<std::shared_ptr<const EnumData>>(data_)->class_name;
}

const std::string &Value::enum_name() const {
  PROTEUS_CHECK(kind_ == ValueKind::Enum)
      << "Value of kind " << value_kind_name(kind_) << " is not an enum";
  return std::get<std::shared_ptr<const EnumData>>(data_)->constant;
}

int32_t Value::enum_ordinal() const {
  PROTEUS_CHECK(kind_ == ValueKind::Enum)
      << "Value of kind " << value_kind_name(kind_) << " is not an enum";
  return std::get<std::shared_ptr<const EnumData>>(data_)->ordinal;
}

const std::string &Value::object_class() const {
  PROTEUS_CHECK(kind_ == ValueKind::Object)
      << "Value of kind " << value_kind_name(kind_) << " is not an object";
  return std::get<std::shared_ptr<const ObjectData>>(data_)->class_name;
}

const Value::Fields &Value::fields() const {
  PROTEUS_CHECK(kind_ == ValueKind::Object)
      << "Value of kind " << value_kind_name(kind_) << " is not an object";
  return std::get<std::shared_ptr<const ObjectData>>(data_)->fields;
}

const Value *Value::field(const std::string &name) const {
  for (const auto &entry : fields()) {
    if (entry.first == name) {
      return &entry.second;
    }
  }
  return nullptr;
}

bool Value::operator==(const Value &other) const {
  if (kind_ != other.kind_) {
    return false;
  }
  switch (kind_) {
  case ValueKind::List:
    return as_list() == other.as_list();
  case ValueKind::Map:
    return as_entries() == other.as_entries();
  case ValueKind::Enum:
    return enum_class() == other.enum_class() &&
           enum_name() == other.enum_name() &&
           enum_ordinal() == other.enum_ordinal();
  case ValueKind::Object:
    return object_class() == other.object_class() &&
           fields() == other.fields();
  default:
    return data_ == other.data_;
  }
}

std::string Value::to_string() const {
  std::ostringstream os;
  switch (kind_) {
  case ValueKind::Null:
    os << "null";
    break;
  case ValueKind::Boolean:
    os << (as_boolean() ? "true" : "false");
    break;
  case ValueKind::Byte:
  case ValueKind::Short:
  case ValueKind::Int:
  case ValueKind::Long:
    os << as_int64();
    break;
  case ValueKind::UByte:
  case ValueKind::UShort:
  case ValueKind::UInt:
  case ValueKind::ULong:
    os << as_uint64();
    break;
  case ValueKind::Char:
    os << "'\\u" << std::hex << std::setw(4) << std::setfill('0')
       << as_uint64() << "'";
    break;
  case ValueKind::Float:
    os << as_float();
    break;
  case ValueKind::Double:
    os << as_double();
    break;
  case ValueKind::Timestamp:
    os << "timestamp(" << as_int64() << ")";
    break;
  case ValueKind::Uuid:
    os << std::hex << std::setw(16) << std::setfill('0')
       << as_uuid().most_significant << std::setw(16)
       << as_uuid().least_significant;
    break;
  case ValueKind::Binary:
    os << "binary[" << as_binary().size() << "]";
    break;
  case ValueKind::String:
    os << '"' << as_string() << '"';
    break;
  case ValueKind::Symbol:
    os << ':' << as_string();
    break;
  case ValueKind::List: {
    os << "[";
    const char *sep = "";
    for (const auto &item : as_list()) {
      os << sep << item.to_string();
      sep = ", ";
    }
    os << "]";
    break;
  }
  case ValueKind::Map: {
    os << "{";
    const char *sep = "";
    for (const auto &entry : as_entries()) {
      os << sep << entry.first.to_string() << "=" << entry.second.to_string();
      sep = ", ";
    }
    os << "}";
    break;
  }
  case ValueKind::Enum:
    os << enum_class() << "." << enum_name();
    break;
  case ValueKind::Object: {
    os << object_class() << "(";
    const char *sep = "";
    for (const auto &entry : fields()) {
      os << sep << entry.first << "=" << entry.second.to_string();
      sep = ", ";
    }
    os << ")";
    break;
  }
  }
  return os.str();
}

} // namespace proteus
