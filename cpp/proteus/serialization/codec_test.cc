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

#include <cstdint>
#include <string>
#include <vector>

#include "proteus/serialization/codec.h"
#include "gtest/gtest.h"

namespace proteus {
namespace serialization {

TEST(CodecTest, PrimitivesAreBigEndianWithFormatCodes) {
  Buffer buffer;
  Encoder encoder(buffer);
  encoder.write_int(0x01020304);
  EXPECT_EQ(buffer.hex(), "7101020304");
}

TEST(CodecTest, PrimitivesReadBack) {
  Buffer buffer;
  Encoder encoder(buffer);
  std::vector<Value> values = {
      Value::of_boolean(true),     Value::of_byte(-3),
      Value::of_ubyte(200),        Value::of_short(-300),
      Value::of_ushort(60000),     Value::of_int(-70000),
      Value::of_uint(4000000000u), Value::of_long(-5000000000LL),
      Value::of_ulong(1ULL << 63), Value::of_float(1.5f),
      Value::of_double(-0.25),     Value::of_char(0x263a),
      Value::of_timestamp(1700000000000LL),
      Value::of_binary({1, 2, 3}), Value::of_string("proteus"),
      Value::of_symbol("sym"),     Value::null()};
  for (const auto &value : values) {
    ASSERT_TRUE(encoder.write_primitive(value).ok()) << value;
  }
  Decoder decoder(buffer);
  for (const auto &value : values) {
    auto read = decoder.read_primitive();
    ASSERT_TRUE(read.ok()) << read.error();
    EXPECT_EQ(read.value(), value);
  }
  EXPECT_EQ(buffer.remaining_size(), 0);
}

TEST(CodecTest, CompositeIsNotPrimitive) {
  Buffer buffer;
  Encoder encoder(buffer);
  auto written = encoder.write_primitive(Value::list({Value::of_int(1)}));
  ASSERT_FALSE(written.ok());
  EXPECT_EQ(written.error().code(), ErrorCode::Invalid);
}

TEST(CodecTest, ListHeaderIsPatched) {
  Buffer buffer;
  Encoder encoder(buffer);
  uint32_t start = encoder.begin_list();
  encoder.write_int(1);
  encoder.write_string("a");
  encoder.end_list(start, 2);

  Decoder decoder(buffer);
  EXPECT_EQ(decoder.read_list_header().value(), 2u);
  EXPECT_EQ(decoder.read_primitive().value(), Value::of_int(1));
  EXPECT_EQ(decoder.read_string().value(), "a");
}

TEST(CodecTest, MapHeaderCountsPairs) {
  Buffer buffer;
  Encoder encoder(buffer);
  uint32_t start = encoder.begin_map();
  encoder.write_string("x");
  encoder.write_int(1);
  encoder.end_map(start, 1);
  // The wire count is the number of elements.
  EXPECT_EQ(buffer.hex().substr(10, 8), "00000002");

  Decoder decoder(buffer);
  EXPECT_EQ(decoder.read_map_header().value(), 1u);
}

TEST(CodecTest, CompactEncodingsAreRead) {
  std::vector<uint8_t> bytes = {0x45,                    // list0
                                0xc0, 0x04, 0x02, 0x54, 0xff, 0x43, // list8
                                0xa1, 0x02, 'h',  'i',   // str8
                                0x56, 0x01};             // boolean
  Buffer buffer(bytes.data(), static_cast<uint32_t>(bytes.size()));
  Decoder decoder(buffer);
  EXPECT_EQ(decoder.read_list_header().value(), 0u);
  EXPECT_EQ(decoder.read_list_header().value(), 2u);
  EXPECT_EQ(decoder.read_primitive().value(), Value::of_int(-1));
  EXPECT_EQ(decoder.read_primitive().value(), Value::of_uint(0));
  EXPECT_EQ(decoder.read_string().value(), "hi");
  EXPECT_TRUE(decoder.read_boolean().value());
}

TEST(CodecTest, OddMapCountIsInvalid) {
  std::vector<uint8_t> bytes = {0xc1, 0x01, 0x03};
  Buffer buffer(bytes.data(), static_cast<uint32_t>(bytes.size()));
  Decoder decoder(buffer);
  auto header = decoder.read_map_header();
  ASSERT_FALSE(header.ok());
  EXPECT_EQ(header.error().code(), ErrorCode::InvalidData);
}

TEST(CodecTest, ListCountBeyondRemainingBytesIsInvalid) {
  std::vector<uint8_t> bytes = {0xd0, 0x00, 0x00, 0x00, 0x06,
                                0xff, 0xff, 0xff, 0xff, 0xa1, 0x00};
  Buffer buffer(bytes.data(), static_cast<uint32_t>(bytes.size()));
  Decoder decoder(buffer);
  auto header = decoder.read_list_header();
  ASSERT_FALSE(header.ok());
  EXPECT_EQ(header.error().code(), ErrorCode::InvalidData);

  std::vector<uint8_t> small = {0xc0, 0x02, 0x03, 0x43};
  Buffer small_buffer(small.data(), static_cast<uint32_t>(small.size()));
  Decoder small_decoder(small_buffer);
  auto small_header = small_decoder.read_list_header();
  ASSERT_FALSE(small_header.ok());
  EXPECT_EQ(small_header.error().code(), ErrorCode::InvalidData);
}

TEST(CodecTest, MapCountBeyondRemainingBytesIsInvalid) {
  // 0xfffffffe elements, two of them present.
  std::vector<uint8_t> bytes = {0xd1, 0x00, 0x00, 0x00, 0x06,
                                0xff, 0xff, 0xff, 0xfe, 0x43, 0x43};
  Buffer buffer(bytes.data(), static_cast<uint32_t>(bytes.size()));
  Decoder decoder(buffer);
  auto header = decoder.read_map_header();
  ASSERT_FALSE(header.ok());
  EXPECT_EQ(header.error().code(), ErrorCode::InvalidData);

  std::vector<uint8_t> exact = {0xc1, 0x03, 0x02, 0x43, 0x43};
  Buffer exact_buffer(exact.data(), static_cast<uint32_t>(exact.size()));
  Decoder exact_decoder(exact_buffer);
  EXPECT_EQ(exact_decoder.read_map_header().value(), 1u);
}

TEST(CodecTest, DescribedValues) {
  Buffer buffer;
  Encoder encoder(buffer);
  encoder.write_described("proteus:0123456789abcdef");
  encoder.write_long(7);

  Decoder decoder(buffer);
  EXPECT_TRUE(decoder.next_is_described().value());
  EXPECT_EQ(decoder.read_descriptor().value(), "proteus:0123456789abcdef");
  EXPECT_FALSE(decoder.next_is_described().value());
  EXPECT_EQ(decoder.read_long().value(), 7);
}

TEST(CodecTest, SkipValue) {
  Buffer buffer;
  Encoder encoder(buffer);
  encoder.write_described("proteus:skipped");
  uint32_t start = encoder.begin_list();
  encoder.write_string("nested");
  encoder.write_uuid(Uuid{1, 2});
  encoder.write_null();
  encoder.end_list(start, 3);
  encoder.write_int(42);

  Decoder decoder(buffer);
  ASSERT_TRUE(decoder.skip_value().ok());
  EXPECT_EQ(decoder.read_primitive().value(), Value::of_int(42));
}

TEST(CodecTest, WrongFormatCodeNamesIt) {
  Buffer buffer;
  Encoder encoder(buffer);
  encoder.write_int(1);
  Decoder decoder(buffer);
  auto text = decoder.read_string();
  ASSERT_FALSE(text.ok());
  EXPECT_EQ(text.error().code(), ErrorCode::InvalidData);
  EXPECT_NE(text.error().message().find("0x71"), std::string::npos);
}

TEST(CodecTest, OptionalString) {
  Buffer buffer;
  Encoder encoder(buffer);
  encoder.write_optional_string(std::nullopt);
  encoder.write_optional_string(std::string("label"));
  Decoder decoder(buffer);
  EXPECT_FALSE(decoder.read_optional_string().value().has_value());
  EXPECT_EQ(decoder.read_optional_string().value().value_or(""), "label");
}

} // namespace serialization
} // namespace proteus
