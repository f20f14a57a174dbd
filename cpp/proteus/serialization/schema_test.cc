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

#include <string>
#include <vector>

#include "proteus/serialization/schema.h"
#include "gtest/gtest.h"

namespace proteus {
namespace serialization {

namespace {

CompositeType point_notation() {
  CompositeType type;
  type.name = "com.example.Point";
  type.provides = {"com.example.Shape"};
  type.descriptor = Descriptor{"proteus:00000000000000aa"};
  Field x;
  x.name = "x";
  x.type = "int";
  Field label;
  label.name = "label";
  label.type = "string";
  label.mandatory = false;
  label.default_value = "origin";
  type.fields = {x, label};
  return type;
}

RestrictedType color_notation() {
  RestrictedType type;
  type.name = "com.example.Color";
  type.source = "list";
  type.descriptor = Descriptor{"proteus:00000000000000bb"};
  type.choices = {{"RED", "0"}, {"GREEN", "1"}};
  return type;
}

} // namespace

TEST(SchemaTest, WritesAndReadsNotations) {
  Schema schema;
  ASSERT_TRUE(schema.add(point_notation()));
  ASSERT_TRUE(schema.add(color_notation()));

  Buffer buffer;
  Encoder encoder(buffer);
  schema.write(encoder);
  Decoder decoder(buffer);
  auto read = Schema::read(decoder);
  ASSERT_TRUE(read.ok()) << read.error();
  ASSERT_EQ(read->types().size(), 2);
  EXPECT_EQ(std::get<CompositeType>(read->types()[0]), point_notation());
  EXPECT_EQ(std::get<RestrictedType>(read->types()[1]), color_notation());
  EXPECT_EQ(buffer.remaining_size(), 0);
}

TEST(SchemaTest, NotationsAreUniqueByName) {
  Schema schema;
  EXPECT_TRUE(schema.add(point_notation()));
  CompositeType other = point_notation();
  other.descriptor = Descriptor{"proteus:00000000000000cc"};
  EXPECT_FALSE(schema.add(other));
  ASSERT_EQ(schema.types().size(), 1);
  EXPECT_EQ(notation_descriptor(schema.types()[0]), "proteus:00000000000000aa");
}

TEST(SchemaTest, FindByDescriptor) {
  Schema schema;
  schema.add(point_notation());
  schema.add(color_notation());
  const TypeNotation *found = schema.find_by_descriptor("proteus:00000000000000bb");
  ASSERT_NE(found, nullptr);
  EXPECT_EQ(notation_name(*found), "com.example.Color");
  EXPECT_EQ(schema.find_by_descriptor("proteus:missing"), nullptr);
}

TEST(SchemaTest, TrailingElementsAreSkipped) {
  Buffer buffer;
  Encoder encoder(buffer);
  encoder.write_described(kSchemaDescriptor);
  uint32_t schema = encoder.begin_list();
  uint32_t types = encoder.begin_list();
  encoder.write_described(kRestrictedTypeDescriptor);
  uint32_t restricted = encoder.begin_list();
  encoder.write_string("com.example.Tag");
  encoder.write_null();
  uint32_t provides = encoder.begin_list();
  encoder.end_list(provides, 0);
  encoder.write_string("list");
  encoder.write_described(kTypeDescriptorDescriptor);
  uint32_t descriptor = encoder.begin_list();
  encoder.write_symbol("proteus:00000000000000dd");
  encoder.end_list(descriptor, 1);
  uint32_t choices = encoder.begin_list();
  encoder.end_list(choices, 0);
  // Written by a newer peer.
  encoder.write_string("extra");
  encoder.end_list(restricted, 7);
  encoder.end_list(types, 1);
  encoder.end_list(schema, 1);
  encoder.write_int(1);

  Decoder decoder(buffer);
  auto read = Schema::read(decoder);
  ASSERT_TRUE(read.ok()) << read.error();
  ASSERT_EQ(read->types().size(), 1);
  EXPECT_EQ(notation_descriptor(read->types()[0]), "proteus:00000000000000dd");
  EXPECT_EQ(decoder.read_primitive().value(), Value::of_int(1));
}

TEST(SchemaTest, UnknownNotationIsInvalid) {
  Buffer buffer;
  Encoder encoder(buffer);
  encoder.write_described(kSchemaDescriptor);
  uint32_t schema = encoder.begin_list();
  uint32_t types = encoder.begin_list();
  encoder.write_described("proteus:mystery");
  uint32_t body = encoder.begin_list();
  encoder.end_list(body, 0);
  encoder.end_list(types, 1);
  encoder.end_list(schema, 1);

  Decoder decoder(buffer);
  auto read = Schema::read(decoder);
  ASSERT_FALSE(read.ok());
  EXPECT_EQ(read.error().code(), ErrorCode::InvalidData);
}

TEST(TransformsSchemaTest, WritesAndReadsTransforms) {
  TransformsSchema transforms;
  EXPECT_TRUE(transforms.empty());
  transforms.put("com.example.Color",
                 {{Transform::Kind::Default, "BLUE", "RED"},
                  {Transform::Kind::Rename, "GREEN", "LIME"}});

  Buffer buffer;
  Encoder encoder(buffer);
  transforms.write(encoder);
  Decoder decoder(buffer);
  auto read = TransformsSchema::read(decoder);
  ASSERT_TRUE(read.ok()) << read.error();
  const auto *color = read->find("com.example.Color");
  ASSERT_NE(color, nullptr);
  EXPECT_EQ(*color, transforms.types().at("com.example.Color"));
  EXPECT_EQ(read->find("com.example.Shape"), nullptr);
}

} // namespace serialization
} // namespace proteus
