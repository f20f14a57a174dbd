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

#include <benchmark/benchmark.h>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "bench.pb.h"
#include "proteus/serialization/proteus.h"
#include "proteus/util/logging.h"

using proteus::ClassBuilder;
using proteus::ClassLoader;
using proteus::Proteus;
using proteus::Type;
using proteus::Value;

// ============================================================================
// Class definitions (must match proto messages)
// ============================================================================

std::shared_ptr<ClassLoader> CreateBenchLoader() {
  auto loader = ClassLoader::create();
  ClassBuilder numeric("bench.NumericStruct");
  for (int i = 1; i <= 8; ++i) {
    numeric.property("f" + std::to_string(i), "int");
  }
  PROTEUS_CHECK_OK(loader->define_class(numeric.build()));
  PROTEUS_CHECK_OK(loader->define_class(ClassBuilder("bench.Sample")
                                            .property("int_value", "int")
                                            .property("long_value", "long")
                                            .property("float_value", "float")
                                            .property("double_value", "double")
                                            .property("short_value", "short")
                                            .property("char_value", "char")
                                            .property("boolean_value", "boolean")
                                            .property("int_array", "int[p]")
                                            .property("long_array", "long[p]")
                                            .property("double_array", "double[p]")
                                            .property("boolean_array",
                                                      "boolean[p]")
                                            .property("string", "string")
                                            .build()));
  return loader;
}

Proteus CreateProteus(std::shared_ptr<ClassLoader> loader) {
  return Proteus::builder()
      .class_loader(std::move(loader))
      .whitelist(std::make_shared<proteus::serialization::AllWhitelist>())
      .build();
}

// ============================================================================
// Test data creation
// ============================================================================

const int32_t kNumericValues[] = {
    -12345,     // negative
    987654321,  // large positive
    -31415,     // negative
    27182818,   // positive
    -32000,     // near int16 min
    1000000,    // medium positive
    -999999999, // large negative
    42          // small positive
};

Value CreateNumericStruct() {
  Value::Fields fields;
  for (int i = 0; i < 8; ++i) {
    fields.emplace_back("f" + std::to_string(i + 1),
                        Value::of_int(kNumericValues[i]));
  }
  return Value::object("bench.NumericStruct", std::move(fields));
}

protobuf::Struct CreateProtoStruct() {
  protobuf::Struct pb;
  pb.set_f1(kNumericValues[0]);
  pb.set_f2(kNumericValues[1]);
  pb.set_f3(kNumericValues[2]);
  pb.set_f4(kNumericValues[3]);
  pb.set_f5(kNumericValues[4]);
  pb.set_f6(kNumericValues[5]);
  pb.set_f7(kNumericValues[6]);
  pb.set_f8(kNumericValues[7]);
  return pb;
}

const int32_t kIntArray[] = {-1234, -123, -12, -1, 0, 1, 12, 123, 1234};
const int64_t kLongArray[] = {-123400, -12300, -1200, -100, 0,
                              100,     1200,   12300, 123400};
const double kDoubleArray[] = {-1.234, -1.23, -12.0, -1.0, 0.0,
                               1.0,    12.0,  1.23,  1.234};
const bool kBooleanArray[] = {true, false, false, true};
const char kString[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

Value CreateSample() {
  Value::List ints, longs, doubles, booleans;
  for (int32_t v : kIntArray) {
    ints.push_back(Value::of_int(v));
  }
  for (int64_t v : kLongArray) {
    longs.push_back(Value::of_long(v));
  }
  for (double v : kDoubleArray) {
    doubles.push_back(Value::of_double(v));
  }
  for (bool v : kBooleanArray) {
    booleans.push_back(Value::of_boolean(v));
  }
  return Value::object(
      "bench.Sample",
      {{"int_value", Value::of_int(123)},
       {"long_value", Value::of_long(1230000LL)},
       {"float_value", Value::of_float(12.345f)},
       {"double_value", Value::of_double(1.234567)},
       {"short_value", Value::of_short(12345)},
       {"char_value", Value::of_char('!')},
       {"boolean_value", Value::of_boolean(true)},
       {"int_array", Value::list(std::move(ints))},
       {"long_array", Value::list(std::move(longs))},
       {"double_array", Value::list(std::move(doubles))},
       {"boolean_array", Value::list(std::move(booleans))},
       {"string", Value::of_string(kString)}});
}

protobuf::Sample CreateProtoSample() {
  protobuf::Sample sample;
  sample.set_int_value(123);
  sample.set_long_value(1230000LL);
  sample.set_float_value(12.345f);
  sample.set_double_value(1.234567);
  sample.set_short_value(12345);
  sample.set_char_value('!');
  sample.set_boolean_value(true);
  for (int32_t v : kIntArray) {
    sample.add_int_array(v);
  }
  for (int64_t v : kLongArray) {
    sample.add_long_array(v);
  }
  for (double v : kDoubleArray) {
    sample.add_double_array(v);
  }
  for (bool v : kBooleanArray) {
    sample.add_boolean_array(v);
  }
  sample.set_string(kString);
  return sample;
}

// ============================================================================
// Struct benchmarks (simple object with 8 int fields)
// ============================================================================

static void BM_Proteus_Struct_Serialize(benchmark::State &state) {
  Proteus proteus = CreateProteus(CreateBenchLoader());
  Value obj = CreateNumericStruct();
  for (auto _ : state) {
    auto bytes = proteus.serialize(obj);
    benchmark::DoNotOptimize(bytes);
  }
}
BENCHMARK(BM_Proteus_Struct_Serialize);

static void BM_Protobuf_Struct_Serialize(benchmark::State &state) {
  protobuf::Struct pb = CreateProtoStruct();
  std::vector<uint8_t> output(pb.ByteSizeLong());
  for (auto _ : state) {
    pb.SerializeToArray(output.data(), static_cast<int>(output.size()));
    benchmark::DoNotOptimize(output);
  }
}
BENCHMARK(BM_Protobuf_Struct_Serialize);

static void BM_Proteus_Struct_Deserialize(benchmark::State &state) {
  Proteus proteus = CreateProteus(CreateBenchLoader());
  auto bytes = proteus.serialize(CreateNumericStruct());
  PROTEUS_CHECK(bytes.ok()) << bytes.error();
  for (auto _ : state) {
    auto value = proteus.deserialize(bytes.value());
    benchmark::DoNotOptimize(value);
  }
}
BENCHMARK(BM_Proteus_Struct_Deserialize);

static void BM_Protobuf_Struct_Deserialize(benchmark::State &state) {
  std::string data = CreateProtoStruct().SerializeAsString();
  for (auto _ : state) {
    protobuf::Struct pb;
    pb.ParseFromString(data);
    benchmark::DoNotOptimize(pb);
  }
}
BENCHMARK(BM_Protobuf_Struct_Deserialize);

// ============================================================================
// Sample benchmarks (primitives, primitive arrays and a string)
// ============================================================================

static void BM_Proteus_Sample_Serialize(benchmark::State &state) {
  Proteus proteus = CreateProteus(CreateBenchLoader());
  Value obj = CreateSample();
  for (auto _ : state) {
    auto bytes = proteus.serialize(obj);
    benchmark::DoNotOptimize(bytes);
  }
}
BENCHMARK(BM_Proteus_Sample_Serialize);

static void BM_Protobuf_Sample_Serialize(benchmark::State &state) {
  protobuf::Sample pb = CreateProtoSample();
  std::vector<uint8_t> output(pb.ByteSizeLong());
  for (auto _ : state) {
    pb.SerializeToArray(output.data(), static_cast<int>(output.size()));
    benchmark::DoNotOptimize(output);
  }
}
BENCHMARK(BM_Protobuf_Sample_Serialize);

static void BM_Proteus_Sample_Deserialize(benchmark::State &state) {
  Proteus proteus = CreateProteus(CreateBenchLoader());
  auto bytes = proteus.serialize(CreateSample());
  PROTEUS_CHECK(bytes.ok()) << bytes.error();
  for (auto _ : state) {
    auto value = proteus.deserialize(bytes.value());
    benchmark::DoNotOptimize(value);
  }
}
BENCHMARK(BM_Proteus_Sample_Deserialize);

static void BM_Protobuf_Sample_Deserialize(benchmark::State &state) {
  std::string data = CreateProtoSample().SerializeAsString();
  for (auto _ : state) {
    protobuf::Sample pb;
    pb.ParseFromString(data);
    benchmark::DoNotOptimize(pb);
  }
}
BENCHMARK(BM_Protobuf_Sample_Deserialize);

// ============================================================================
// Carpentry benchmark (reader without the writer's classes)
// ============================================================================

static void BM_Proteus_Sample_Deserialize_Carpented(benchmark::State &state) {
  auto bytes = CreateProteus(CreateBenchLoader()).serialize(CreateSample());
  PROTEUS_CHECK(bytes.ok()) << bytes.error();
  Proteus reader = CreateProteus(ClassLoader::create());
  for (auto _ : state) {
    auto value = reader.deserialize(bytes.value());
    benchmark::DoNotOptimize(value);
  }
}
BENCHMARK(BM_Proteus_Sample_Deserialize_Carpented);

// ============================================================================
// Factory lookups from concurrent callers
// ============================================================================

static void BM_Proteus_Factory_Lookup(benchmark::State &state) {
  static Proteus *proteus = new Proteus(CreateProteus(CreateBenchLoader()));
  auto type = proteus->factory()->type_for_name("bench.Sample");
  PROTEUS_CHECK(type.ok()) << type.error();
  for (auto _ : state) {
    auto serializer = proteus->factory()->get(nullptr, type.value());
    benchmark::DoNotOptimize(serializer);
  }
}
BENCHMARK(BM_Proteus_Factory_Lookup)->Threads(1)->Threads(4);

BENCHMARK_MAIN();
