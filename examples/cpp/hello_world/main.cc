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

/**
 * Proteus C++ Serialization Example
 *
 * This example shows how two parties with different versions of a class
 * exchange values: the writer's message carries its own schema, and the
 * reader evolves or synthesizes classes from it.
 */

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "proteus/serialization/proteus.h"

using proteus::ClassBuilder;
using proteus::ClassKind;
using proteus::ClassLoader;
using proteus::Proteus;
using proteus::Value;

// Helper function to print bytes
void print_bytes(const std::vector<uint8_t> &bytes) {
  std::cout << "Serialized bytes (" << bytes.size() << " bytes): ";
  for (size_t i = 0; i < std::min(bytes.size(), size_t(20)); ++i) {
    printf("%02x ", bytes[i]);
  }
  if (bytes.size() > 20) {
    std::cout << "...";
  }
  std::cout << std::endl;
}

Proteus make_proteus(std::shared_ptr<ClassLoader> loader) {
  return Proteus::builder()
      .class_loader(std::move(loader))
      .whitelist(std::make_shared<proteus::serialization::AllWhitelist>())
      .build();
}

proteus::Result<void, proteus::Error>
define_current_classes(ClassLoader &loader) {
  PROTEUS_RETURN_NOT_OK(
      loader.define_class(ClassBuilder("example.Status", ClassKind::Enum)
                              .constant("PENDING")
                              .constant("ACTIVE")
                              .constant("ARCHIVED")
                              .default_constant("ARCHIVED", "ACTIVE")
                              .build()));
  return loader.define_class(ClassBuilder("example.Person")
                                 .property("name", "string")
                                 .property("age", "int")
                                 .property("email", "string", false)
                                 .property("status", "example.Status")
                                 .build());
}

proteus::Result<void, proteus::Error>
define_older_classes(ClassLoader &loader) {
  PROTEUS_RETURN_NOT_OK(
      loader.define_class(ClassBuilder("example.Status", ClassKind::Enum)
                              .constant("PENDING")
                              .constant("ACTIVE")
                              .build()));
  return loader.define_class(
      ClassBuilder("example.Person")
          .property("name", "string")
          .property("status", "example.Status")
          .property_with_default("nickname", "string", Value::of_string("n/a"))
          .build());
}

int main() {
  std::cout << "=== Proteus C++ Serialization Example ===" << std::endl
            << std::endl;

  // Version 2 of the classes, as the writer knows them.
  auto writer_loader = ClassLoader::create();
  auto defined = define_current_classes(*writer_loader);
  if (!defined.ok()) {
    std::cerr << "Failed to define classes: " << defined.error() << std::endl;
    return 1;
  }
  Proteus writer = make_proteus(writer_loader);

  Value person = Value::object(
      "example.Person",
      {{"name", Value::of_string("Ada")},
       {"age", Value::of_int(36)},
       {"email", Value::null()},
       {"status", Value::enum_constant("example.Status", "ARCHIVED", 2)}});

  // ============================================================================
  // Example 1: Round trip within one instance
  // ============================================================================
  std::cout << "--- Example 1: Round Trip ---" << std::endl;
  auto bytes_result = writer.serialize(person);
  if (!bytes_result.ok()) {
    std::cerr << "Serialization failed: " << bytes_result.error() << std::endl;
    return 1;
  }
  const std::vector<uint8_t> &bytes = bytes_result.value();
  print_bytes(bytes);
  auto same = writer.deserialize(bytes);
  if (same.ok()) {
    std::cout << "Original: " << person.to_string() << std::endl
              << "Deserialized: " << same.value().to_string() << std::endl;
  }
  std::cout << std::endl;

  // ============================================================================
  // Example 2: Reader with an older version of the classes
  // ============================================================================
  std::cout << "--- Example 2: Evolution ---" << std::endl;
  {
    auto reader_loader = ClassLoader::create();
    auto older = define_older_classes(*reader_loader);
    if (!older.ok()) {
      std::cerr << "Failed to define classes: " << older.error() << std::endl;
      return 1;
    }
    auto result = make_proteus(reader_loader).deserialize(bytes);
    if (result.ok()) {
      std::cout << "Evolved: " << result.value().to_string() << std::endl;
    } else {
      std::cout << "Failed: " << result.error() << std::endl;
    }
  }
  std::cout << std::endl;

  // ============================================================================
  // Example 3: Reader without the classes
  // ============================================================================
  std::cout << "--- Example 3: Carpentry ---" << std::endl;
  {
    Proteus reader = make_proteus(ClassLoader::create());
    auto result = reader.deserialize(bytes);
    if (result.ok()) {
      std::cout << "Carpented: " << result.value().to_string() << std::endl;
      for (const auto &name : reader.class_loader()->defined_class_names()) {
        std::cout << "  synthesized " << name << std::endl;
      }
    } else {
      std::cout << "Failed: " << result.error() << std::endl;
    }
  }
  std::cout << std::endl;

  std::cout << "=== All examples completed ===" << std::endl;
  return 0;
}
