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

namespace proteus {
namespace serialization {

/// Configuration of a serializer factory and the calls made through it.
///
/// Use ProteusBuilder to construct instances with custom settings.
struct Config {
  /// Reject any non-primitive, non-collection type that has no custom
  /// serializer registered.
  bool only_custom_serializers = false;

  /// Synthesize classes for remote types that have no local counterpart.
  /// When disabled, decoding an unknown class fails with ClassNotFound.
  bool carpenter_enabled = true;

  /// Let the carpenter synthesize a class that misses a property one of its
  /// interfaces declares; the property is added as non-mandatory.
  bool lenient_carpenter = false;

  /// Maximum nesting of described values while writing or reading.
  uint32_t max_depth = 64;

  Config() = default;
};

} // namespace serialization
} // namespace proteus
