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

#include <memory>
#include <string>

#include "absl/synchronization/mutex.h"

#include "proteus/model/remote_type_carpenter.h"
#include "proteus/model/remote_type_information.h"
#include "proteus/type/class_loader.h"
#include "proteus/type/type.h"
#include "proteus/util/error.h"
#include "proteus/util/result.h"

namespace proteus {
namespace carpenter {

/// Synthesizes classes for remote types that have no local counterpart.
///
/// Synthesized classes are defined in a loader of their own whose parent is
/// the application loader, so they never shadow a real class. They are
/// marked synthesized and serializable, expose one property per remote
/// property and implement the remote interface set. Generic composites are
/// carpented erased: `Box<Foo>` defines `Box` with the property types the
/// remote peer resolved, and carpenting `Box<Bar>` afterwards reuses it.
///
/// Failures are CarpentryError:
/// - a property or interface type that cannot be resolved
/// - two interfaces declaring one property with different types
/// - a class missing a property its interfaces declare, unless lenient, in
///   which case the property is added as non-mandatory
/// - a name already taken by a class that was not carpented
class ClassCarpenter : public model::RemoteTypeCarpenter {
public:
  explicit ClassCarpenter(std::shared_ptr<const ClassLoader> parent,
                          bool lenient = false);

  /// The loader carpented classes are defined in. Application classes are
  /// visible through it.
  const std::shared_ptr<ClassLoader> &class_loader() const { return loader_; }

  bool is_lenient() const { return lenient_; }

  Result<Type, Error> carpent(const model::RemoteTypeInformation &info) override;

private:
  Result<Type, Error> resolve(const TypeIdentifier &id) const;

  Result<Type, Error> carpent_class(const model::RemoteTypeInformation &info);

  Result<Type, Error> carpent_enum(const model::RemoteTypeInformation &info);

  // Returns the class already carpented under `name`, nullptr when the name
  // is free, or an error when a real class owns it.
  Result<ClassPtr, Error> existing_synthesized(const std::string &name,
                                               ClassKind kind) const;

  std::shared_ptr<ClassLoader> loader_;
  bool lenient_;
  // Serializes the check-then-define sequence.
  absl::Mutex define_mu_;
};

} // namespace carpenter
} // namespace proteus
