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
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"

#include "proteus/type/class.h"
#include "proteus/util/error.h"
#include "proteus/util/result.h"

namespace proteus {

/// Names of the builtin classes.
namespace builtin {
constexpr const char kObject[] = "Object";
constexpr const char kCollection[] = "Collection";
constexpr const char kList[] = "List";
constexpr const char kSet[] = "Set";
constexpr const char kSortedSet[] = "SortedSet";
constexpr const char kNavigableSet[] = "NavigableSet";
constexpr const char kNonEmptySet[] = "NonEmptySet";
constexpr const char kEnumSet[] = "EnumSet";
constexpr const char kArrayList[] = "ArrayList";
constexpr const char kLinkedHashSet[] = "LinkedHashSet";
constexpr const char kTreeSet[] = "TreeSet";
constexpr const char kMap[] = "Map";
constexpr const char kSortedMap[] = "SortedMap";
constexpr const char kNavigableMap[] = "NavigableMap";
constexpr const char kLinkedHashMap[] = "LinkedHashMap";
constexpr const char kTreeMap[] = "TreeMap";
constexpr const char kHashMap[] = "HashMap";
constexpr const char kWeakHashMap[] = "WeakHashMap";
} // namespace builtin

/// A thread-safe registry resolving class names to classes.
///
/// Loaders form a chain: the parent is consulted first, so a child can add
/// classes but never shadow its ancestors. The system loader holds the
/// primitives, `Object` and the builtin collection and map classes.
class ClassLoader {
public:
  explicit ClassLoader(std::shared_ptr<const ClassLoader> parent = nullptr);

  ClassLoader(const ClassLoader &) = delete;
  ClassLoader &operator=(const ClassLoader &) = delete;

  /// The shared loader holding the builtin classes.
  static std::shared_ptr<const ClassLoader> system();

  /// A fresh loader whose parent is the system loader.
  static std::shared_ptr<ClassLoader> create();

  const std::shared_ptr<const ClassLoader> &parent() const { return parent_; }

  /// Fails with ClassNotFound (message: the name) when neither this loader
  /// nor an ancestor knows the class.
  Result<ClassPtr, Error> load_class(const std::string &name) const;

  bool has_class(const std::string &name) const;

  /// Fails with CarpentryError when the name is already taken in this chain.
  Result<void, Error> define_class(ClassPtr clazz);

  /// True when `clazz` is `ancestor` or inherits it through its superclass
  /// or interfaces. Unknown supertypes end the walk.
  bool is_assignable(const Class &clazz, const std::string &ancestor) const;

  /// Names of the classes defined directly in this loader.
  std::vector<std::string> defined_class_names() const;

private:
  ClassPtr find_local(const std::string &name) const;

  std::shared_ptr<const ClassLoader> parent_;
  mutable absl::Mutex mu_;
  absl::flat_hash_map<std::string, ClassPtr> classes_ ABSL_GUARDED_BY(mu_);
};

using ClassLoaderPtr = std::shared_ptr<ClassLoader>;

} // namespace proteus
