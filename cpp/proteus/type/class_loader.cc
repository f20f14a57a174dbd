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

#include "proteus/type/class_loader.h"

#include <algorithm>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_cat.h"
#include "proteus/type/primitive.h"

namespace proteus {

namespace {

ClassPtr collection_class(const char *name, const char *super,
                          bool concrete = false) {
  ClassBuilder builder(name, ClassKind::Collection);
  builder.type_parameter("E").serializable();
  if (super != nullptr) {
    if (concrete) {
      builder.implements(super);
    } else {
      builder.extends(super);
    }
  }
  return builder.build();
}

ClassPtr map_class(const char *name, const char *super,
                   bool concrete = false) {
  ClassBuilder builder(name, ClassKind::Map);
  builder.type_parameter("K").type_parameter("V").serializable();
  if (super != nullptr) {
    if (concrete) {
      builder.implements(super);
    } else {
      builder.extends(super);
    }
  }
  return builder.build();
}

std::shared_ptr<ClassLoader> make_system_loader() {
  auto loader = std::make_shared<ClassLoader>();
  std::vector<ClassPtr> classes;
  classes.push_back(
      ClassBuilder(builtin::kObject, ClassKind::Top).serializable().build());
  for (const auto &info : primitive_table()) {
    classes.push_back(ClassBuilder(std::string(info.name), ClassKind::Primitive)
                          .serializable()
                          .build());
  }
  classes.push_back(collection_class(builtin::kCollection, nullptr));
  classes.push_back(collection_class(builtin::kList, builtin::kCollection));
  classes.push_back(collection_class(builtin::kSet, builtin::kCollection));
  classes.push_back(collection_class(builtin::kSortedSet, builtin::kSet));
  classes.push_back(
      collection_class(builtin::kNavigableSet, builtin::kSortedSet));
  classes.push_back(collection_class(builtin::kNonEmptySet, builtin::kSet));
  classes.push_back(collection_class(builtin::kEnumSet, builtin::kSet));
  classes.push_back(collection_class(builtin::kArrayList, builtin::kList, true));
  classes.push_back(
      collection_class(builtin::kLinkedHashSet, builtin::kSet, true));
  classes.push_back(
      collection_class(builtin::kTreeSet, builtin::kNavigableSet, true));
  classes.push_back(map_class(builtin::kMap, nullptr));
  classes.push_back(map_class(builtin::kSortedMap, builtin::kMap));
  classes.push_back(map_class(builtin::kNavigableMap, builtin::kSortedMap));
  classes.push_back(map_class(builtin::kLinkedHashMap, builtin::kMap, true));
  classes.push_back(map_class(builtin::kTreeMap, builtin::kNavigableMap, true));
  classes.push_back(map_class(builtin::kHashMap, builtin::kMap, true));
  classes.push_back(map_class(builtin::kWeakHashMap, builtin::kMap, true));
  for (auto &clazz : classes) {
    PROTEUS_CHECK_OK(loader->define_class(std::move(clazz)));
  }
  return loader;
}

} // namespace

ClassLoader::ClassLoader(std::shared_ptr<const ClassLoader> parent)
    : parent_(std::move(parent)) {}

std::shared_ptr<const ClassLoader> ClassLoader::system() {
  static const std::shared_ptr<const ClassLoader> loader =
      make_system_loader();
  return loader;
}

std::shared_ptr<ClassLoader> ClassLoader::create() {
  return std::make_shared<ClassLoader>(system());
}

ClassPtr ClassLoader::find_local(const std::string &name) const {
  absl::MutexLock lock(&mu_);
  auto it = classes_.find(name);
  return it == classes_.end() ? nullptr : it->second;
}

Result<ClassPtr, Error> ClassLoader::load_class(const std::string &name) const {
  if (parent_ != nullptr) {
    auto from_parent = parent_->load_class(name);
    if (from_parent.ok() || !from_parent.error().is_class_not_found()) {
      return from_parent;
    }
  }
  ClassPtr clazz = find_local(name);
  if (clazz == nullptr) {
    return Unexpected(Error::class_not_found(name));
  }
  return clazz;
}

bool ClassLoader::has_class(const std::string &name) const {
  return load_class(name).ok();
}

Result<void, Error> ClassLoader::define_class(ClassPtr clazz) {
  if (parent_ != nullptr && parent_->has_class(clazz->name())) {
    return Unexpected(Error::carpentry_error(
        absl::StrCat("Class ", clazz->name(), " is already defined")));
  }
  absl::MutexLock lock(&mu_);
  auto inserted = classes_.emplace(clazz->name(), clazz);
  if (!inserted.second) {
    return Unexpected(Error::carpentry_error(
        absl::StrCat("Class ", clazz->name(), " is already defined")));
  }
  return Result<void, Error>();
}

bool ClassLoader::is_assignable(const Class &clazz,
                                const std::string &ancestor) const {
  if (clazz.name() == ancestor) {
    return true;
  }
  std::vector<std::string> pending(clazz.interfaces().begin(),
                                   clazz.interfaces().end());
  if (!clazz.superclass().empty()) {
    pending.push_back(clazz.superclass());
  }
  absl::flat_hash_set<std::string> seen{clazz.name()};
  while (!pending.empty()) {
    std::string name = std::move(pending.back());
    pending.pop_back();
    if (name == ancestor) {
      return true;
    }
    if (!seen.insert(name).second) {
      continue;
    }
    auto loaded = load_class(name);
    if (!loaded.ok()) {
      continue;
    }
    const ClassPtr &current = loaded.value();
    if (!current->superclass().empty()) {
      pending.push_back(current->superclass());
    }
    for (const auto &iface : current->interfaces()) {
      pending.push_back(iface);
    }
  }
  return false;
}

std::vector<std::string> ClassLoader::defined_class_names() const {
  std::vector<std::string> names;
  {
    absl::MutexLock lock(&mu_);
    names.reserve(classes_.size());
    for (const auto &entry : classes_) {
      names.push_back(entry.first);
    }
  }
  std::sort(names.begin(), names.end());
  return names;
}

} // namespace proteus
