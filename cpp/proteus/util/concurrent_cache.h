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

#include <cstddef>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"

#include "proteus/util/error.h"
#include "proteus/util/result.h"

namespace proteus {
namespace util {

/// Unbounded thread-safe map with atomic per-key get-or-create.
///
/// Each key owns a slot. The slot is created under the map lock, and the
/// value is built under the slot lock, so concurrent first requests for one
/// key run the builder once and all observe the same published value, while
/// builds for different keys proceed in parallel.
///
/// A builder that fails publishes nothing; the next request for that key
/// runs the builder again. A builder must not request its own key from the
/// same cache, since the slot lock is not reentrant.
///
/// There is no eviction: entries live as long as the cache.
template <typename K, typename V> class ConcurrentCache {
public:
  ConcurrentCache() = default;
  ConcurrentCache(const ConcurrentCache &) = delete;
  ConcurrentCache &operator=(const ConcurrentCache &) = delete;

  /// Returns the published value for `key`, waiting for an in-flight build.
  std::optional<V> get(const K &key) const {
    std::shared_ptr<Slot> slot = find_slot(key);
    if (slot == nullptr) {
      return std::nullopt;
    }
    absl::MutexLock slot_lock(&slot->mu);
    if (!slot->ready) {
      return std::nullopt;
    }
    return slot->value;
  }

  bool contains(const K &key) const { return get(key).has_value(); }

  /// Returns the value for `key`, running `build` if none is published yet.
  /// `build` is invoked as `build()` and must return Result<V, Error>.
  template <typename Builder>
  Result<V, Error> get_or_create(const K &key, Builder &&build) {
    std::shared_ptr<Slot> slot = find_or_add_slot(key);
    absl::MutexLock slot_lock(&slot->mu);
    if (slot->ready) {
      return slot->value;
    }
    Result<V, Error> built = build();
    if (!built.ok()) {
      return built;
    }
    slot->value = std::move(built).value();
    slot->ready = true;
    return slot->value;
  }

  /// Publishes `value` unless a value is already present; returns whichever
  /// value ends up published.
  V put_if_absent(const K &key, V value) {
    std::shared_ptr<Slot> slot = find_or_add_slot(key);
    absl::MutexLock slot_lock(&slot->mu);
    if (!slot->ready) {
      slot->value = std::move(value);
      slot->ready = true;
    }
    return slot->value;
  }

  /// Publishes `value`, replacing any previous one.
  void put(const K &key, V value) {
    std::shared_ptr<Slot> slot = find_or_add_slot(key);
    absl::MutexLock slot_lock(&slot->mu);
    slot->value = std::move(value);
    slot->ready = true;
  }

  /// Number of published values.
  size_t size() const {
    std::vector<std::shared_ptr<Slot>> slots;
    {
      absl::MutexLock lock(&mu_);
      slots.reserve(slots_.size());
      for (const auto &entry : slots_) {
        slots.push_back(entry.second);
      }
    }
    size_t count = 0;
    for (const auto &slot : slots) {
      absl::MutexLock slot_lock(&slot->mu);
      if (slot->ready) {
        ++count;
      }
    }
    return count;
  }

private:
  struct Slot {
    absl::Mutex mu;
    bool ready ABSL_GUARDED_BY(mu) = false;
    V value ABSL_GUARDED_BY(mu){};
  };

  std::shared_ptr<Slot> find_slot(const K &key) const {
    absl::MutexLock lock(&mu_);
    auto it = slots_.find(key);
    if (it == slots_.end()) {
      return nullptr;
    }
    return it->second;
  }

  std::shared_ptr<Slot> find_or_add_slot(const K &key) {
    absl::MutexLock lock(&mu_);
    auto it = slots_.find(key);
    if (it != slots_.end()) {
      return it->second;
    }
    auto slot = std::make_shared<Slot>();
    slots_.emplace(key, slot);
    return slot;
  }

  mutable absl::Mutex mu_;
  absl::flat_hash_map<K, std::shared_ptr<Slot>> slots_ ABSL_GUARDED_BY(mu_);
};

} // namespace util
} // namespace proteus
