/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <mutex>
#include <unordered_map>

namespace cc_impl {

constexpr size_t kDefaultSlots = 83;

} // namespace cc_impl

/*
 * A container sharded into `n_slots` independently locked slots. Operations on
 * one key only ever take the lock of the slot the key hashes to, so threads
 * working on different keys rarely contend.
 *
 * size() is not thread-safe: only use it once all writers have joined.
 */
template <typename Container, size_t n_slots>
class ConcurrentContainer {
 public:
  static_assert(n_slots > 0, "The concurrent container has no slots");

  virtual ~ConcurrentContainer() {}

  size_t size() const {
    size_t s = 0;
    for (size_t slot = 0; slot < n_slots; ++slot) {
      s += m_slots[slot].size();
    }
    return s;
  }

 protected:
  ConcurrentContainer() = default;

  Container& get_container(size_t slot) { return m_slots[slot]; }

  const Container& get_container(size_t slot) const { return m_slots[slot]; }

  std::mutex& get_lock_by_slot(size_t slot) const { return m_locks[slot]; }

  std::array<Container, n_slots> m_slots;
  mutable std::array<std::mutex, n_slots> m_locks;
};

/*
 * A concurrent map. All keyed operations are thread-safe; values are handed
 * out by copy, since a reference could be invalidated by a concurrent update.
 */
template <typename Key,
          typename Value,
          typename Hash = std::hash<Key>,
          typename KeyEqual = std::equal_to<Key>,
          size_t n_slots = cc_impl::kDefaultSlots>
class ConcurrentMap final
    : public ConcurrentContainer<std::unordered_map<Key, Value, Hash, KeyEqual>,
                                 n_slots> {
 public:
  ConcurrentMap() = default;

  ConcurrentMap(const ConcurrentMap&) = delete;
  ConcurrentMap& operator=(const ConcurrentMap&) = delete;

  /*
   * This operation is always thread-safe.
   */
  Value get(const Key& key, Value default_value) const {
    size_t slot = Hash()(key) % n_slots;
    std::unique_lock<std::mutex> lock(this->get_lock_by_slot(slot));
    const auto& map = this->get_container(slot);
    auto it = map.find(key);
    if (it == map.end()) {
      return default_value;
    }
    return it->second;
  }

  /*
   * This operation atomically modifies an entry in the map. If the entry
   * doesn't exist, it is created. The third argument of the updater function is
   * a Boolean flag denoting whether the entry exists or not. The slot lock is
   * held for the duration of the updater call only.
   */
  template <
      typename UpdateFn = const std::function<void(const Key&, Value&, bool)>&>
  void update(const Key& key, UpdateFn updater) {
    size_t slot = Hash()(key) % n_slots;
    std::unique_lock<std::mutex> lock(this->get_lock_by_slot(slot));
    auto& map = this->get_container(slot);
    auto it = map.find(key);
    if (it == map.end()) {
      auto inserted = map.emplace(key, Value()).first;
      updater(inserted->first, inserted->second, false);
    } else {
      updater(it->first, it->second, true);
    }
  }
};
