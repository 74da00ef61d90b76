/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <unordered_set>
#include <vector>

namespace cc_impl {

constexpr size_t kDefaultSlots = 83;

} // namespace cc_impl

/*
 * A set safe for concurrent insertion and lookup, sharded into `n_slots`
 * independently locked slots. Use a prime number of slots.
 *
 * Iteration (for_each, elements) locks one slot at a time: it sees every
 * element inserted before it started, and possibly some inserted while it
 * runs.
 */
template <typename Key,
          typename Hash = std::hash<Key>,
          typename Equal = std::equal_to<Key>,
          size_t n_slots = cc_impl::kDefaultSlots>
class ConcurrentSet final {
 public:
  static_assert(n_slots > 0, "The concurrent container has no slots");

  using Container = std::unordered_set<Key, Hash, Equal>;

  ConcurrentSet() = default;
  ConcurrentSet(const ConcurrentSet&) = delete;
  ConcurrentSet& operator=(const ConcurrentSet&) = delete;

  /*
   * Returns true if `key` was not in the set yet.
   */
  bool insert(const Key& key) {
    auto& slot = get_slot(key);
    std::lock_guard<std::mutex> lock(slot.lock);
    return slot.container.insert(key).second;
  }

  size_t count(const Key& key) const {
    const auto& slot = get_slot(key);
    std::lock_guard<std::mutex> lock(slot.lock);
    return slot.container.count(key);
  }

  size_t size() const {
    size_t s = 0;
    for (size_t i = 0; i < n_slots; ++i) {
      std::lock_guard<std::mutex> lock(m_slots[i].lock);
      s += m_slots[i].container.size();
    }
    return s;
  }

  bool empty() const { return size() == 0; }

  void for_each(const std::function<void(const Key&)>& fn) const {
    for (size_t i = 0; i < n_slots; ++i) {
      std::lock_guard<std::mutex> lock(m_slots[i].lock);
      for (const auto& key : m_slots[i].container) {
        fn(key);
      }
    }
  }

  std::vector<Key> elements() const {
    std::vector<Key> result;
    for_each([&](const Key& key) { result.push_back(key); });
    return result;
  }

  // Not thread-safe.
  void clear() {
    for (size_t i = 0; i < n_slots; ++i) {
      m_slots[i].container.clear();
    }
  }

 private:
  struct Slot {
    mutable std::mutex lock;
    Container container;
  };

  Slot& get_slot(const Key& key) { return m_slots[Hash()(key) % n_slots]; }
  const Slot& get_slot(const Key& key) const {
    return m_slots[Hash()(key) % n_slots];
  }

  Slot m_slots[n_slots];
};
