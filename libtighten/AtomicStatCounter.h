/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <atomic>
#include <type_traits>

/**
 * A lock-free counter for statistics gathered by concurrent resolution tasks.
 *
 * All operations are memory order relaxed: the counters only have to agree
 * with themselves, and are read once the work queue has joined. There is no
 * operator=(T), so `counter = counter + 1` cannot sneak in.
 */
template <typename T>
class AtomicStatCounter final {
  using AtomicCounterType = std::atomic<T>;

  static_assert(std::is_integral<T>::value, "T must be an integral type");
  static_assert(AtomicCounterType::is_always_lock_free,
                "T must be always lock free. Use a mutex instead.");

  AtomicCounterType counter;

 public:
  AtomicStatCounter() = delete;
  explicit AtomicStatCounter(T value) noexcept : counter{value} {}
  AtomicStatCounter(const AtomicStatCounter& other) noexcept
      : counter{other.counter.load(std::memory_order_relaxed)} {}
  AtomicStatCounter& operator=(const AtomicStatCounter& other) noexcept {
    counter.store(other.counter.load(std::memory_order_relaxed),
                  std::memory_order_relaxed);
    return *this;
  }

  T load() const noexcept { return counter.load(std::memory_order_relaxed); }
  // NOLINTNEXTLINE(google-explicit-constructor)
  operator T() const noexcept { return load(); }
  T operator++() noexcept { return *this += 1; }
  T operator++(int) noexcept {
    return counter.fetch_add(1, std::memory_order_relaxed);
  }
  T operator+=(T value) noexcept {
    return counter.fetch_add(value, std::memory_order_relaxed) + value;
  }
};
