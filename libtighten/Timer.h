/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <json/value.h>

/*
 * Times a phase of a run from construction to destruction. The duration is
 * traced under TIME and recorded, so the tool can report every phase once
 * the run is over. Nested timers indent their trace output.
 */
class Timer {
 public:
  using times_t = std::vector<std::pair<std::string, double>>;

  explicit Timer(std::string msg);
  ~Timer();

  Timer(const Timer&) = delete;
  Timer& operator=(const Timer&) = delete;

  // Completed phases in completion order, in seconds.
  static times_t get_times();

  static void clear_times();

 private:
  std::string m_msg;
  std::chrono::steady_clock::time_point m_start;
};

/*
 * Sums the time spent in many short scopes, possibly on many threads at
 * once. A named timer registers itself for the run report; copies share
 * the same total.
 *
 *   static AccumulatingTimer s_timer("UsageSearch");
 *   ...
 *   auto scope = s_timer.scope();
 */
class AccumulatingTimer {
 public:
  class Scope {
   public:
    explicit Scope(AccumulatingTimer* timer)
        : m_total(timer->m_microseconds.get()),
          m_start(std::chrono::steady_clock::now()) {}

    ~Scope() {
      auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
          std::chrono::steady_clock::now() - m_start);
      m_total->fetch_add(static_cast<uint64_t>(elapsed.count()),
                         std::memory_order_relaxed);
    }

    Scope(const Scope&) = delete;
    Scope& operator=(const Scope&) = delete;

   private:
    std::atomic<uint64_t>* m_total;
    std::chrono::steady_clock::time_point m_start;
  };

  // Anonymous; not part of the run report.
  AccumulatingTimer() = default;

  explicit AccumulatingTimer(std::string msg);

  Scope scope() { return Scope(this); }

  uint64_t get_microseconds() const {
    return m_microseconds->load(std::memory_order_relaxed);
  }

  double get_seconds() const {
    return static_cast<double>(get_microseconds()) / 1000000;
  }

  // Every named timer with its total so far, in seconds.
  static Timer::times_t get_times();

 private:
  std::shared_ptr<std::atomic<uint64_t>> m_microseconds{
      std::make_shared<std::atomic<uint64_t>>(0)};
};

/*
 * Both kinds of timings as a JSON object, phases under "phases" and
 * accumulated totals under "accumulated".
 */
Json::Value times_to_json();
