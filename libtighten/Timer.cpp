/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "Timer.h"

#include <list>
#include <mutex>

#include "Trace.h"

namespace {

struct PhaseTimes {
  std::mutex lock;
  Timer::times_t times;
  unsigned indent{0};
};

PhaseTimes& phase_times() {
  static PhaseTimes s_phases;
  return s_phases;
}

struct AccumulatedTimes {
  std::mutex lock;
  std::list<std::pair<std::string, std::shared_ptr<std::atomic<uint64_t>>>>
      timers;
};

// Leaked so that static timers can still register during shutdown.
AccumulatedTimes& accumulated_times() {
  static auto* s_accumulated = new AccumulatedTimes();
  return *s_accumulated;
}

Json::Value to_json(const Timer::times_t& times) {
  Json::Value json(Json::objectValue);
  for (const auto& pair : times) {
    // The same phase may run more than once.
    json[pair.first] = json.get(pair.first, 0.0).asDouble() + pair.second;
  }
  return json;
}

} // namespace

Timer::Timer(std::string msg)
    : m_msg(std::move(msg)), m_start(std::chrono::steady_clock::now()) {
  auto& phases = phase_times();
  std::lock_guard<std::mutex> guard(phases.lock);
  ++phases.indent;
}

Timer::~Timer() {
  auto seconds = std::chrono::duration<double>(
                     std::chrono::steady_clock::now() - m_start)
                     .count();
  auto& phases = phase_times();
  std::lock_guard<std::mutex> guard(phases.lock);
  --phases.indent;
  TRACE(TIME, 1, "%*s%s completed in %.3lf seconds", 4 * phases.indent, "",
        m_msg.c_str(), seconds);
  phases.times.emplace_back(std::move(m_msg), seconds);
}

Timer::times_t Timer::get_times() {
  auto& phases = phase_times();
  std::lock_guard<std::mutex> guard(phases.lock);
  return phases.times;
}

void Timer::clear_times() {
  auto& phases = phase_times();
  std::lock_guard<std::mutex> guard(phases.lock);
  phases.times.clear();
}

AccumulatingTimer::AccumulatingTimer(std::string msg) {
  auto& accumulated = accumulated_times();
  std::lock_guard<std::mutex> guard(accumulated.lock);
  accumulated.timers.emplace_back(std::move(msg), m_microseconds);
}

Timer::times_t AccumulatingTimer::get_times() {
  auto& accumulated = accumulated_times();
  std::lock_guard<std::mutex> guard(accumulated.lock);
  Timer::times_t res;
  res.reserve(accumulated.timers.size());
  for (const auto& [name, microseconds] : accumulated.timers) {
    res.emplace_back(name, static_cast<double>(microseconds->load()) / 1000000);
  }
  return res;
}

Json::Value times_to_json() {
  Json::Value json;
  json["phases"] = to_json(Timer::get_times());
  json["accumulated"] = to_json(AccumulatingTimer::get_times());
  return json;
}
