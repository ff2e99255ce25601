/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <algorithm>
#include <array>
#include <string>
#include <vector>

#include "Macros.h"

class Declaration;

#define TMS          \
  TM(ACCESS)         \
  TM(AGGR)           \
  TM(CLASSIFY)       \
  TM(ENTRY)          \
  TM(EXTEND)         \
  TM(LOAD)           \
  TM(MAIN)           \
  TM(TIME)           \
  /* End of list */

enum TraceModule : int {
#define TM(x) x,
  TMS
#undef TM
      N_TRACE_MODULES,
};

// To avoid "-Wunused" warnings, keep the TRACE macros in common so that the
// compiler sees a "use." However, ensure that it is optimized away through
// a constexpr condition in NDEBUG mode.
#ifdef NDEBUG
constexpr bool traceEnabled(TraceModule, int) { return false; }
#else
bool traceEnabled(TraceModule module, int level);
#endif // NDEBUG

void trace(TraceModule module, int level, const char* fmt, ...)
    ATTR_FORMAT(3, 4);

#define TRACE(module, level, fmt, ...)          \
  do {                                          \
    if (traceEnabled(module, level)) {          \
      trace(module, level, fmt, ##__VA_ARGS__); \
    }                                           \
  } while (0)

/*
 * The levels a TRACE setting such as "ACCESS:2,LOAD:1" or "1 AGGR:3" asks
 * for. A bare number sets the level of every module; a module name followed
 * by a number sets that module alone. Unknown modules are collected rather
 * than rejected.
 */
struct TraceLevels {
  long global{0};
  std::array<long, N_TRACE_MODULES> modules{};
  std::vector<std::string> unknown_modules;

  long get(TraceModule module) const {
    return std::max(global, modules[module]);
  }
};

TraceLevels parse_trace_levels(const std::string& spec);

/*
 * Names the declaration currently being resolved on this thread. Trace output
 * can be narrowed to matching declarations with TRACE_DECL_FILTER, and failed
 * assertions mention it.
 */
class TraceContext {
 public:
  explicit TraceContext(const Declaration* current_decl) {
    last_context = s_context;
    s_context = this;
    decl = current_decl;
  }
  ~TraceContext() { s_context = last_context; }

  TraceContext(const TraceContext&) = delete;
  TraceContext& operator=(const TraceContext&) = delete;

  const std::string& get_string_value() const;

  // nullptr when no context is active on this thread.
  static const std::string* current_string_value();

 private:
  thread_local static const TraceContext* s_context;
  const TraceContext* last_context{nullptr};
  const Declaration* decl{nullptr};
  mutable std::string string_value_cache;
};
