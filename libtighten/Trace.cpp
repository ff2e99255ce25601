/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "Trace.h"

#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <mutex>
#include <unordered_map>

#include "Show.h"

namespace {

const char* const s_module_names[] = {
#define TM(x) #x,
    TMS
#undef TM
};

const char* env_or_empty(const char* value) {
  return value == nullptr ? "" : value;
}

/*
 * Configured once from the environment:
 *   TRACE              levels, see parse_trace_levels
 *   TRACEFILE          output file instead of stderr
 *   SHOW_TIMESTAMPS    prefix lines with the local time
 *   SHOW_TRACEMODULE   prefix lines with [MODULE:level]
 *   TRACE_DECL_FILTER  only trace while resolving matching declarations
 */
class Tracer {
 public:
  Tracer() {
    const char* levels = getenv("TRACE");
    const char* file = getenv("TRACEFILE");
    const char* decl_filter = getenv("TRACE_DECL_FILTER");
    m_show_timestamps = getenv("SHOW_TIMESTAMPS") != nullptr;
    m_show_module = getenv("SHOW_TRACEMODULE") != nullptr;
    if (decl_filter != nullptr) {
      m_decl_filter = decl_filter;
    }
    if (levels == nullptr) {
      m_file = stderr;
      return;
    }

    std::cerr << "Trace settings:" << std::endl
              << "TRACE=" << levels << std::endl
              << "TRACEFILE=" << env_or_empty(file) << std::endl
              << "TRACE_DECL_FILTER=" << m_decl_filter << std::endl;
    m_levels = parse_trace_levels(levels);
    for (const auto& module : m_levels.unknown_modules) {
      std::cerr << "Unknown trace module " << module << ", ignoring"
                << std::endl;
    }
    open_file(file);
  }

  ~Tracer() {
    if (m_file != nullptr && m_file != stderr) {
      fclose(m_file);
    }
  }

  bool enabled(TraceModule module, int level) const {
    if (level > m_levels.get(module)) {
      return false;
    }
    if (m_decl_filter.empty()) {
      return true;
    }
    const std::string* context = TraceContext::current_string_value();
    return context == nullptr ||
           context->find(m_decl_filter) != std::string::npos;
  }

  // Callers check enabled() first.
  void vtrace(TraceModule module, int level, const char* fmt, va_list ap) {
    std::lock_guard<std::mutex> guard(m_mutex);
    if (m_show_timestamps) {
      auto t = std::time(nullptr);
      struct tm local_tm;
      localtime_r(&t, &local_tm);
      char buf[40];
      std::strftime(buf, sizeof(buf), "%c", &local_tm);
      fprintf(m_file, "[%s]%s", buf, m_show_module ? "" : " ");
    }
    if (m_show_module) {
      fprintf(m_file, "[%s:%d] ", s_module_names[module], level);
    }
    vfprintf(m_file, fmt, ap);
    fprintf(m_file, "\n");
    fflush(m_file);
  }

 private:
  void open_file(const char* path) {
    m_file = path == nullptr ? stderr : fopen(path, "w");
    if (m_file == nullptr) {
      fprintf(stderr, "Unable to open TRACEFILE, falling back to stderr\n");
      m_file = stderr;
    }
  }

  TraceLevels m_levels;
  std::string m_decl_filter;
  bool m_show_timestamps{false};
  bool m_show_module{false};
  FILE* m_file{nullptr};
  std::mutex m_mutex;
};

Tracer s_tracer;

} // namespace

TraceLevels parse_trace_levels(const std::string& spec) {
  static const std::unordered_map<std::string, TraceModule> s_modules{{
#define TM(x) {#x, x},
      TMS
#undef TM
  }};

  TraceLevels result;
  std::string pending_module;
  size_t pos = 0;
  while (pos < spec.size()) {
    auto end = spec.find_first_of(",: ", pos);
    if (end == std::string::npos) {
      end = spec.size();
    }
    auto token = spec.substr(pos, end - pos);
    pos = end + 1;
    if (token.empty()) {
      continue;
    }
    long level = strtol(token.c_str(), nullptr, 10);
    if (level == 0) {
      pending_module = token;
      continue;
    }
    if (pending_module.empty()) {
      result.global = level;
    } else {
      auto it = s_modules.find(pending_module);
      if (it == s_modules.end()) {
        result.unknown_modules.push_back(pending_module);
      } else {
        result.modules[it->second] = level;
      }
      pending_module.clear();
    }
  }
  return result;
}

#ifndef NDEBUG
bool traceEnabled(TraceModule module, int level) {
  return s_tracer.enabled(module, level);
}
#endif

void trace(TraceModule module, int level, const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  s_tracer.vtrace(module, level, fmt, ap);
  va_end(ap);
}

const std::string& TraceContext::get_string_value() const {
  if (string_value_cache.empty() && decl != nullptr) {
    string_value_cache = show(decl);
  }
  return string_value_cache;
}

const std::string* TraceContext::current_string_value() {
  if (s_context == nullptr) {
    return nullptr;
  }
  return &s_context->get_string_value();
}

thread_local const TraceContext* TraceContext::s_context = nullptr;
