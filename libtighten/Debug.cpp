/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "Debug.h"

#include <array>
#include <atomic>
#include <cstring>
#include <exception>
#include <iostream>
#include <memory>
#include <signal.h>
#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string>

#include <boost/exception/all.hpp>

#include "Macros.h"
#include "Trace.h"

#if !IS_WINDOWS
#include <execinfo.h>
#include <unistd.h>
#endif

namespace {

// This is a macro to avoid extra frames for symbolization.
#if !IS_WINDOWS
#define CRASH_BACKTRACE()                             \
  do {                                                \
    constexpr int max_bt_frames = 256;                \
    void* buf[max_bt_frames];                         \
    auto frames = backtrace(buf, max_bt_frames);      \
    backtrace_symbols_fd(buf, frames, STDERR_FILENO); \
  } while (0)
#else
#define CRASH_BACKTRACE()
#endif

std::atomic<size_t> g_crashing{0};

struct StackTrace {
#if !IS_WINDOWS
  std::array<void*, 256> trace;
  size_t len;
  StackTrace() { len = backtrace(trace.data(), trace.size()); }
  void print_to_stderr() const {
    backtrace_symbols_fd(trace.data(), len, STDERR_FILENO);
  }
#else
  void print_to_stderr() const {}
#endif
};

using traced = boost::error_info<struct tag_stacktrace, StackTrace>;

std::string v_format2string(const char* fmt, va_list ap) {
  va_list backup;
  va_copy(backup, ap);
  size_t size = vsnprintf(nullptr, 0, fmt, ap);
  // size is the number of chars would had been written
  std::unique_ptr<char[]> buffer = std::make_unique<char[]>(size + 1);
  vsnprintf(buffer.get(), size + 1, fmt, backup);
  va_end(backup);
  return std::string(buffer.get());
}

} // namespace

void crash_backtrace_handler(int sig) {
  size_t crashing = g_crashing.fetch_add(1);
  if (crashing == 0) {
    CRASH_BACKTRACE();
  }
  signal(sig, SIG_DFL);
  raise(sig);
}

std::string format2string(const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  auto ret = v_format2string(fmt, ap);
  va_end(ap);
  return ret;
}

void assert_fail(const char* expr,
                 const char* file,
                 unsigned line,
                 const char* func,
                 TightenError type,
                 const char* fmt,
                 ...) {
  va_list ap;
  va_start(ap, fmt);

  std::string context;
  const std::string* decl_context = TraceContext::current_string_value();
  if (decl_context != nullptr) {
    context = " (Context: " + *decl_context + ")";
  }
  std::string msg = format2string("%s:%u: %s: assertion `%s' failed.%s\n", file,
                                  line, func, expr, context.c_str());
  if (strcmp(fmt, " ") != 0) {
    msg += v_format2string(fmt, ap);
  }
  va_end(ap);

  throw boost::enable_error_info(TightenException(type, msg))
      << traced(StackTrace());
}

void print_stack_trace(std::ostream& /* os */, const std::exception& e) {
  // GNU backtraces go straight to stderr.
  const StackTrace* st = boost::get_error_info<traced>(e);
  if (st) {
    st->print_to_stderr();
  }
}
