/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include "Macros.h" // For ATTR_FORMAT.
#include "TightenException.h"

#include <cstdint>
#include <iosfwd>
#include <string>
#include <type_traits>

constexpr bool debug =
#ifdef NDEBUG
    false
#else
    true
#endif // NDEBUG
    ;

#ifdef _MSC_VER
#define UNREACHABLE() __assume(false)
#define PRETTY_FUNC() __func__
#else
#define UNREACHABLE() __builtin_unreachable()
#define PRETTY_FUNC() __PRETTY_FUNCTION__
#endif // _MSC_VER

#define not_reached()       \
  do {                      \
    tighten_assert(false);  \
    UNREACHABLE();          \
  } while (true)

#define assert_fail_impl(e, type, msg, ...) \
  assert_fail(#e, __FILE__, __LINE__, PRETTY_FUNC(), type, msg, ##__VA_ARGS__)

[[noreturn]] void assert_fail(const char* expr,
                              const char* file,
                              unsigned line,
                              const char* func,
                              TightenError type,
                              const char* fmt,
                              ...) ATTR_FORMAT(6, 7);

#define assert_impl(cond, fail) \
  ((cond) ? static_cast<void>(0) : ((fail), static_cast<void>(0)))

// Note: Using " " and detecting that, so that GCC's `-Wformat-zero-length`
//       does not apply, which is hard to disable across compilers.
#define always_assert(e) \
  assert_impl(           \
      e, assert_fail_impl(e, TightenError::GENERIC_ASSERTION_ERROR, " "))
#define always_assert_log(e, msg, ...) \
  assert_impl(e,                       \
              assert_fail_impl(        \
                  e, TightenError::GENERIC_ASSERTION_ERROR, msg, ##__VA_ARGS__))
#define always_assert_type_log(e, type, msg, ...) \
  assert_impl(e, assert_fail_impl(e, type, msg, ##__VA_ARGS__))
#undef assert

// Checked in debug builds only. `!debug` folds away as a constexpr.
#define tighten_assert(e) always_assert(!debug || (e))

std::string format2string(const char* fmt, ...) ATTR_FORMAT(1, 2);

// Prints the backtrace captured by assert_fail, if `e` carries one.
void print_stack_trace(std::ostream& os, const std::exception& e);

void crash_backtrace_handler(int sig);
