/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#if defined(_MSC_VER) || defined(__MINGW32__) || defined(__MINGW64__)
#define IS_WINDOWS 1
#else
#define IS_WINDOWS 0
#endif

// printf-style checking of TRACE and always_assert_log formats.
#ifdef __clang__
#define ATTR_FORMAT(STR_INDEX, PARAM_INDEX) \
  __attribute__((__format__(__printf__, STR_INDEX, PARAM_INDEX)))
#elif defined(__GNUC__)
#define ATTR_FORMAT(STR_INDEX, PARAM_INDEX) \
  __attribute__((format(printf, STR_INDEX, PARAM_INDEX)))
#else
#define ATTR_FORMAT(...)
#endif
