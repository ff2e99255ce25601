/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "DeclAccess.h"

#include <sstream>

boost::optional<DeclAccessFlags> parse_access_flag(const std::string& name) {
#define AF(uc, lc, val) \
  if (name == #lc) {    \
    return ACC_##uc;    \
  }
  ACCESSFLAGS
#undef AF
  return boost::none;
}

std::string show_access_flags(DeclAccessFlags flags) {
  std::ostringstream ss;
  bool first = true;
#define AF(uc, lc, val)     \
  if (is_##lc(flags)) {     \
    if (!first) {           \
      ss << " ";            \
    }                       \
    ss << #lc;              \
    first = false;          \
  }
  ACCESSFLAGS
#undef AF
  return ss.str();
}
