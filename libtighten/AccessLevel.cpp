/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "AccessLevel.h"

#include "Debug.h"

const char* access_keyword(AccessLevel level) {
  switch (level) {
  case AccessLevel::PRIVATE:
    return "private";
  case AccessLevel::PACKAGE:
    return "";
  case AccessLevel::PROTECTED:
    return "protected";
  case AccessLevel::PUBLIC:
    return "public";
  }
  not_reached();
}

const char* access_presentable_text(AccessLevel level) {
  switch (level) {
  case AccessLevel::PRIVATE:
    return "private";
  case AccessLevel::PACKAGE:
    return "package-private";
  case AccessLevel::PROTECTED:
    return "protected";
  case AccessLevel::PUBLIC:
    return "public";
  }
  not_reached();
}

boost::optional<AccessLevel> parse_access_level(const std::string& str) {
  if (str == "private") {
    return AccessLevel::PRIVATE;
  }
  if (str.empty() || str == "package-private" || str == "package") {
    return AccessLevel::PACKAGE;
  }
  if (str == "protected") {
    return AccessLevel::PROTECTED;
  }
  if (str == "public") {
    return AccessLevel::PUBLIC;
  }
  return boost::none;
}

std::ostream& operator<<(std::ostream& os, AccessLevel level) {
  return os << access_presentable_text(level);
}
