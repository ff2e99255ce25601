/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <ostream>
#include <string>

#include <boost/optional.hpp>

/*
 * Source-level visibility, totally ordered from the most restrictive to the
 * least restrictive. The numeric values are part of the ordering.
 */
enum class AccessLevel : uint8_t {
  PRIVATE = 0,
  PACKAGE = 1,
  PROTECTED = 2,
  PUBLIC = 3,
};

constexpr size_t kNumAccessLevels = 4;

inline AccessLevel join(AccessLevel a, AccessLevel b) { return std::max(a, b); }

/*
 * The modifier keyword for the level; package-private has none and yields an
 * empty string.
 */
const char* access_keyword(AccessLevel level);

/*
 * Human readable name of the level ("private", "package-private",
 * "protected", "public").
 */
const char* access_presentable_text(AccessLevel level);

/*
 * Accepts both the keyword and the presentable text, as well as "package".
 * Returns boost::none for anything else.
 */
boost::optional<AccessLevel> parse_access_level(const std::string& str);

std::ostream& operator<<(std::ostream& os, AccessLevel level);
