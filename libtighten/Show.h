/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

/*
 * Stringification functions for core types.
 */
class Declaration;
class Scope;
struct UsageSite;
enum class AccessLevel : uint8_t;

/*
 * If an object has the << operator defined, use that to obtain its string
 * representation. But make sure we don't print pointer addresses.
 */
template <typename T,
          // Use SFINAE to check for the existence of operator<<
          typename = decltype(std::declval<std::ostream&>()
                              << std::declval<T>()),
          typename = std::enable_if_t<!std::is_pointer<std::decay_t<T>>::value>>
std::string show(T&& t) {
  std::ostringstream o;
  o << std::forward<T>(t);
  return o.str();
}

std::string show(const Declaration*);
std::string show(const Scope*);
std::string show(const UsageSite&);
std::string show(AccessLevel level);

// SHOW(x) is syntax sugar for show(x).c_str()
#define SHOW(...) show(__VA_ARGS__).c_str()
