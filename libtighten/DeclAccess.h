/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <string>

#include <boost/optional.hpp>

#include "AccessLevel.h"

// clang-format off
#define ACCESSFLAGS                         \
  AF(PUBLIC,       public,           0x1)   \
  AF(PRIVATE,      private,          0x2)   \
  AF(PROTECTED,    protected,        0x4)   \
  AF(STATIC,       static,           0x8)   \
  AF(FINAL,        final,           0x10)   \
  AF(NATIVE,       native,         0x100)   \
  AF(INTERFACE,    interface,      0x200)   \
  AF(ABSTRACT,     abstract,       0x400)   \
  AF(SYNTHETIC,    synthetic,     0x1000)   \
  AF(ANNOTATION,   annotation,    0x2000)   \
  AF(ENUM,         enum,          0x4000)
// clang-format on

enum DeclAccessFlags : uint32_t {
  ACC_NONE = 0,
#define AF(uc, lc, val) ACC_##uc = val,
  ACCESSFLAGS
#undef AF
};

inline DeclAccessFlags operator&(const DeclAccessFlags a,
                                 const DeclAccessFlags b) {
  return (DeclAccessFlags)((uint32_t)a & (uint32_t)b);
}

inline DeclAccessFlags operator|(const DeclAccessFlags a,
                                 const DeclAccessFlags b) {
  return (DeclAccessFlags)((uint32_t)a | (uint32_t)b);
}

inline DeclAccessFlags& operator|=(DeclAccessFlags& a,
                                   const DeclAccessFlags b) {
  a = a | b;
  return a;
}

inline DeclAccessFlags operator~(const DeclAccessFlags a) {
  return (DeclAccessFlags)(~(uint32_t)a);
}

/*
 * The member overloads require well-formed modifiers; see
 * Declaration::has_access().
 */
#define AF(uc, lc, val)                        \
  inline bool is_##lc(DeclAccessFlags flags) { \
    return (flags & ACC_##uc) == ACC_##uc;     \
  }                                            \
                                               \
  template <class DeclMember>                  \
  bool is_##lc(const DeclMember* m) {          \
    return is_##lc(m->get_access());           \
  }
ACCESSFLAGS
#undef AF

//
// DeclAccessFlags visibility accessors
//

const DeclAccessFlags VISIBILITY_MASK =
    static_cast<DeclAccessFlags>(ACC_PUBLIC | ACC_PRIVATE | ACC_PROTECTED);

inline bool is_package_private(DeclAccessFlags flags) {
  return (flags & VISIBILITY_MASK) == 0;
}

template <class DeclMember>
bool is_package_private(const DeclMember* m) {
  return is_package_private(m->get_access());
}

/*
 * Maps the visibility bits to a level. No visibility bit means
 * package-private; if several are set the least restrictive wins.
 */
inline AccessLevel access_level(DeclAccessFlags flags) {
  if (is_public(flags)) {
    return AccessLevel::PUBLIC;
  }
  if (is_protected(flags)) {
    return AccessLevel::PROTECTED;
  }
  if (is_private(flags)) {
    return AccessLevel::PRIVATE;
  }
  return AccessLevel::PACKAGE;
}

inline DeclAccessFlags with_access_level(DeclAccessFlags flags,
                                         AccessLevel level) {
  flags = flags & ~VISIBILITY_MASK;
  switch (level) {
  case AccessLevel::PRIVATE:
    return flags | ACC_PRIVATE;
  case AccessLevel::PACKAGE:
    return flags;
  case AccessLevel::PROTECTED:
    return flags | ACC_PROTECTED;
  case AccessLevel::PUBLIC:
    return flags | ACC_PUBLIC;
  }
  return flags;
}

/*
 * Looks up a single modifier by its lowercase name ("static", "abstract",
 * ...).
 */
boost::optional<DeclAccessFlags> parse_access_flag(const std::string& name);

std::string show_access_flags(DeclAccessFlags flags);
