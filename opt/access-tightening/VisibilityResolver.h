/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <ostream>

#include <boost/optional.hpp>

#include "AccessLevel.h"
#include "UsageClassifier.h"

class CancellationToken;
class Declaration;
class EntryPointOracle;
class ExtensibilityOracle;
class UsageIndex;

// clang-format off
#define SKIP_REASONS                                  \
  SR(CONSTANT,             "constant")                \
  SR(PRIVATE_OR_NATIVE,    "private_or_native")       \
  SR(SYNTHETIC,            "synthetic")               \
  SR(OVERRIDE,             "override")                \
  SR(ENUM_CONSTANT,        "enum_constant")           \
  SR(SPECIAL_TYPE,         "special_type")            \
  SR(RESTRICTED_CONTAINER, "restricted_container")    \
  SR(FORCED_SUBCLASSING,   "forced_subclassing")      \
  SR(ENTRY_POINT,          "entry_point")             \
  SR(NO_USAGES,            "no_usages")
// clang-format on

/*
 * Why a declaration kept its current level without a usage based answer.
 */
enum class SkipReason : uint8_t {
#define SR(name, str) name,
  SKIP_REASONS
#undef SR
};

constexpr size_t kNumSkipReasons = 0
#define SR(name, str) +1
    SKIP_REASONS
#undef SR
    ;

const char* show_skip_reason(SkipReason reason);

std::ostream& operator<<(std::ostream& os, SkipReason reason);

struct Resolution {
  // boost::none if the declaration could not be resolved.
  boost::optional<AccessLevel> level;
  boost::optional<SkipReason> skipped;
  bool entry_point{false};
  bool cancelled{false};
};

/*
 * The running join of one declaration's usage search. Both searches of a
 * functional type may feed the same accumulator concurrently.
 */
class UsageAccumulator {
 public:
  explicit UsageAccumulator(AccessLevel seed)
      : m_level(static_cast<uint8_t>(seed)) {}

  /*
   * Joins `level` in. Returns false once the join reached PUBLIC, as no
   * further site can change the answer.
   */
  bool add(AccessLevel level);

  AccessLevel level() const {
    return static_cast<AccessLevel>(m_level.load(std::memory_order_acquire));
  }

  void mark_found() { m_found.store(true, std::memory_order_relaxed); }
  bool found() const { return m_found.load(std::memory_order_relaxed); }

  void stop() { m_stopped.store(true, std::memory_order_release); }
  bool stopped() const { return m_stopped.load(std::memory_order_acquire); }

 private:
  std::atomic<uint8_t> m_level;
  std::atomic<bool> m_found{false};
  std::atomic<bool> m_stopped{false};
};

/*
 * Computes the least access level each declaration needs, from its usages,
 * ignoring containment. The resolver only reads the graph and the index, so
 * one instance can serve concurrent resolve() calls.
 */
class VisibilityResolver {
 public:
  VisibilityResolver(const UsageIndex& index,
                     const EntryPointOracle& entry_points,
                     const ExtensibilityOracle& extensibility,
                     const TighteningPolicy& policy,
                     const CancellationToken& token)
      : m_index(index),
        m_entry_points(entry_points),
        m_extensibility(extensibility),
        m_policy(policy),
        m_classifier(policy),
        m_token(token) {}

  /*
   * The suggested level of `member`, or boost::none when its modifiers are
   * malformed or the search was cancelled. Skipped declarations yield their
   * current level.
   */
  boost::optional<AccessLevel> suggest_level(const Declaration* member) const {
    return resolve(member).level;
  }

  Resolution resolve(const Declaration* member) const;

  const UsageClassifier& classifier() const { return m_classifier; }

 private:
  boost::optional<SkipReason> skip_reason(const Declaration* member) const;

  // Returns false if the token was cancelled during the search.
  bool search(const Declaration* member, UsageAccumulator& acc) const;

  const UsageIndex& m_index;
  const EntryPointOracle& m_entry_points;
  const ExtensibilityOracle& m_extensibility;
  TighteningPolicy m_policy;
  UsageClassifier m_classifier;
  const CancellationToken& m_token;
};
