/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <functional>
#include <unordered_map>
#include <vector>

#include "CancellationToken.h"
#include "UsageSite.h"

class Declaration;

// Returns false to stop the search.
using UsageVisitor = std::function<bool(const UsageSite&)>;

/*
 * Yields the usage sites of a declaration in a stable order. Implementations
 * must allow concurrent searches.
 */
class UsageIndex {
 public:
  virtual ~UsageIndex() {}

  /*
   * Feeds every usage site of `decl` to `visitor`. Returns false if the
   * visitor stopped the search or the token was cancelled, true if every site
   * was visited.
   */
  virtual bool process_usages(const Declaration* decl,
                              const CancellationToken& token,
                              const UsageVisitor& visitor) const = 0;

  /*
   * Like process_usages, for the places where a lambda or method reference
   * is implicitly converted to the functional type `type`.
   */
  virtual bool process_functional_conversions(
      const Declaration* type,
      const CancellationToken& token,
      const UsageVisitor& visitor) const = 0;
};

/*
 * Holds the sites in memory, in insertion order. Populate it before any
 * search starts; it is read-only afterwards.
 */
class InMemoryUsageIndex final : public UsageIndex {
 public:
  void add_usage(const Declaration* decl, const UsageSite& site) {
    m_usages[decl].push_back(site);
  }

  void add_functional_conversion(const Declaration* type,
                                 const UsageSite& site) {
    m_conversions[type].push_back(site);
  }

  size_t num_usages(const Declaration* decl) const;

  bool process_usages(const Declaration* decl,
                      const CancellationToken& token,
                      const UsageVisitor& visitor) const override;

  bool process_functional_conversions(
      const Declaration* type,
      const CancellationToken& token,
      const UsageVisitor& visitor) const override;

 private:
  using SiteMap =
      std::unordered_map<const Declaration*, std::vector<UsageSite>>;

  static bool process(const SiteMap& sites,
                      const Declaration* decl,
                      const CancellationToken& token,
                      const UsageVisitor& visitor);

  SiteMap m_usages;
  SiteMap m_conversions;
};
