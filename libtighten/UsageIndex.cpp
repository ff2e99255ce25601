/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "UsageIndex.h"

size_t InMemoryUsageIndex::num_usages(const Declaration* decl) const {
  auto it = m_usages.find(decl);
  return it == m_usages.end() ? 0 : it->second.size();
}

bool InMemoryUsageIndex::process(const SiteMap& sites,
                                 const Declaration* decl,
                                 const CancellationToken& token,
                                 const UsageVisitor& visitor) {
  auto it = sites.find(decl);
  if (it == sites.end()) {
    return !token.is_cancelled();
  }
  for (const auto& site : it->second) {
    if (token.is_cancelled() || !visitor(site)) {
      return false;
    }
  }
  return true;
}

bool InMemoryUsageIndex::process_usages(const Declaration* decl,
                                        const CancellationToken& token,
                                        const UsageVisitor& visitor) const {
  return process(m_usages, decl, token, visitor);
}

bool InMemoryUsageIndex::process_functional_conversions(
    const Declaration* type,
    const CancellationToken& token,
    const UsageVisitor& visitor) const {
  return process(m_conversions, type, token, visitor);
}
