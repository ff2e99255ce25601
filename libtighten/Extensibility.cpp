/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "Extensibility.h"

#include "Declaration.h"
#include "Show.h"
#include "Trace.h"

bool AnnotatedSubclassProvider::is_applicable_to(
    const Declaration* container) const {
  for (const auto& anno : container->get_annotations()) {
    if (m_rules.count(anno)) {
      return true;
    }
  }
  return false;
}

boost::optional<SubclassingInfo> AnnotatedSubclassProvider::get_subclassing_info(
    const Declaration* container) const {
  std::unordered_set<std::string> method_annotations;
  bool matched = false;
  for (const auto& anno : container->get_annotations()) {
    auto it = m_rules.find(anno);
    if (it == m_rules.end()) {
      continue;
    }
    matched = true;
    if (it->second.empty()) {
      return SubclassingInfo{boost::none};
    }
    method_annotations.insert(it->second.begin(), it->second.end());
  }
  if (!matched) {
    return boost::none;
  }
  std::unordered_set<const Declaration*> forced;
  for (auto* member : container->get_members()) {
    if (!member->is_method()) {
      continue;
    }
    for (const auto& anno : member->get_annotations()) {
      if (method_annotations.count(anno)) {
        forced.insert(member);
        break;
      }
    }
  }
  return SubclassingInfo{std::move(forced)};
}

bool ExtensibilityOracle::is_forced(const Declaration* method,
                                    const Declaration* container) const {
  for (const auto& provider : m_providers) {
    if (!provider->is_applicable_to(container)) {
      continue;
    }
    auto info = provider->get_subclassing_info(container);
    if (!info) {
      continue;
    }
    if (info->forces(method)) {
      TRACE(EXTEND, 3, "%s is forced by %s subclassing of %s", SHOW(method),
            provider->name().c_str(), SHOW(container));
      return true;
    }
  }
  return false;
}
