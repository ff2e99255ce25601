/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "ContainmentAggregator.h"

#include "AtomicStatCounter.h"
#include "DeclarationGraph.h"
#include "Show.h"
#include "Timer.h"
#include "Trace.h"
#include "WorkQueue.h"

AccessLevel ContainmentAggregator::required_level(const Declaration* decl,
                                                  const Levels& resolved) {
  if (!decl->has_access()) {
    return AccessLevel::PUBLIC;
  }
  const auto& level = resolved.at(decl->get_id());
  return level ? *level : decl->get_access_level();
}

size_t ContainmentAggregator::aggregate(const Levels& resolved,
                                        Levels& suggestions,
                                        ContainerLevels& levels) const {
  Timer t("Aggregating containment");
  always_assert(resolved.size() == m_graph.size());
  always_assert(suggestions.size() == m_graph.size());

  // What plain members need is known once resolution is over.
  std::vector<const Declaration*> members;
  for (auto* decl : m_graph.declarations()) {
    if (!decl->is_type() && decl->get_container() != nullptr) {
      members.push_back(decl);
    }
  }
  workqueue_run<const Declaration*>(
      [&](const Declaration* member) {
        levels.record(member->get_container(),
                      required_level(member, resolved));
      },
      members, m_num_threads);

  AtomicStatCounter<size_t> withdrawn(0);
  auto buckets = m_graph.types_by_depth();
  for (auto it = buckets.rbegin(); it != buckets.rend(); ++it) {
    // Types of equal depth never contain each other.
    workqueue_run<const Declaration*>(
        [&](const Declaration* type) {
          auto child_max = levels.get(type);
          auto& suggestion = suggestions[type->get_id()];
          if (suggestion && *suggestion < child_max) {
            TRACE(AGGR, 2, "Withdrawing %s for %s: members need %s",
                  SHOW(*suggestion), SHOW(type), SHOW(child_max));
            suggestion = boost::none;
            ++withdrawn;
          }
          if (type->get_container() != nullptr) {
            levels.record(type->get_container(),
                          join(required_level(type, resolved), child_max));
          }
        },
        *it, m_num_threads);
  }
  TRACE(AGGR, 1, "Withdrew %zu suggestions", withdrawn.load());
  return withdrawn.load();
}
