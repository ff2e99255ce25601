/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "VisibilityResolver.h"

#include <vector>

#include "CancellationToken.h"
#include "Declaration.h"
#include "EntryPoints.h"
#include "Extensibility.h"
#include "Show.h"
#include "Timer.h"
#include "Trace.h"
#include "UsageIndex.h"
#include "WorkQueue.h"

namespace {

AccumulatingTimer s_search_timer("VisibilityResolver.search");

bool is_constant(const Declaration* member) {
  return member->is_field() && member->has_flag(ACC_STATIC) &&
         member->has_flag(ACC_FINAL) && member->has_initializer();
}

// Members of these containers have their access fixed by the language.
bool is_restricted_container(const Declaration* container) {
  return container->has_flag(ACC_INTERFACE) || container->has_flag(ACC_ENUM) ||
         container->has_flag(ACC_ANNOTATION);
}

enum class SearchKind { USAGES, FUNCTIONAL_CONVERSIONS };

} // namespace

const char* show_skip_reason(SkipReason reason) {
  switch (reason) {
#define SR(name, str)      \
  case SkipReason::name:   \
    return str;
    SKIP_REASONS
#undef SR
  }
  not_reached();
}

std::ostream& operator<<(std::ostream& os, SkipReason reason) {
  return os << show_skip_reason(reason);
}

bool UsageAccumulator::add(AccessLevel level) {
  auto value = static_cast<uint8_t>(level);
  auto current = m_level.load(std::memory_order_relaxed);
  while (current < value &&
         !m_level.compare_exchange_weak(current, value,
                                        std::memory_order_acq_rel)) {
  }
  if (level == AccessLevel::PUBLIC) {
    stop();
  }
  return !stopped();
}

boost::optional<SkipReason> VisibilityResolver::skip_reason(
    const Declaration* member) const {
  if (is_constant(member) && !m_policy.suggest_for_constants) {
    return SkipReason::CONSTANT;
  }
  if (is_private(member) || is_native(member)) {
    return SkipReason::PRIVATE_OR_NATIVE;
  }
  if ((member->is_method() && is_synthetic(member)) ||
      !member->is_physical()) {
    return SkipReason::SYNTHETIC;
  }
  if (member->is_method() &&
      (!member->get_super_methods().empty() || member->is_overridden())) {
    return SkipReason::OVERRIDE;
  }
  if (member->is_enum_constant()) {
    return SkipReason::ENUM_CONSTANT;
  }
  if (member->is_type() && (member->get_type_form() != TypeForm::NAMED ||
                            is_synthetic(member))) {
    return SkipReason::SPECIAL_TYPE;
  }
  auto* container = member->get_container();
  if ((container != nullptr && is_restricted_container(container)) ||
      (member->is_type() && member->is_nested_in_local_class())) {
    return SkipReason::RESTRICTED_CONTAINER;
  }
  if (member->is_method() && container != nullptr &&
      m_extensibility.is_forced(member, container)) {
    return SkipReason::FORCED_SUBCLASSING;
  }
  return boost::none;
}

bool VisibilityResolver::search(const Declaration* member,
                                UsageAccumulator& acc) const {
  auto timer_scope = s_search_timer.scope();
  auto visitor = [&](const UsageSite& site) {
    if (acc.stopped()) {
      return false;
    }
    acc.mark_found();
    if (!site.in_source) {
      TRACE(ACCESS, 4, "%s is referenced outside of source", SHOW(member));
      acc.add(AccessLevel::PUBLIC);
      return false;
    }
    return acc.add(m_classifier.classify(site, member));
  };
  auto run = [&](SearchKind kind) {
    if (kind == SearchKind::USAGES) {
      m_index.process_usages(member, m_token, visitor);
    } else {
      m_index.process_functional_conversions(member, m_token, visitor);
    }
  };

  bool functional = member->is_functional_type();
  if (functional && m_policy.parallel_usage_search) {
    std::vector<SearchKind> kinds{SearchKind::USAGES,
                                  SearchKind::FUNCTIONAL_CONVERSIONS};
    workqueue_run<SearchKind>(run, kinds, /* num_threads */ 2);
  } else {
    run(SearchKind::USAGES);
    if (functional && !acc.stopped() && !m_token.is_cancelled()) {
      run(SearchKind::FUNCTIONAL_CONVERSIONS);
    }
  }
  return !m_token.is_cancelled();
}

Resolution VisibilityResolver::resolve(const Declaration* member) const {
  TraceContext context(member);
  Resolution res;
  if (!member->has_access()) {
    TRACE(ACCESS, 2, "Unresolved: %s", SHOW(member));
    return res;
  }
  auto current = member->get_access_level();

  if (auto reason = skip_reason(member)) {
    TRACE(ACCESS, 3, "Skipping %s: %s", SHOW(member),
          show_skip_reason(*reason));
    res.level = current;
    res.skipped = reason;
    return res;
  }

  auto min_level = AccessLevel::PRIVATE;
  if (m_entry_points.is_entry_point(member)) {
    res.entry_point = true;
    auto floor = m_entry_points.min_visibility(member);
    if (!floor) {
      res.level = current;
      res.skipped = SkipReason::ENTRY_POINT;
      return res;
    }
    min_level = *floor;
  }

  UsageAccumulator acc(min_level);
  if (!search(member, acc)) {
    TRACE(ACCESS, 2, "Cancelled: %s", SHOW(member));
    res.cancelled = true;
    return res;
  }
  if (!acc.found() && !res.entry_point) {
    res.level = current;
    res.skipped = SkipReason::NO_USAGES;
    return res;
  }

  auto level = acc.level();
  if (level == AccessLevel::PRIVATE && member->get_container() == nullptr) {
    level = m_classifier.package_local_level(member);
  }
  TRACE(ACCESS, 3, "%s: %s -> %s", SHOW(member), SHOW(current), SHOW(level));
  res.level = level;
  return res;
}
