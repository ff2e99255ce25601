/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "UsageClassifier.h"

#include "Declaration.h"
#include "Show.h"
#include "Trace.h"
#include "UsageSite.h"

namespace {

bool is_construction(ReferenceForm form) {
  return form == ReferenceForm::CONSTRUCTION ||
         form == ReferenceForm::CONSTRUCTOR_CALL;
}

// The receiver is statically typed as a proper subtype of the container.
bool is_called_on_inheritor(const UsageSite& site,
                            const Declaration* container) {
  return site.qualifier == Qualifier::EXPRESSION &&
         site.qualifier_type != nullptr &&
         site.qualifier_type->is_strict_subtype_of(container);
}

} // namespace

AccessLevel UsageClassifier::package_local_level(
    const Declaration* member) const {
  bool allowed = member->is_type() && member->is_top_level()
                     ? m_policy.suggest_package_local_for_top_classes
                     : m_policy.suggest_package_local_for_members;
  return allowed ? AccessLevel::PACKAGE : AccessLevel::PUBLIC;
}

bool UsageClassifier::is_local_access(const UsageSite& site,
                                      const Declaration* container) const {
  if (container == nullptr || site.type == nullptr) {
    return false;
  }
  if (site.type->encloses(container)) {
    return true;
  }
  return container->encloses(site.type) && !site.type->has_flag(ACC_STATIC);
}

AccessLevel UsageClassifier::classify(const UsageSite& site,
                                      const Declaration* member) const {
  return classify(site, member, member->get_container(), member->get_scope());
}

AccessLevel UsageClassifier::classify(const UsageSite& site,
                                      const Declaration* member,
                                      const Declaration* container,
                                      const Scope* declaring_scope) const {
  if (is_local_access(site, container)) {
    if (site.context != SiteContext::NORMAL) {
      TRACE(CLASSIFY, 5, "%s: local, structural context", SHOW(site));
      return package_local_level(member);
    }
    if (member->has_flag(ACC_ABSTRACT) ||
        is_called_on_inheritor(site, container)) {
      TRACE(CLASSIFY, 5, "%s: local, virtual dispatch", SHOW(site));
      return package_local_level(member);
    }
    if (container->is_inner_type() && !m_policy.suggest_private_for_inners) {
      TRACE(CLASSIFY, 5, "%s: local, nested container", SHOW(site));
      return package_local_level(member);
    }
    TRACE(CLASSIFY, 5, "%s: private", SHOW(site));
    return AccessLevel::PRIVATE;
  }

  if (site.scope == declaring_scope) {
    if (site.qualifier != Qualifier::EXPRESSION ||
        (site.qualifier_type != nullptr &&
         site.qualifier_type->get_scope() == site.scope)) {
      TRACE(CLASSIFY, 5, "%s: same package", SHOW(site));
      return package_local_level(member);
    }
  }

  if (site.qualifier == Qualifier::EXPRESSION) {
    TRACE(CLASSIFY, 5, "%s: qualified access", SHOW(site));
    return AccessLevel::PUBLIC;
  }

  if (site.type != nullptr && container != nullptr &&
      site.type->is_strict_subtype_of(container) &&
      site.form != ReferenceForm::UNRESOLVED && !is_construction(site.form)) {
    TRACE(CLASSIFY, 5, "%s: subtype access", SHOW(site));
    return AccessLevel::PROTECTED;
  }

  TRACE(CLASSIFY, 5, "%s: public", SHOW(site));
  return AccessLevel::PUBLIC;
}
