/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "Show.h"

#include "AccessLevel.h"
#include "Declaration.h"
#include "UsageSite.h"

std::string show(const Declaration* decl) {
  if (decl == nullptr) {
    return "";
  }
  std::ostringstream ss;
  ss << show_kind(decl->get_kind()) << " " << decl->str();
  if (decl->has_access()) {
    auto flags = show_access_flags(decl->get_access());
    if (!flags.empty()) {
      ss << " [" << flags << "]";
    }
  } else {
    ss << " [malformed]";
  }
  return ss.str();
}

std::string show(const Scope* scope) {
  if (scope == nullptr) {
    return "";
  }
  return scope->str().empty() ? "<default>" : scope->str();
}

std::string show(const UsageSite& site) {
  std::ostringstream ss;
  if (!site.in_source) {
    ss << "<non-source>";
    return ss.str();
  }
  ss << "in " << show(site.scope);
  if (site.type != nullptr) {
    ss << " from " << site.type->str();
  }
  ss << " qualifier=" << show_qualifier(site.qualifier);
  if (site.qualifier == Qualifier::EXPRESSION) {
    ss << ":"
       << (site.qualifier_type == nullptr ? "<unresolved>"
                                          : site.qualifier_type->str());
  }
  if (site.context != SiteContext::NORMAL) {
    ss << " context=" << show_site_context(site.context);
  }
  if (site.form != ReferenceForm::MEMBER) {
    ss << " form=" << show_reference_form(site.form);
  }
  return ss.str();
}

std::string show(AccessLevel level) { return access_presentable_text(level); }
