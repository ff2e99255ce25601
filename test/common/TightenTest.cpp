/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "TightenTest.h"

#include "VisibilityResolver.h"

Declaration* TightenTest::make_type(const std::string& pkg,
                                    const std::string& name,
                                    DeclAccessFlags access) {
  auto* type =
      graph.make_declaration(name, DeclKind::TYPE, graph.make_scope(pkg));
  type->set_access(access);
  return type;
}

Declaration* TightenTest::make_nested_type(const Declaration* outer,
                                           const std::string& name,
                                           DeclAccessFlags access) {
  auto* type = graph.make_declaration(name, DeclKind::TYPE, nullptr, outer);
  type->set_access(access);
  return type;
}

Declaration* TightenTest::make_method(const Declaration* container,
                                      const std::string& name,
                                      DeclAccessFlags access) {
  auto* method =
      graph.make_declaration(name, DeclKind::METHOD, nullptr, container);
  method->set_access(access);
  return method;
}

Declaration* TightenTest::make_field(const Declaration* container,
                                     const std::string& name,
                                     DeclAccessFlags access) {
  auto* field =
      graph.make_declaration(name, DeclKind::FIELD, nullptr, container);
  field->set_access(access);
  return field;
}

UsageSite TightenTest::site_from(const Declaration* from) const {
  UsageSite site;
  site.scope = from->get_scope();
  site.type = from;
  return site;
}

UsageSite TightenTest::site_in_package(const std::string& pkg) {
  UsageSite site;
  site.scope = graph.make_scope(pkg);
  return site;
}

UsageSite TightenTest::non_source_site() const {
  UsageSite site;
  site.in_source = false;
  return site;
}

UsageSite TightenTest::qualified_site_from(
    const Declaration* from, const Declaration* qualifier_type) const {
  auto site = site_from(from);
  site.qualifier = Qualifier::EXPRESSION;
  site.qualifier_type = qualifier_type;
  return site;
}

boost::optional<AccessLevel> TightenTest::suggest(
    const Declaration* decl, const TighteningPolicy& policy) const {
  VisibilityResolver resolver(index, no_entry_points, no_extensibility, policy,
                              token);
  return resolver.suggest_level(decl);
}
