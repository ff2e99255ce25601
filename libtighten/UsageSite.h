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

class Declaration;
class Scope;

// How the referenced member is qualified at the site.
enum class Qualifier : uint8_t {
  NONE, // `f`
  THIS, // `this.f`
  SUPER, // `super.f()`
  EXPRESSION, // `obj.f`
};

// Where the reference appears structurally.
enum class SiteContext : uint8_t {
  NORMAL,
  REFERENCE_LIST, // extends/implements list
  ANNOTATION_ARGUMENT,
};

enum class ReferenceForm : uint8_t {
  MEMBER,
  CONSTRUCTION, // new-expression
  CONSTRUCTOR_CALL, // this(...) or super(...)
  UNRESOLVED, // the reference could not be bound
};

/*
 * One reference to a declaration. A site with `in_source` false lives in a
 * non-source descriptor (a manifest, a layout file, ...); the scope and type
 * are then meaningless.
 */
struct UsageSite {
  // Package of the referencing file.
  const Scope* scope{nullptr};
  // Innermost type enclosing the reference, if any.
  const Declaration* type{nullptr};
  bool in_source{true};
  Qualifier qualifier{Qualifier::NONE};
  // Static type of the qualifier; nullptr when it did not resolve.
  const Declaration* qualifier_type{nullptr};
  SiteContext context{SiteContext::NORMAL};
  ReferenceForm form{ReferenceForm::MEMBER};
};

const char* show_qualifier(Qualifier qualifier);
boost::optional<Qualifier> parse_qualifier(const std::string& str);
const char* show_site_context(SiteContext context);
boost::optional<SiteContext> parse_site_context(const std::string& str);
const char* show_reference_form(ReferenceForm form);
boost::optional<ReferenceForm> parse_reference_form(const std::string& str);
