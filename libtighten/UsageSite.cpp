/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "UsageSite.h"

#include "Debug.h"

const char* show_qualifier(Qualifier qualifier) {
  switch (qualifier) {
  case Qualifier::NONE:
    return "none";
  case Qualifier::THIS:
    return "this";
  case Qualifier::SUPER:
    return "super";
  case Qualifier::EXPRESSION:
    return "expression";
  }
  not_reached();
}

boost::optional<Qualifier> parse_qualifier(const std::string& str) {
  if (str == "none") {
    return Qualifier::NONE;
  } else if (str == "this") {
    return Qualifier::THIS;
  } else if (str == "super") {
    return Qualifier::SUPER;
  } else if (str == "expression") {
    return Qualifier::EXPRESSION;
  }
  return boost::none;
}

const char* show_site_context(SiteContext context) {
  switch (context) {
  case SiteContext::NORMAL:
    return "normal";
  case SiteContext::REFERENCE_LIST:
    return "reference_list";
  case SiteContext::ANNOTATION_ARGUMENT:
    return "annotation_argument";
  }
  not_reached();
}

boost::optional<SiteContext> parse_site_context(const std::string& str) {
  if (str == "normal") {
    return SiteContext::NORMAL;
  } else if (str == "reference_list") {
    return SiteContext::REFERENCE_LIST;
  } else if (str == "annotation_argument") {
    return SiteContext::ANNOTATION_ARGUMENT;
  }
  return boost::none;
}

const char* show_reference_form(ReferenceForm form) {
  switch (form) {
  case ReferenceForm::MEMBER:
    return "member";
  case ReferenceForm::CONSTRUCTION:
    return "construction";
  case ReferenceForm::CONSTRUCTOR_CALL:
    return "constructor_call";
  case ReferenceForm::UNRESOLVED:
    return "unresolved";
  }
  not_reached();
}

boost::optional<ReferenceForm> parse_reference_form(const std::string& str) {
  if (str == "member") {
    return ReferenceForm::MEMBER;
  } else if (str == "construction") {
    return ReferenceForm::CONSTRUCTION;
  } else if (str == "constructor_call") {
    return ReferenceForm::CONSTRUCTOR_CALL;
  } else if (str == "unresolved") {
    return ReferenceForm::UNRESOLVED;
  }
  return boost::none;
}
