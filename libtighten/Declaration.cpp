/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "Declaration.h"

#include <algorithm>
#include <unordered_set>

const char* show_kind(DeclKind kind) {
  switch (kind) {
  case DeclKind::TYPE:
    return "type";
  case DeclKind::METHOD:
    return "method";
  case DeclKind::FIELD:
    return "field";
  case DeclKind::ENUM_CONSTANT:
    return "enum_constant";
  }
  not_reached();
}

boost::optional<DeclKind> parse_kind(const std::string& str) {
  if (str == "type") {
    return DeclKind::TYPE;
  } else if (str == "method") {
    return DeclKind::METHOD;
  } else if (str == "field") {
    return DeclKind::FIELD;
  } else if (str == "enum_constant") {
    return DeclKind::ENUM_CONSTANT;
  }
  return boost::none;
}

const char* show_type_form(TypeForm form) {
  switch (form) {
  case TypeForm::NAMED:
    return "named";
  case TypeForm::ANONYMOUS:
    return "anonymous";
  case TypeForm::LOCAL:
    return "local";
  case TypeForm::TYPE_PARAMETER:
    return "type_parameter";
  }
  not_reached();
}

boost::optional<TypeForm> parse_type_form(const std::string& str) {
  if (str == "named") {
    return TypeForm::NAMED;
  } else if (str == "anonymous") {
    return TypeForm::ANONYMOUS;
  } else if (str == "local") {
    return TypeForm::LOCAL;
  } else if (str == "type_parameter") {
    return TypeForm::TYPE_PARAMETER;
  }
  return boost::none;
}

Declaration::Declaration(DeclId id,
                         std::string name,
                         DeclKind kind,
                         const Scope* scope)
    : m_id(id), m_name(std::move(name)), m_kind(kind), m_scope(scope) {}

bool Declaration::has_annotation(const std::string& annotation) const {
  return std::find(m_annotations.begin(), m_annotations.end(), annotation) !=
         m_annotations.end();
}

size_t Declaration::nesting_depth() const {
  size_t depth = 0;
  for (auto* c = m_container; c != nullptr; c = c->m_container) {
    ++depth;
  }
  return depth;
}

bool Declaration::encloses(const Declaration* other) const {
  for (auto* d = other; d != nullptr; d = d->m_container) {
    if (d == this) {
      return true;
    }
  }
  return false;
}

bool Declaration::is_strict_subtype_of(const Declaration* super) const {
  if (super == nullptr || super == this) {
    return false;
  }
  std::unordered_set<const Declaration*> visited;
  std::vector<const Declaration*> worklist(m_supertypes.begin(),
                                           m_supertypes.end());
  while (!worklist.empty()) {
    auto* t = worklist.back();
    worklist.pop_back();
    if (t == super) {
      return true;
    }
    if (!visited.insert(t).second) {
      continue;
    }
    worklist.insert(worklist.end(), t->m_supertypes.begin(),
                    t->m_supertypes.end());
  }
  return false;
}

bool Declaration::is_nested_in_local_class() const {
  return m_container != nullptr && m_container->m_type_form == TypeForm::LOCAL;
}

bool Declaration::is_functional_type() const {
  if (!is_type() || !has_flag(ACC_INTERFACE) || has_flag(ACC_ANNOTATION)) {
    return false;
  }
  std::vector<const Declaration*> abstract_methods;
  std::unordered_set<const Declaration*> visited;
  std::vector<const Declaration*> worklist{this};
  while (!worklist.empty()) {
    auto* t = worklist.back();
    worklist.pop_back();
    if (!visited.insert(t).second) {
      continue;
    }
    for (auto* m : t->m_members) {
      if (m->is_method() && m->has_flag(ACC_ABSTRACT) &&
          !m->has_flag(ACC_STATIC)) {
        abstract_methods.push_back(m);
      }
    }
    worklist.insert(worklist.end(), t->m_supertypes.begin(),
                    t->m_supertypes.end());
  }
  // A redeclaration in a subinterface stands for the method it overrides.
  std::unordered_set<const Declaration*> redeclared;
  for (auto* m : abstract_methods) {
    redeclared.insert(m->m_super_methods.begin(), m->m_super_methods.end());
  }
  size_t count = std::count_if(
      abstract_methods.begin(), abstract_methods.end(),
      [&](const Declaration* m) { return redeclared.count(m) == 0; });
  return count == 1;
}

std::ostream& operator<<(std::ostream& os, const Declaration& decl) {
  return os << decl.str();
}
