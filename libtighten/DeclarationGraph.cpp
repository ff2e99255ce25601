/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "DeclarationGraph.h"

#include <algorithm>
#include <limits>

#include "Debug.h"

const Scope* DeclarationGraph::make_scope(const std::string& name) {
  auto it = m_scopes.find(name);
  if (it != m_scopes.end()) {
    return it->second.get();
  }
  auto* scope = new Scope(name);
  m_scopes.emplace(name, std::unique_ptr<Scope>(scope));
  return scope;
}

const Scope* DeclarationGraph::get_scope(const std::string& name) const {
  auto it = m_scopes.find(name);
  return it == m_scopes.end() ? nullptr : it->second.get();
}

Declaration* DeclarationGraph::make_declaration(const std::string& name,
                                                DeclKind kind,
                                                const Scope* scope,
                                                const Declaration* container) {
  always_assert_log(container == nullptr || container->is_type(),
                    "Container of %s is not a type: %s", name.c_str(),
                    container->c_str());
  always_assert_log(container == nullptr ||
                        (container->get_id() < m_decls.size() &&
                         m_decls[container->get_id()].get() == container),
                    "Container of %s belongs to another graph", name.c_str());
  always_assert(m_decls.size() < std::numeric_limits<DeclId>::max());
  if (scope == nullptr) {
    always_assert_log(container != nullptr,
                      "Top-level declaration %s needs a scope", name.c_str());
    scope = container->get_scope();
  }

  auto id = static_cast<DeclId>(m_decls.size());
  std::unique_ptr<Declaration> decl(new Declaration(id, name, kind, scope));
  decl->m_access = ACC_NONE;
  decl->m_container = container;
  if (container != nullptr) {
    decl->m_qualified_name = container->str() + "." + name;
    get(container->get_id())->m_members.push_back(decl.get());
  } else if (scope->str().empty()) {
    decl->m_qualified_name = name;
  } else {
    decl->m_qualified_name = scope->str() + "." + name;
  }
  auto* raw = decl.get();
  m_by_name[raw->str()].push_back(raw);
  m_decls.push_back(std::move(decl));
  return raw;
}

void DeclarationGraph::add_supertype(Declaration* type,
                                     const Declaration* super) {
  always_assert(type->is_type() && super->is_type());
  always_assert_log(type != super, "%s cannot extend itself", type->c_str());
  type->m_supertypes.push_back(super);
}

void DeclarationGraph::add_override(Declaration* method,
                                    Declaration* overridden) {
  always_assert(method->is_method() && overridden->is_method());
  method->m_super_methods.push_back(overridden);
  overridden->m_overriders.push_back(method);
}

std::vector<const Declaration*> DeclarationGraph::declarations() const {
  std::vector<const Declaration*> decls;
  decls.reserve(m_decls.size());
  for (const auto& decl : m_decls) {
    decls.push_back(decl.get());
  }
  return decls;
}

std::vector<const Declaration*> DeclarationGraph::types() const {
  std::vector<const Declaration*> types;
  for (const auto& decl : m_decls) {
    if (decl->is_type()) {
      types.push_back(decl.get());
    }
  }
  return types;
}

std::vector<std::vector<const Declaration*>> DeclarationGraph::types_by_depth()
    const {
  std::vector<std::vector<const Declaration*>> buckets;
  for (const auto& decl : m_decls) {
    if (!decl->is_type()) {
      continue;
    }
    auto depth = decl->nesting_depth();
    if (buckets.size() <= depth) {
      buckets.resize(depth + 1);
    }
    buckets[depth].push_back(decl.get());
  }
  return buckets;
}

std::vector<const Declaration*> DeclarationGraph::find(
    const std::string& name) const {
  auto it = m_by_name.find(name);
  if (it == m_by_name.end()) {
    return {};
  }
  return it->second;
}
