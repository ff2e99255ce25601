/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "Declaration.h"

/*
 * Owns every Declaration and Scope of one analysis run, together with the
 * containment and override relations between them. Declarations get dense
 * ids in creation order.
 *
 * The graph is built single-threaded and is read-only afterwards, so
 * concurrent queries need no synchronization.
 */
class DeclarationGraph {
 public:
  DeclarationGraph() = default;
  DeclarationGraph(const DeclarationGraph&) = delete;
  DeclarationGraph& operator=(const DeclarationGraph&) = delete;

  // Interns the package. The default package is the empty string.
  const Scope* make_scope(const std::string& name);

  // Returns nullptr if no such scope was made.
  const Scope* get_scope(const std::string& name) const;

  /*
   * Creates a declaration with package-private modifiers. A member without an
   * explicit scope is placed in its container's package.
   */
  Declaration* make_declaration(const std::string& name,
                                DeclKind kind,
                                const Scope* scope,
                                const Declaration* container = nullptr);

  void add_supertype(Declaration* type, const Declaration* super);

  // Records that `method` overrides or implements `overridden`.
  void add_override(Declaration* method, Declaration* overridden);

  size_t size() const { return m_decls.size(); }

  const Declaration* get(DeclId id) const { return m_decls.at(id).get(); }
  Declaration* get(DeclId id) { return m_decls.at(id).get(); }

  std::vector<const Declaration*> declarations() const;

  std::vector<const Declaration*> types() const;

  /*
   * All types bucketed by nesting depth: index 0 holds the top-level types,
   * the last bucket the most deeply nested ones.
   */
  std::vector<std::vector<const Declaration*>> types_by_depth() const;

  /*
   * Declarations whose qualified name is `name`. Overloaded methods share a
   * qualified name, hence the vector.
   */
  std::vector<const Declaration*> find(const std::string& name) const;

 private:
  std::vector<std::unique_ptr<Declaration>> m_decls;
  std::unordered_map<std::string, std::unique_ptr<Scope>> m_scopes;
  std::unordered_map<std::string, std::vector<const Declaration*>> m_by_name;
};
