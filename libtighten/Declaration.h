/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include <boost/optional.hpp>

#include "AccessLevel.h"
#include "DeclAccess.h"
#include "Debug.h"

using DeclId = uint32_t;

enum class DeclKind : uint8_t {
  TYPE,
  METHOD,
  FIELD,
  ENUM_CONSTANT,
};

enum class TypeForm : uint8_t {
  NAMED,
  ANONYMOUS,
  LOCAL,
  TYPE_PARAMETER,
};

const char* show_kind(DeclKind kind);
boost::optional<DeclKind> parse_kind(const std::string& str);
const char* show_type_form(TypeForm form);
boost::optional<TypeForm> parse_type_form(const std::string& str);

/*
 * A package. Scopes are interned by the DeclarationGraph, so two scopes are
 * the same package iff they are the same object.
 */
class Scope {
 public:
  const std::string& str() const { return m_name; }
  const char* c_str() const { return m_name.c_str(); }

 private:
  explicit Scope(std::string name) : m_name(std::move(name)) {}

  friend class DeclarationGraph;

  std::string m_name;
};

/*
 * A type, method, field or enum constant. Declarations are created and owned
 * by a DeclarationGraph and refer to each other by raw pointer.
 */
class Declaration {
 public:
  Declaration(const Declaration&) = delete;
  Declaration& operator=(const Declaration&) = delete;

  DeclId get_id() const { return m_id; }
  const std::string& get_name() const { return m_name; }
  DeclKind get_kind() const { return m_kind; }
  bool is_type() const { return m_kind == DeclKind::TYPE; }
  bool is_method() const { return m_kind == DeclKind::METHOD; }
  bool is_field() const { return m_kind == DeclKind::FIELD; }
  bool is_enum_constant() const { return m_kind == DeclKind::ENUM_CONSTANT; }

  // Fully qualified name, e.g. "com.foo.Outer.Inner.method".
  const std::string& str() const { return m_qualified_name; }
  const char* c_str() const { return m_qualified_name.c_str(); }

  /*
   * False when the modifiers could not be determined. Such declarations are
   * never resolved.
   */
  bool has_access() const { return !!m_access; }
  DeclAccessFlags get_access() const {
    always_assert_log(m_access, "Malformed modifiers on %s", c_str());
    return *m_access;
  }
  void set_access(DeclAccessFlags access) { m_access = access; }
  void clear_access() { m_access = boost::none; }

  AccessLevel get_access_level() const { return access_level(get_access()); }

  // The flag is set and the modifiers are well-formed.
  bool has_flag(DeclAccessFlags flag) const {
    return m_access && (*m_access & flag) == flag;
  }

  const Scope* get_scope() const { return m_scope; }
  const Declaration* get_container() const { return m_container; }
  const std::vector<const Declaration*>& get_members() const {
    return m_members;
  }

  TypeForm get_type_form() const { return m_type_form; }
  void set_type_form(TypeForm form) { m_type_form = form; }

  bool is_constructor() const { return m_is_constructor; }
  void set_constructor(bool is_constructor) {
    m_is_constructor = is_constructor;
  }

  bool has_initializer() const { return m_has_initializer; }
  void set_has_initializer(bool has_initializer) {
    m_has_initializer = has_initializer;
  }

  bool is_physical() const { return m_is_physical; }
  void set_physical(bool is_physical) { m_is_physical = is_physical; }

  // Direct supertypes (superclass and interfaces) of a type.
  const std::vector<const Declaration*>& get_supertypes() const {
    return m_supertypes;
  }

  // Methods of supertypes this method overrides or implements.
  const std::vector<const Declaration*>& get_super_methods() const {
    return m_super_methods;
  }

  // Methods of subtypes overriding or implementing this method.
  const std::vector<const Declaration*>& get_overriders() const {
    return m_overriders;
  }
  bool is_overridden() const { return !m_overriders.empty(); }

  const std::vector<std::string>& get_annotations() const {
    return m_annotations;
  }
  bool has_annotation(const std::string& annotation) const;
  void add_annotation(std::string annotation) {
    m_annotations.push_back(std::move(annotation));
  }

  bool is_top_level() const { return m_container == nullptr; }

  // A type nested in another type.
  bool is_inner_type() const { return is_type() && m_container != nullptr; }

  // 0 for declarations without a container.
  size_t nesting_depth() const;

  /*
   * Whether `this` is `other` or lexically encloses it.
   */
  bool encloses(const Declaration* other) const;

  /*
   * Whether this type is a proper subtype of `super`, directly or
   * transitively.
   */
  bool is_strict_subtype_of(const Declaration* super) const;

  // Whether this type is `super` or one of its subtypes.
  bool is_subtype_of(const Declaration* super) const {
    return this == super || is_strict_subtype_of(super);
  }

  // Whether the directly enclosing type is a local class.
  bool is_nested_in_local_class() const;

  /*
   * An interface, other than an annotation type, with exactly one abstract
   * method once inherited methods and their redeclarations are taken into
   * account.
   */
  bool is_functional_type() const;

 private:
  Declaration(DeclId id, std::string name, DeclKind kind, const Scope* scope);

  friend class DeclarationGraph;

  DeclId m_id;
  std::string m_name;
  std::string m_qualified_name;
  DeclKind m_kind;
  boost::optional<DeclAccessFlags> m_access;
  const Scope* m_scope;
  const Declaration* m_container{nullptr};
  std::vector<const Declaration*> m_members;
  TypeForm m_type_form{TypeForm::NAMED};
  bool m_is_constructor{false};
  bool m_has_initializer{false};
  bool m_is_physical{true};
  std::vector<const Declaration*> m_supertypes;
  std::vector<const Declaration*> m_super_methods;
  std::vector<const Declaration*> m_overriders;
  std::vector<std::string> m_annotations;
};

std::ostream& operator<<(std::ostream& os, const Declaration& decl);

inline bool compare_declarations(const Declaration* a, const Declaration* b) {
  return a->get_id() < b->get_id();
}
