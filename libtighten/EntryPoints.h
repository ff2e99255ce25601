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
#include <unordered_set>
#include <utility>
#include <vector>

#include <boost/optional.hpp>

#include "AccessLevel.h"

class Declaration;

/*
 * Decides whether a declaration is reachable from outside the normal flow
 * (reflection, frameworks, serialization, ...) and, if so, the least access
 * level it must keep.
 */
class EntryPointProvider {
 public:
  virtual ~EntryPointProvider() {}

  virtual std::string name() const = 0;

  virtual bool is_entry_point(const Declaration* decl) const = 0;

  /*
   * Only consulted for entry points. boost::none means the declaration has
   * to keep whatever level it currently has.
   */
  virtual boost::optional<AccessLevel> min_visibility(
      const Declaration* /* decl */) const {
    return boost::none;
  }
};

/*
 * Entry points are declarations annotated with one of the configured
 * annotations. Each annotation maps to an optional floor.
 */
class AnnotatedEntryPoints final : public EntryPointProvider {
 public:
  using Rules =
      std::unordered_map<std::string, boost::optional<AccessLevel>>;

  explicit AnnotatedEntryPoints(Rules rules) : m_rules(std::move(rules)) {}

  std::string name() const override { return "annotated"; }
  bool is_entry_point(const Declaration* decl) const override;
  boost::optional<AccessLevel> min_visibility(
      const Declaration* decl) const override;

 private:
  Rules m_rules;
};

/*
 * The hooks the Java serialization runtime finds reflectively
 * (serialVersionUID, writeObject, readResolve, ...) on types implementing
 * java.io.Serializable.
 */
class SerializationEntryPoints final : public EntryPointProvider {
 public:
  std::string name() const override { return "serialization"; }
  bool is_entry_point(const Declaration* decl) const override;
};

// Declarations explicitly kept by qualified name.
class KeepListEntryPoints final : public EntryPointProvider {
 public:
  explicit KeepListEntryPoints(std::unordered_set<std::string> names)
      : m_names(std::move(names)) {}

  std::string name() const override { return "keep"; }
  bool is_entry_point(const Declaration* decl) const override;

 private:
  std::unordered_set<std::string> m_names;
};

/*
 * Combines the injected providers. A declaration is an entry point if any
 * provider claims it. Its floor is the highest floor among the claiming
 * providers, and absent as soon as one of them supplies none.
 */
class EntryPointOracle {
 public:
  EntryPointOracle() = default;
  EntryPointOracle(EntryPointOracle&&) = default;
  EntryPointOracle& operator=(EntryPointOracle&&) = default;

  void add_provider(std::unique_ptr<EntryPointProvider> provider) {
    m_providers.push_back(std::move(provider));
  }

  size_t num_providers() const { return m_providers.size(); }

  bool is_entry_point(const Declaration* decl) const;

  boost::optional<AccessLevel> min_visibility(const Declaration* decl) const;

 private:
  std::vector<std::unique_ptr<EntryPointProvider>> m_providers;
};
