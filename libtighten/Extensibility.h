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

class Declaration;

/*
 * What a framework requires of the subclasses it generates for a container.
 * Without a method set every method of the container is forced to stay
 * overridable from the generated code.
 */
struct SubclassingInfo {
  boost::optional<std::unordered_set<const Declaration*>> forced_methods;

  bool forces(const Declaration* method) const {
    return !forced_methods || forced_methods->count(method) != 0;
  }
};

class ImplicitSubclassProvider {
 public:
  virtual ~ImplicitSubclassProvider() {}

  virtual std::string name() const = 0;

  virtual bool is_applicable_to(const Declaration* container) const = 0;

  // boost::none when the provider puts no constraint on the container.
  virtual boost::optional<SubclassingInfo> get_subclassing_info(
      const Declaration* container) const = 0;
};

/*
 * Containers annotated with a configured class annotation are subclassed by
 * a framework. The mapped method annotations select the forced methods; an
 * empty list forces them all.
 */
class AnnotatedSubclassProvider final : public ImplicitSubclassProvider {
 public:
  using Rules = std::unordered_map<std::string, std::vector<std::string>>;

  explicit AnnotatedSubclassProvider(Rules rules) : m_rules(std::move(rules)) {}

  std::string name() const override { return "annotated"; }
  bool is_applicable_to(const Declaration* container) const override;
  boost::optional<SubclassingInfo> get_subclassing_info(
      const Declaration* container) const override;

 private:
  Rules m_rules;
};

class ExtensibilityOracle {
 public:
  ExtensibilityOracle() = default;
  ExtensibilityOracle(ExtensibilityOracle&&) = default;
  ExtensibilityOracle& operator=(ExtensibilityOracle&&) = default;

  void add_provider(std::unique_ptr<ImplicitSubclassProvider> provider) {
    m_providers.push_back(std::move(provider));
  }

  size_t num_providers() const { return m_providers.size(); }

  /*
   * Whether an applicable provider forces `method` to keep its level in
   * `container`.
   */
  bool is_forced(const Declaration* method,
                 const Declaration* container) const;

 private:
  std::vector<std::unique_ptr<ImplicitSubclassProvider>> m_providers;
};
