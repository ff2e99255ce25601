/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <array>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/optional.hpp>
#include <json/value.h>

#include "AccessLevel.h"
#include "AtomicStatCounter.h"
#include "Configurable.h"
#include "EntryPoints.h"
#include "Extensibility.h"
#include "UsageClassifier.h"
#include "VisibilityResolver.h"

class CancellationToken;
class Declaration;
class DeclarationGraph;
class UsageIndex;

class VisibilityConfig : public Configurable {
 public:
  std::string get_config_name() override { return "AccessTightening"; }

  std::string get_config_doc() override {
    return "Suggests the most restrictive access level each type, method and "
           "field can have without breaking any of its usages. A type is "
           "never suggested a level stricter than its members need.";
  }

  void bind_config() override;

  const TighteningPolicy& policy() const { return m_policy; }
  TighteningPolicy& policy() { return m_policy; }

  unsigned num_threads() const { return m_num_threads; }
  void set_num_threads(unsigned num_threads) { m_num_threads = num_threads; }

  /*
   * Built from entry_point_annotations, keep and serialization_entry_points.
   */
  EntryPointOracle make_entry_point_oracle() const;

  // Built from implicit_subclass_annotations.
  ExtensibilityOracle make_extensibility_oracle() const;

 private:
  TighteningPolicy m_policy;
  unsigned m_num_threads{0};
  MapOfStrings m_entry_point_annotations;
  AnnotatedEntryPoints::Rules m_entry_point_floors;
  std::vector<std::string> m_keep;
  bool m_serialization_entry_points{true};
  MapOfVectorOfStrings m_implicit_subclass_annotations;
};

struct Suggestion {
  const Declaration* decl;
  AccessLevel current;
  AccessLevel suggested;
};

struct TighteningStats {
  AtomicStatCounter<size_t> resolved{0};
  AtomicStatCounter<size_t> unresolved{0};
  AtomicStatCounter<size_t> cancelled{0};
  AtomicStatCounter<size_t> entry_points{0};
  // Indexed by SkipReason.
  std::vector<AtomicStatCounter<size_t>> skipped;
  size_t withdrawn{0};
  std::array<size_t, kNumAccessLevels> suggestions{};

  TighteningStats()
      : skipped(kNumSkipReasons, AtomicStatCounter<size_t>(0)) {}

  Json::Value to_json() const;
};

/*
 * The outcome of one run. Holds non-owning pointers into the graph it was
 * computed from.
 */
class TighteningResult {
 public:
  TighteningResult(const DeclarationGraph& graph,
                   std::vector<boost::optional<AccessLevel>> suggestions)
      : m_graph(&graph), m_suggestions(std::move(suggestions)) {}

  /*
   * The level `decl` should be given, if it is stricter than the current
   * one and did not get withdrawn.
   */
  boost::optional<AccessLevel> suggested_level(const Declaration* decl) const;

  // In declaration order.
  std::vector<Suggestion> suggestions() const;

  Json::Value to_json() const;

 private:
  const DeclarationGraph* m_graph;
  std::vector<boost::optional<AccessLevel>> m_suggestions;
};

/*
 * Resolves every declaration of a graph on a work queue and enforces
 * containment on the results.
 */
class AccessTightener {
 public:
  explicit AccessTightener(const VisibilityConfig& config)
      : m_config(config) {}

  // Uses the oracles described by the config.
  TighteningResult run(const DeclarationGraph& graph,
                       const UsageIndex& index,
                       const CancellationToken& token);

  TighteningResult run(const DeclarationGraph& graph,
                       const UsageIndex& index,
                       const EntryPointOracle& entry_points,
                       const ExtensibilityOracle& extensibility,
                       const CancellationToken& token);

  const TighteningStats& get_stats() const { return m_stats; }

 private:
  const VisibilityConfig& m_config;
  TighteningStats m_stats;
};
