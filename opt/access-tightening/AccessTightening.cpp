/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "AccessTightening.h"

#include <memory>
#include <unordered_set>

#include "CancellationToken.h"
#include "ContainmentAggregator.h"
#include "DeclarationGraph.h"
#include "Show.h"
#include "Timer.h"
#include "Trace.h"
#include "UsageIndex.h"
#include "WorkQueue.h"

void VisibilityConfig::bind_config() {
  bind("suggest_for_constants", true, m_policy.suggest_for_constants,
       "Also suggest tighter access for static final fields with an "
       "initializer.");
  bind("suggest_package_local_for_members", true,
       m_policy.suggest_package_local_for_members,
       "Suggest package-private for members and nested types. When off, such "
       "declarations needing package access stay public.");
  bind("suggest_package_local_for_top_classes", true,
       m_policy.suggest_package_local_for_top_classes,
       "Suggest package-private for top-level types.");
  bind("suggest_private_for_inners", false, m_policy.suggest_private_for_inners,
       "Suggest private for members of nested types that are only used "
       "within the enclosing top-level type.");
  bind("parallel_usage_search", false, m_policy.parallel_usage_search,
       "Search the functional conversions of a functional interface "
       "concurrently with its regular usages.");
  bind("num_threads", 0u, m_num_threads,
       "Worker threads; 0 uses every hardware thread.");
  bind("entry_point_annotations", {}, m_entry_point_annotations,
       "Annotations marking entry points, each mapped to the least access "
       "level the declaration must keep (\"private\", \"package-private\", "
       "\"protected\", \"public\"), or to \"none\" to keep its current level.");
  bind("keep", {}, m_keep,
       "Qualified names of declarations whose access must not change.");
  bind("serialization_entry_points", true, m_serialization_entry_points,
       "Keep the members of Serializable types the serialization runtime "
       "looks up reflectively.");
  bind("implicit_subclass_annotations", {}, m_implicit_subclass_annotations,
       "Class annotations of framework-subclassed types, each mapped to the "
       "method annotations selecting the methods the generated subclass "
       "overrides. An empty list selects all methods.");

  after_configuration([this] {
    m_entry_point_floors.clear();
    for (const auto& pair : m_entry_point_annotations) {
      if (pair.second == "none") {
        m_entry_point_floors.emplace(pair.first, boost::none);
        continue;
      }
      auto floor = parse_access_level(pair.second);
      if (!floor) {
        throw tighten::InvalidConfigException(
            "Unknown access level '" + pair.second + "'",
            {{"config", get_config_name()},
             {"param", "entry_point_annotations"},
             {"annotation", pair.first}});
      }
      m_entry_point_floors.emplace(pair.first, *floor);
    }
  });
}

EntryPointOracle VisibilityConfig::make_entry_point_oracle() const {
  EntryPointOracle oracle;
  if (!m_entry_point_floors.empty()) {
    oracle.add_provider(
        std::make_unique<AnnotatedEntryPoints>(m_entry_point_floors));
  }
  if (m_serialization_entry_points) {
    oracle.add_provider(std::make_unique<SerializationEntryPoints>());
  }
  if (!m_keep.empty()) {
    oracle.add_provider(std::make_unique<KeepListEntryPoints>(
        std::unordered_set<std::string>(m_keep.begin(), m_keep.end())));
  }
  return oracle;
}

ExtensibilityOracle VisibilityConfig::make_extensibility_oracle() const {
  ExtensibilityOracle oracle;
  if (!m_implicit_subclass_annotations.empty()) {
    oracle.add_provider(std::make_unique<AnnotatedSubclassProvider>(
        AnnotatedSubclassProvider::Rules(
            m_implicit_subclass_annotations.begin(),
            m_implicit_subclass_annotations.end())));
  }
  return oracle;
}

Json::Value TighteningStats::to_json() const {
  Json::Value json;
  json["resolved"] = (Json::UInt64)resolved.load();
  json["unresolved"] = (Json::UInt64)unresolved.load();
  json["cancelled"] = (Json::UInt64)cancelled.load();
  json["entry_points"] = (Json::UInt64)entry_points.load();
  json["withdrawn"] = (Json::UInt64)withdrawn;
  Json::Value skipped_json(Json::objectValue);
  for (size_t i = 0; i < kNumSkipReasons; ++i) {
    skipped_json[show_skip_reason(static_cast<SkipReason>(i))] =
        (Json::UInt64)skipped[i].load();
  }
  json["skipped"] = skipped_json;
  Json::Value suggestions_json(Json::objectValue);
  for (size_t i = 0; i < kNumAccessLevels; ++i) {
    suggestions_json[access_presentable_text(static_cast<AccessLevel>(i))] =
        (Json::UInt64)suggestions[i];
  }
  json["suggestions"] = suggestions_json;
  return json;
}

boost::optional<AccessLevel> TighteningResult::suggested_level(
    const Declaration* decl) const {
  auto id = decl->get_id();
  if (id >= m_suggestions.size() || m_graph->get(id) != decl) {
    return boost::none;
  }
  return m_suggestions[id];
}

std::vector<Suggestion> TighteningResult::suggestions() const {
  std::vector<Suggestion> result;
  for (DeclId id = 0; id < m_suggestions.size(); ++id) {
    if (!m_suggestions[id]) {
      continue;
    }
    auto* decl = m_graph->get(id);
    result.push_back(
        Suggestion{decl, decl->get_access_level(), *m_suggestions[id]});
  }
  return result;
}

Json::Value TighteningResult::to_json() const {
  Json::Value list(Json::arrayValue);
  for (const auto& s : suggestions()) {
    Json::Value entry;
    entry["declaration"] = s.decl->str();
    entry["kind"] = show_kind(s.decl->get_kind());
    entry["current"] = access_presentable_text(s.current);
    entry["suggested"] = access_presentable_text(s.suggested);
    list.append(entry);
  }
  return list;
}

TighteningResult AccessTightener::run(const DeclarationGraph& graph,
                                      const UsageIndex& index,
                                      const CancellationToken& token) {
  auto entry_points = m_config.make_entry_point_oracle();
  auto extensibility = m_config.make_extensibility_oracle();
  return run(graph, index, entry_points, extensibility, token);
}

TighteningResult AccessTightener::run(const DeclarationGraph& graph,
                                      const UsageIndex& index,
                                      const EntryPointOracle& entry_points,
                                      const ExtensibilityOracle& extensibility,
                                      const CancellationToken& token) {
  Timer t("Access tightening");
  m_stats = TighteningStats();
  auto num_threads =
      tighten_parallel::num_threads_or_default(m_config.num_threads());
  TRACE(MAIN, 1, "Tightening %zu declarations on %u threads", graph.size(),
        num_threads);

  VisibilityResolver resolver(index, entry_points, extensibility,
                              m_config.policy(), token);
  // Every resolved level, and the stricter-than-current ones among them.
  ContainmentAggregator::Levels resolved(graph.size());
  ContainmentAggregator::Levels suggestions(graph.size());
  {
    Timer t2("Resolving declarations");
    workqueue_run<const Declaration*>(
        [&](const Declaration* decl) {
          auto res = resolver.resolve(decl);
          if (res.entry_point) {
            ++m_stats.entry_points;
          }
          if (!res.level) {
            ++m_stats.unresolved;
            if (res.cancelled) {
              ++m_stats.cancelled;
            }
            return;
          }
          ++m_stats.resolved;
          if (res.skipped) {
            ++m_stats.skipped[static_cast<size_t>(*res.skipped)];
          }
          resolved[decl->get_id()] = *res.level;
          if (*res.level < decl->get_access_level()) {
            suggestions[decl->get_id()] = *res.level;
          }
        },
        graph.declarations(), num_threads);
  }

  ContainerLevels levels;
  ContainmentAggregator aggregator(graph, num_threads);
  m_stats.withdrawn = aggregator.aggregate(resolved, suggestions, levels);

  TighteningResult result(graph, std::move(suggestions));
  for (const auto& s : result.suggestions()) {
    ++m_stats.suggestions[static_cast<size_t>(s.suggested)];
    TRACE(ACCESS, 2, "Suggesting %s for %s (currently %s)", SHOW(s.suggested),
          SHOW(s.decl), SHOW(s.current));
  }
  TRACE(MAIN, 1, "%zu resolved, %zu unresolved, %zu withdrawn",
        m_stats.resolved.load(), m_stats.unresolved.load(),
        m_stats.withdrawn);
  return result;
}
