/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "AccessTightening.h"

#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <json/json.h>

#include "JsonWrapper.h"
#include "TightenTest.h"

using ::testing::IsEmpty;

class AccessTighteningTest : public TightenTest {
 protected:
  void configure(const Json::Value& json = Json::Value(Json::objectValue)) {
    config.parse_config(JsonWrapper(json));
  }

  TighteningResult run() {
    AccessTightener tightener(config);
    auto result = tightener.run(graph, index, token);
    stats = tightener.get_stats();
    return result;
  }

  // Gives every suggested declaration its suggested level.
  void apply(const TighteningResult& result) {
    for (const auto& s : result.suggestions()) {
      auto* decl = graph.get(s.decl->get_id());
      decl->set_access(with_access_level(decl->get_access(), s.suggested));
    }
  }

  VisibilityConfig config;
  TighteningStats stats;
};

TEST_F(AccessTighteningTest, suggestsTighterLevels) {
  configure();
  auto* a = make_type("p", "A");
  auto* f = make_field(a, "f");
  auto* m = make_method(a, "m");
  auto* n = make_method(a, "n", ACC_PROTECTED);
  auto* b = make_type("p", "B");
  auto* sub = make_type("q", "Sub");
  graph.add_supertype(sub, a);

  add_usage(a, site_from(b));
  add_usage(f, site_from(a));
  add_usage(m, site_from(a));
  add_usage(m, site_from(b));
  add_usage(n, site_from(b));

  auto result = run();
  EXPECT_EQ(result.suggested_level(a), AccessLevel::PACKAGE);
  EXPECT_EQ(result.suggested_level(f), AccessLevel::PRIVATE);
  EXPECT_EQ(result.suggested_level(m), AccessLevel::PACKAGE);
  EXPECT_EQ(result.suggested_level(n), AccessLevel::PACKAGE);
  EXPECT_EQ(result.suggested_level(b), boost::none);
  EXPECT_EQ(result.suggested_level(sub), boost::none);

  auto suggestions = result.suggestions();
  ASSERT_EQ(suggestions.size(), 4u);
  EXPECT_EQ(suggestions[0].decl, a);
  EXPECT_EQ(suggestions[0].current, AccessLevel::PUBLIC);
  EXPECT_EQ(suggestions[3].decl, n);
  EXPECT_EQ(suggestions[3].current, AccessLevel::PROTECTED);

  EXPECT_EQ(stats.resolved.load(), 6u);
  EXPECT_EQ(stats.unresolved.load(), 0u);
  EXPECT_EQ(stats.withdrawn, 0u);
  EXPECT_EQ(stats.skipped[static_cast<size_t>(SkipReason::NO_USAGES)].load(),
            2u);
  EXPECT_EQ(stats.suggestions[static_cast<size_t>(AccessLevel::PRIVATE)], 1u);
  EXPECT_EQ(stats.suggestions[static_cast<size_t>(AccessLevel::PACKAGE)], 3u);
}

TEST_F(AccessTighteningTest, neverLoosens) {
  configure();
  auto* a = make_type("p", "A");
  auto* hidden = make_field(a, "hidden", ACC_PRIVATE);
  auto* local = make_method(a, "local", ACC_NONE);
  auto* c = make_type("q", "C");
  add_usage(a, site_from(c));
  add_usage(hidden, qualified_site_from(c, a));
  add_usage(local, qualified_site_from(c, a));

  auto result = run();
  EXPECT_THAT(result.suggestions(), IsEmpty());
  EXPECT_EQ(stats.skipped[static_cast<size_t>(SkipReason::PRIVATE_OR_NATIVE)]
                .load(),
            1u);
}

TEST_F(AccessTighteningTest, typeSuggestionWithdrawnForPublicMembers) {
  configure();
  auto* a = make_type("p", "A");
  auto* m = make_method(a, "m");
  auto* b = make_type("p", "B");
  auto* c = make_type("q", "C");
  add_usage(a, site_from(b));
  add_usage(m, qualified_site_from(c, a));
  add_usage(b, site_from(c));
  add_usage(c, site_from(c));

  auto result = run();
  EXPECT_EQ(result.suggested_level(a), boost::none);
  EXPECT_EQ(result.suggested_level(c), AccessLevel::PACKAGE);
  EXPECT_EQ(stats.withdrawn, 1u);
}

TEST_F(AccessTighteningTest, typeSuggestionWithdrawnForNonSourceMember) {
  configure();
  auto* a = make_type("p", "A");
  auto* f = make_field(a, "f", ACC_NONE);
  auto* b = make_type("p", "B");
  add_usage(a, site_from(b));
  add_usage(f, site_from(a));
  add_usage(f, non_source_site());

  auto result = run();
  // f needs public, which is looser than what it has, so A stays public.
  EXPECT_EQ(result.suggested_level(f), boost::none);
  EXPECT_EQ(result.suggested_level(a), boost::none);
  EXPECT_THAT(result.suggestions(), IsEmpty());
  EXPECT_EQ(stats.withdrawn, 1u);
}

TEST_F(AccessTighteningTest, typeSuggestionWithdrawnForPublicEntryPoint) {
  Json::Value json;
  json["entry_point_annotations"]["Exported"] = "public";
  configure(json);
  auto* a = make_type("p", "A");
  auto* m = make_method(a, "m", ACC_NONE);
  m->add_annotation("Exported");
  auto* b = make_type("p", "B");
  add_usage(a, site_from(b));
  add_usage(m, site_from(a));

  auto result = run();
  EXPECT_EQ(result.suggested_level(m), boost::none);
  EXPECT_EQ(result.suggested_level(a), boost::none);
  EXPECT_EQ(stats.entry_points.load(), 1u);
  EXPECT_EQ(stats.withdrawn, 1u);
}

TEST_F(AccessTighteningTest, idempotent) {
  Json::Value json;
  json["suggest_private_for_inners"] = true;
  configure(json);
  auto* a = make_type("p", "A");
  auto* inner = make_nested_type(a, "Inner", ACC_PUBLIC | ACC_STATIC);
  auto* g = make_field(inner, "g");
  auto* f = make_field(a, "f");
  auto* b = make_type("p", "B");
  add_usage(a, site_from(b));
  add_usage(inner, site_from(a));
  add_usage(g, site_from(a));
  add_usage(f, site_from(a));

  auto first = run();
  EXPECT_THAT(first.suggestions(), ::testing::SizeIs(4));
  apply(first);
  EXPECT_EQ(a->get_access_level(), AccessLevel::PACKAGE);
  EXPECT_EQ(inner->get_access_level(), AccessLevel::PRIVATE);
  EXPECT_EQ(g->get_access_level(), AccessLevel::PRIVATE);
  EXPECT_EQ(f->get_access_level(), AccessLevel::PRIVATE);
  EXPECT_TRUE(is_static(inner));

  auto second = run();
  EXPECT_THAT(second.suggestions(), IsEmpty());
  EXPECT_EQ(stats.withdrawn, 0u);
}

TEST_F(AccessTighteningTest, parallelMatchesSequential) {
  configure();
  std::vector<Declaration*> types;
  for (int i = 0; i < 40; ++i) {
    auto pkg = i % 3 == 0 ? "p" : "q";
    types.push_back(make_type(pkg, "T" + std::to_string(i)));
  }
  for (size_t i = 0; i < types.size(); ++i) {
    auto* t = types[i];
    auto* user = types[(i * 7 + 3) % types.size()];
    auto* nested = make_nested_type(t, "N", ACC_PUBLIC | ACC_STATIC);
    auto* f = make_field(t, "f");
    auto* m = make_method(nested, "m");
    add_usage(t, site_from(user));
    add_usage(nested, site_from(t));
    add_usage(f, site_from(t));
    add_usage(m, i % 4 == 0 ? qualified_site_from(user, nested)
                            : site_from(user));
    if (i % 5 == 0) {
      add_usage(f, site_from(user));
    }
  }

  config.set_num_threads(1);
  auto sequential = run().to_json();
  auto sequential_stats = stats.to_json();
  config.set_num_threads(4);
  auto parallel = run().to_json();
  EXPECT_EQ(sequential, parallel);
  EXPECT_EQ(sequential_stats, stats.to_json());
  EXPECT_FALSE(sequential.empty());
}

TEST_F(AccessTighteningTest, cancelledLeavesEverythingUnresolved) {
  configure();
  auto* a = make_type("p", "A");
  auto* f = make_field(a, "f");
  make_field(a, "hidden", ACC_PRIVATE);
  add_usage(f, site_from(a));
  token.cancel();

  auto result = run();
  EXPECT_THAT(result.suggestions(), IsEmpty());
  EXPECT_EQ(stats.cancelled.load(), 2u);
  EXPECT_EQ(stats.unresolved.load(), 2u);
  EXPECT_EQ(stats.resolved.load(), 1u);
}

TEST_F(AccessTighteningTest, malformedDeclarationsAreUnresolved) {
  configure();
  auto* a = make_type("p", "A");
  auto* f = make_field(a, "f");
  add_usage(a, site_from(a));
  add_usage(f, site_from(a));
  f->clear_access();

  auto result = run();
  EXPECT_EQ(result.suggested_level(f), boost::none);
  // The malformed field counts as public, so A cannot be tightened.
  EXPECT_EQ(result.suggested_level(a), boost::none);
  EXPECT_EQ(stats.unresolved.load(), 1u);
  EXPECT_EQ(stats.cancelled.load(), 0u);
}

TEST_F(AccessTighteningTest, configuredEntryPoints) {
  Json::Value json;
  json["entry_point_annotations"]["Inject"] = "protected";
  json["entry_point_annotations"]["Keep"] = "none";
  json["keep"].append("p.A.kept");
  json["num_threads"] = 2;
  configure(json);
  EXPECT_EQ(config.num_threads(), 2u);

  auto* a = make_type("p", "A");
  auto* injected = make_method(a, "injected");
  injected->add_annotation("Inject");
  auto* keep = make_method(a, "keep");
  keep->add_annotation("Keep");
  auto* kept = make_field(a, "kept");
  auto* plain = make_method(a, "plain");
  for (auto* decl : {injected, keep, kept, plain}) {
    add_usage(decl, site_from(a));
  }

  auto result = run();
  EXPECT_EQ(result.suggested_level(injected), AccessLevel::PROTECTED);
  EXPECT_EQ(result.suggested_level(keep), boost::none);
  EXPECT_EQ(result.suggested_level(kept), boost::none);
  EXPECT_EQ(result.suggested_level(plain), AccessLevel::PRIVATE);
  EXPECT_EQ(stats.entry_points.load(), 3u);
}

TEST_F(AccessTighteningTest, serializationHooksAreKept) {
  configure();
  auto* serializable = make_type("java.io", "Serializable",
                                 ACC_PUBLIC | ACC_INTERFACE | ACC_ABSTRACT);
  auto* a = make_type("p", "A");
  graph.add_supertype(a, serializable);
  auto* uid = make_field(a, "serialVersionUID",
                         ACC_PUBLIC | ACC_STATIC | ACC_FINAL);
  auto* write = make_method(a, "writeObject");
  add_usage(uid, site_from(a));
  add_usage(write, site_from(a));

  auto result = run();
  EXPECT_EQ(result.suggested_level(uid), boost::none);
  EXPECT_EQ(result.suggested_level(write), boost::none);

  Json::Value json;
  json["serialization_entry_points"] = false;
  VisibilityConfig no_serialization;
  no_serialization.parse_config(JsonWrapper(json));
  AccessTightener tightener(no_serialization);
  auto unprotected = tightener.run(graph, index, token);
  EXPECT_EQ(unprotected.suggested_level(uid), AccessLevel::PRIVATE);
  EXPECT_EQ(unprotected.suggested_level(write), AccessLevel::PRIVATE);
}

TEST_F(AccessTighteningTest, configuredImplicitSubclassing) {
  Json::Value json;
  json["implicit_subclass_annotations"]["Generated"] = Json::arrayValue;
  json["implicit_subclass_annotations"]["Mocked"].append("Stub");
  configure(json);

  auto* gen = make_type("p", "Gen");
  gen->add_annotation("Generated");
  auto* all = make_method(gen, "all");
  auto* mocked = make_type("p", "Mocked");
  mocked->add_annotation("Mocked");
  auto* stubbed = make_method(mocked, "stubbed");
  stubbed->add_annotation("Stub");
  auto* plain = make_method(mocked, "plain");
  for (auto* decl : {all, stubbed, plain}) {
    add_usage(decl, site_from(decl->get_container()));
  }

  auto result = run();
  EXPECT_EQ(result.suggested_level(all), boost::none);
  EXPECT_EQ(result.suggested_level(stubbed), boost::none);
  EXPECT_EQ(result.suggested_level(plain), AccessLevel::PRIVATE);
  EXPECT_EQ(
      stats.skipped[static_cast<size_t>(SkipReason::FORCED_SUBCLASSING)].load(),
      2u);
}

TEST_F(AccessTighteningTest, policyFromConfig) {
  Json::Value json;
  json["suggest_package_local_for_members"] = false;
  json["suggest_private_for_inners"] = true;
  configure(json);
  EXPECT_FALSE(config.policy().suggest_package_local_for_members);
  EXPECT_TRUE(config.policy().suggest_package_local_for_top_classes);
  EXPECT_TRUE(config.policy().suggest_private_for_inners);

  auto* a = make_type("p", "A");
  auto* m = make_method(a, "m");
  auto* b = make_type("p", "B");
  add_usage(m, site_from(b));
  add_usage(a, site_from(b));

  auto result = run();
  EXPECT_EQ(result.suggested_level(m), boost::none);
  EXPECT_EQ(result.suggested_level(a), boost::none);
}

TEST_F(AccessTighteningTest, resultJson) {
  configure();
  auto* a = make_type("p", "A");
  auto* f = make_field(a, "f");
  add_usage(f, site_from(a));

  auto json = run().to_json();
  ASSERT_EQ(json.size(), 1u);
  EXPECT_EQ(json[0]["declaration"].asString(), "p.A.f");
  EXPECT_EQ(json[0]["kind"].asString(), "field");
  EXPECT_EQ(json[0]["current"].asString(), "public");
  EXPECT_EQ(json[0]["suggested"].asString(), "private");

  auto stats_json = stats.to_json();
  EXPECT_EQ(stats_json["resolved"].asUInt64(), 2u);
  EXPECT_EQ(stats_json["skipped"]["no_usages"].asUInt64(), 1u);
  EXPECT_EQ(stats_json["suggestions"]["private"].asUInt64(), 1u);
  EXPECT_EQ(stats_json["suggestions"]["package-private"].asUInt64(), 0u);
}
