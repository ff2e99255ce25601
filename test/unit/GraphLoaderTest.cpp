/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "GraphLoader.h"

#include <sstream>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <json/json.h>

#include "TightenTest.h"

using ::testing::ElementsAre;

class GraphLoaderTest : public TightenTest {
 protected:
  static Json::Value parse(const std::string& text) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::istringstream in(text);
    EXPECT_TRUE(Json::parseFromStream(builder, in, &root, &errors)) << errors;
    return root;
  }

  void load(const std::string& text) { loader.load(parse(text)); }

  // Expects the load to fail on `field` of the entry `at`.
  void expect_invalid(const std::string& text,
                      const std::string& at,
                      const std::string& field) {
    try {
      load(text);
      ADD_FAILURE() << "Expected exception not thrown";
    } catch (const tighten::InvalidGraphException& e) {
      EXPECT_EQ(e.type, INVALID_GRAPH);
      EXPECT_EQ(e.extra_info.at("at"), at) << e.what();
      EXPECT_EQ(e.extra_info.at("field"), field) << e.what();
    }
  }

  GraphLoader loader{graph, index};
};

TEST_F(GraphLoaderTest, loadsDeclarations) {
  load(R"({
    "declarations": [
      {"id": "p.A#m", "name": "m", "kind": "method", "container": "p.A",
       "modifiers": ["protected", "abstract"], "annotations": ["Inject"]},
      {"id": "p.A", "name": "A", "kind": "type", "scope": "p",
       "modifiers": ["public", "abstract"], "supertypes": ["p.Base"]},
      {"id": "p.Base", "name": "Base", "kind": "type", "scope": "p",
       "modifiers": ["public", "interface", "abstract"]},
      {"id": "p.Base#m", "name": "m", "kind": "method", "container": "p.Base",
       "modifiers": ["public", "abstract"]},
      {"id": "p.A.K", "name": "K", "kind": "field", "container": "p.A",
       "modifiers": ["static", "final"], "initializer": true},
      {"id": "p.A$1", "name": "1", "kind": "type", "container": "p.A",
       "modifiers": [], "form": "anonymous", "physical": true},
      {"id": "p.A#<init>", "name": "<init>", "kind": "method",
       "container": "p.A", "modifiers": ["public"], "constructor": true}
    ]
  })");
  load(R"({
    "declarations": [
      {"id": "q.Sub#m", "name": "m", "kind": "method", "container": "q.Sub",
       "modifiers": ["public"], "overrides": ["p.A#m"]},
      {"id": "q.Sub", "name": "Sub", "kind": "type", "scope": "q",
       "modifiers": ["public"], "supertypes": ["p.A"]}
    ]
  })");

  EXPECT_EQ(graph.size(), 9u);
  auto* a = loader.get("p.A");
  auto* m = loader.get("p.A#m");
  auto* base = loader.get("p.Base");
  auto* sub = loader.get("q.Sub");
  ASSERT_NE(a, nullptr);
  ASSERT_NE(m, nullptr);
  EXPECT_EQ(loader.get("p.Missing"), nullptr);

  EXPECT_EQ(a->str(), "p.A");
  EXPECT_EQ(m->str(), "p.A.m");
  EXPECT_EQ(m->get_container(), a);
  EXPECT_EQ(m->get_scope(), a->get_scope());
  EXPECT_EQ(m->get_access(), ACC_PROTECTED | ACC_ABSTRACT);
  EXPECT_TRUE(m->has_annotation("Inject"));
  EXPECT_TRUE(a->is_strict_subtype_of(base));
  EXPECT_TRUE(sub->is_strict_subtype_of(base));
  EXPECT_THAT(loader.get("q.Sub#m")->get_super_methods(), ElementsAre(m));
  EXPECT_TRUE(m->is_overridden());

  auto* k = loader.get("p.A.K");
  EXPECT_TRUE(k->has_initializer());
  EXPECT_EQ(k->get_access_level(), AccessLevel::PACKAGE);
  EXPECT_EQ(loader.get("p.A$1")->get_type_form(), TypeForm::ANONYMOUS);
  EXPECT_TRUE(loader.get("p.A#<init>")->is_constructor());
  EXPECT_FALSE(m->is_constructor());
  EXPECT_TRUE(m->is_physical());
}

TEST_F(GraphLoaderTest, loadsUsages) {
  load(R"({
    "declarations": [
      {"id": "p.A", "name": "A", "kind": "type", "scope": "p",
       "modifiers": ["public", "interface", "abstract"]},
      {"id": "p.A#run", "name": "run", "kind": "method", "container": "p.A",
       "modifiers": ["public", "abstract"]},
      {"id": "q.C", "name": "C", "kind": "type", "scope": "q",
       "modifiers": ["public"]}
    ],
    "usages": [
      {"target": "p.A#run", "scope": "q", "from": "q.C",
       "qualifier": "expression", "qualifier_type": "p.A"},
      {"target": "p.A#run", "scope": "q", "from": "q.C",
       "context": "reference_list", "reference": "unresolved"},
      {"target": "p.A", "in_source": false}
    ],
    "functional_conversions": [
      {"target": "p.A", "scope": "p"}
    ]
  })");

  auto* a = loader.get("p.A");
  auto* run = loader.get("p.A#run");
  auto* c = loader.get("q.C");
  EXPECT_EQ(index.num_usages(run), 2u);
  EXPECT_EQ(index.num_usages(a), 1u);

  std::vector<UsageSite> sites;
  index.process_usages(run, token, [&](const UsageSite& site) {
    sites.push_back(site);
    return true;
  });
  ASSERT_EQ(sites.size(), 2u);
  EXPECT_EQ(sites[0].scope, c->get_scope());
  EXPECT_EQ(sites[0].type, c);
  EXPECT_EQ(sites[0].qualifier, Qualifier::EXPRESSION);
  EXPECT_EQ(sites[0].qualifier_type, a);
  EXPECT_EQ(sites[0].context, SiteContext::NORMAL);
  EXPECT_EQ(sites[0].form, ReferenceForm::MEMBER);
  EXPECT_EQ(sites[1].qualifier, Qualifier::NONE);
  EXPECT_EQ(sites[1].qualifier_type, nullptr);
  EXPECT_EQ(sites[1].context, SiteContext::REFERENCE_LIST);
  EXPECT_EQ(sites[1].form, ReferenceForm::UNRESOLVED);

  bool non_source = false;
  index.process_usages(a, token, [&](const UsageSite& site) {
    non_source = !site.in_source && site.scope == nullptr;
    return true;
  });
  EXPECT_TRUE(non_source);

  size_t conversions = 0;
  index.process_functional_conversions(a, token, [&](const UsageSite& site) {
    EXPECT_EQ(site.scope, a->get_scope());
    EXPECT_EQ(site.type, nullptr);
    ++conversions;
    return true;
  });
  EXPECT_EQ(conversions, 1u);
}

TEST_F(GraphLoaderTest, missingModifiersAreMalformed) {
  load(R"({
    "declarations": [
      {"id": "p.A", "name": "A", "kind": "type", "scope": "p",
       "modifiers": null},
      {"id": "p.A.f", "name": "f", "kind": "field", "container": "p.A"}
    ]
  })");
  EXPECT_FALSE(loader.get("p.A")->has_access());
  EXPECT_FALSE(loader.get("p.A.f")->has_access());
}

TEST_F(GraphLoaderTest, rejectsDuplicateIds) {
  expect_invalid(R"({
    "declarations": [
      {"id": "p.A", "name": "A", "kind": "type", "scope": "p"},
      {"id": "p.A", "name": "A", "kind": "type", "scope": "p"}
    ]
  })",
                 "p.A", "id");
}

TEST_F(GraphLoaderTest, rejectsDanglingReferences) {
  expect_invalid(R"({
    "declarations": [
      {"id": "p.A.f", "name": "f", "kind": "field", "container": "p.Gone"}
    ]
  })",
                 "p.A.f", "container");
}

TEST_F(GraphLoaderTest, rejectsDanglingUsageTarget) {
  expect_invalid(R"({
    "declarations": [
      {"id": "p.A", "name": "A", "kind": "type", "scope": "p",
       "modifiers": ["public"]}
    ],
    "usages": [{"target": "p.B", "scope": "p"}]
  })",
                 "usages", "target");
}

TEST_F(GraphLoaderTest, rejectsCircularContainment) {
  expect_invalid(R"({
    "declarations": [
      {"id": "p.A", "name": "A", "kind": "type", "container": "p.B"},
      {"id": "p.B", "name": "B", "kind": "type", "container": "p.A"}
    ]
  })",
                 "p.A", "container");
}

TEST_F(GraphLoaderTest, rejectsNonTypeContainer) {
  expect_invalid(R"({
    "declarations": [
      {"id": "p.A", "name": "A", "kind": "type", "scope": "p"},
      {"id": "p.A.f", "name": "f", "kind": "field", "container": "p.A"},
      {"id": "p.A.f.g", "name": "g", "kind": "field", "container": "p.A.f"}
    ]
  })",
                 "p.A.f.g", "container");
}

TEST_F(GraphLoaderTest, rejectsUnknownEnumerators) {
  expect_invalid(R"({
    "declarations": [{"id": "p.A", "name": "A", "kind": "class",
                      "scope": "p"}]
  })",
                 "p.A", "kind");
  expect_invalid(R"({
    "declarations": [{"id": "p.B", "name": "B", "kind": "type", "scope": "p",
                      "modifiers": ["volatile"]}]
  })",
                 "p.B", "modifiers");
  expect_invalid(R"({
    "declarations": [{"id": "p.C", "name": "C", "kind": "type", "scope": "p",
                      "modifiers": []}],
    "usages": [{"target": "p.C", "scope": "p", "qualifier": "outer"}]
  })",
                 "usages", "qualifier");
}

TEST_F(GraphLoaderTest, rejectsIllTypedFields) {
  expect_invalid(R"({
    "declarations": [{"id": "p.A", "name": "A", "kind": "type", "scope": "p",
                      "physical": "yes"}]
  })",
                 "p.A", "physical");
  expect_invalid(R"({
    "declarations": [{"id": "p.B", "name": 3, "kind": "type", "scope": "p"}]
  })",
                 "p.B", "name");
  expect_invalid(R"({"declarations": {}})", "<root>", "declarations");
}

TEST_F(GraphLoaderTest, rejectsInvalidSupertypes) {
  expect_invalid(R"({
    "declarations": [
      {"id": "p.A", "name": "A", "kind": "type", "scope": "p",
       "supertypes": ["p.A#m"]},
      {"id": "p.A#m", "name": "m", "kind": "method", "container": "p.A"}
    ]
  })",
                 "p.A", "supertypes");
}

TEST_F(GraphLoaderTest, rejectsTopLevelWithoutScope) {
  expect_invalid(R"({
    "declarations": [{"id": "A", "name": "A", "kind": "type"}]
  })",
                 "A", "scope");
}

TEST_F(GraphLoaderTest, missingFile) {
  EXPECT_THROW(loader.load_file("/nonexistent/graph.json"),
               tighten::InvalidGraphException);
}
