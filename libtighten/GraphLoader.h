/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <unordered_map>
#include <unordered_set>

namespace Json {
class Value;
} // namespace Json

class Declaration;
class DeclarationGraph;
class InMemoryUsageIndex;
struct UsageSite;

/*
 * Populates a DeclarationGraph and an InMemoryUsageIndex from a JSON
 * document of the form
 *
 *   {
 *     "declarations": [
 *       {
 *         "id": "p.A",                 // unique, used for cross references
 *         "name": "A",
 *         "kind": "type",              // type, method, field, enum_constant
 *         "scope": "p",                // package; defaults to the container's
 *         "container": "p.Outer",      // optional, must be a type
 *         "modifiers": ["public"],     // absent or null: malformed
 *         "form": "named",             // named, anonymous, local,
 *                                      // type_parameter
 *         "constructor": false,
 *         "initializer": false,
 *         "physical": true,
 *         "supertypes": ["p.B"],
 *         "overrides": ["p.B#m"],
 *         "annotations": ["com.foo.Keep"]
 *       }
 *     ],
 *     "usages": [
 *       {
 *         "target": "p.A",
 *         "in_source": true,
 *         "scope": "q",                // package of the referencing file
 *         "from": "q.C",               // innermost enclosing type
 *         "qualifier": "expression",   // none, this, super, expression
 *         "qualifier_type": "p.A",     // absent: unresolved
 *         "context": "normal",         // normal, reference_list,
 *                                      // annotation_argument
 *         "reference": "member"        // member, construction,
 *                                      // constructor_call, unresolved
 *       }
 *     ],
 *     "functional_conversions": [ ...same shape as usages... ]
 *   }
 *
 * Structural errors (wrong types, unknown enumerators, dangling or circular
 * references, duplicate ids) throw tighten::InvalidGraphException.
 */
class GraphLoader {
 public:
  GraphLoader(DeclarationGraph& graph, InMemoryUsageIndex& index)
      : m_graph(graph), m_index(index) {}

  void load(const Json::Value& root);

  void load_file(const std::string& path);

  // nullptr if no declaration was loaded under `id`.
  const Declaration* get(const std::string& id) const;

 private:
  Declaration* create(const std::string& id);
  void link(const std::string& id, const Json::Value& json);
  UsageSite parse_site(const Json::Value& json, const char* section);
  Declaration* resolve(const Json::Value& id,
                       const std::string& referrer,
                       const char* field);

  DeclarationGraph& m_graph;
  InMemoryUsageIndex& m_index;
  std::unordered_map<std::string, const Json::Value*> m_json;
  std::unordered_map<std::string, Declaration*> m_ids;
  std::unordered_set<std::string> m_in_progress;
};
