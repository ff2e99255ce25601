/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "GraphLoader.h"

#include <json/json.h>

#include "DeclarationGraph.h"
#include "JsonWrapper.h"
#include "Show.h"
#include "Timer.h"
#include "Trace.h"
#include "UsageIndex.h"

namespace {

[[noreturn]] void invalid(const std::string& message,
                          const std::string& where,
                          const std::string& field) {
  throw tighten::InvalidGraphException(message,
                                       {{"at", where}, {"field", field}});
}

const Json::Value& member(const Json::Value& json, const char* field) {
  static const Json::Value null_value;
  if (!json.isObject() || !json.isMember(field)) {
    return null_value;
  }
  return json[field];
}

std::string get_string(const Json::Value& json,
                       const char* field,
                       const std::string& where,
                       bool required) {
  const auto& value = member(json, field);
  if (value.isNull()) {
    if (required) {
      invalid("Missing required field", where, field);
    }
    return "";
  }
  if (!value.isString()) {
    invalid("Expected a string", where, field);
  }
  return value.asString();
}

bool get_bool(const Json::Value& json,
              const char* field,
              const std::string& where,
              bool dflt) {
  const auto& value = member(json, field);
  if (value.isNull()) {
    return dflt;
  }
  if (!value.isBool()) {
    invalid("Expected a boolean", where, field);
  }
  return value.asBool();
}

std::vector<std::string> get_strings(const Json::Value& json,
                                     const char* field,
                                     const std::string& where) {
  const auto& value = member(json, field);
  std::vector<std::string> result;
  if (value.isNull()) {
    return result;
  }
  if (!value.isArray()) {
    invalid("Expected an array", where, field);
  }
  for (const auto& str : value) {
    if (!str.isString()) {
      invalid("Expected an array of strings", where, field);
    }
    result.push_back(str.asString());
  }
  return result;
}

template <typename T, typename Parser>
T get_enum(const Json::Value& json,
           const char* field,
           const std::string& where,
           T dflt,
           Parser parser) {
  auto str = get_string(json, field, where, /* required */ false);
  if (str.empty()) {
    return dflt;
  }
  auto parsed = parser(str);
  if (!parsed) {
    invalid("Unknown value '" + str + "'", where, field);
  }
  return *parsed;
}

const Json::Value& get_array(const Json::Value& root, const char* section) {
  const auto& value = member(root, section);
  if (!value.isNull() && !value.isArray()) {
    invalid("Expected an array", "<root>", section);
  }
  return value;
}

} // namespace

void GraphLoader::load_file(const std::string& path) {
  Timer t("Loading " + path);
  auto root = read_json_from_file(path, TightenError::INVALID_GRAPH);
  load(root);
}

void GraphLoader::load(const Json::Value& root) {
  if (!root.isObject()) {
    invalid("Expected an object", "<root>", "");
  }
  const auto& decls = get_array(root, "declarations");
  for (const auto& json : decls) {
    auto id = get_string(json, "id", "declarations", /* required */ true);
    if (m_ids.count(id) || !m_json.emplace(id, &json).second) {
      invalid("Duplicate declaration id", id, "id");
    }
  }
  // Containers have to exist before their members; create() recurses.
  for (const auto& json : decls) {
    create(json["id"].asString());
  }
  for (const auto& json : decls) {
    link(json["id"].asString(), json);
  }
  m_json.clear();
  TRACE(LOAD, 1, "Loaded %zu declarations", decls.size());

  size_t n_usages = 0;
  for (const auto& json : get_array(root, "usages")) {
    auto* target = resolve(member(json, "target"), "usages", "target");
    m_index.add_usage(target, parse_site(json, "usages"));
    ++n_usages;
  }
  size_t n_conversions = 0;
  for (const auto& json : get_array(root, "functional_conversions")) {
    auto* target =
        resolve(member(json, "target"), "functional_conversions", "target");
    if (!target->is_type()) {
      invalid("Functional conversion target is not a type", target->str(),
              "target");
    }
    m_index.add_functional_conversion(
        target, parse_site(json, "functional_conversions"));
    ++n_conversions;
  }
  TRACE(LOAD, 1, "Loaded %zu usages and %zu functional conversions", n_usages,
        n_conversions);
}

const Declaration* GraphLoader::get(const std::string& id) const {
  auto it = m_ids.find(id);
  return it == m_ids.end() ? nullptr : it->second;
}

Declaration* GraphLoader::create(const std::string& id) {
  auto existing = m_ids.find(id);
  if (existing != m_ids.end()) {
    return existing->second;
  }
  auto json_it = m_json.find(id);
  if (json_it == m_json.end()) {
    return nullptr;
  }
  if (!m_in_progress.insert(id).second) {
    invalid("Circular containment", id, "container");
  }
  const auto& json = *json_it->second;

  auto name = get_string(json, "name", id, /* required */ true);
  auto kind_str = get_string(json, "kind", id, /* required */ true);
  auto kind = parse_kind(kind_str);
  if (!kind) {
    invalid("Unknown value '" + kind_str + "'", id, "kind");
  }

  const Declaration* container = nullptr;
  auto container_id = get_string(json, "container", id, /* required */ false);
  if (!container_id.empty()) {
    container = create(container_id);
    if (container == nullptr) {
      invalid("Unknown declaration '" + container_id + "'", id, "container");
    }
    if (!container->is_type()) {
      invalid("Container is not a type", id, "container");
    }
  }

  const Scope* scope = nullptr;
  if (member(json, "scope").isString()) {
    scope = m_graph.make_scope(get_string(json, "scope", id, false));
  } else if (!member(json, "scope").isNull()) {
    invalid("Expected a string", id, "scope");
  } else if (container == nullptr) {
    invalid("Top-level declaration without scope", id, "scope");
  }

  auto* decl = m_graph.make_declaration(name, *kind, scope, container);
  m_in_progress.erase(id);
  m_ids.emplace(id, decl);

  const auto& modifiers = member(json, "modifiers");
  if (modifiers.isNull()) {
    decl->clear_access();
    TRACE(LOAD, 2, "Malformed modifiers on %s", decl->c_str());
  } else {
    DeclAccessFlags flags = ACC_NONE;
    for (const auto& modifier : get_strings(json, "modifiers", id)) {
      auto flag = parse_access_flag(modifier);
      if (!flag) {
        invalid("Unknown modifier '" + modifier + "'", id, "modifiers");
      }
      flags |= *flag;
    }
    decl->set_access(flags);
  }
  decl->set_type_form(
      get_enum(json, "form", id, TypeForm::NAMED,
               [](const std::string& s) { return parse_type_form(s); }));
  decl->set_constructor(get_bool(json, "constructor", id, false));
  decl->set_has_initializer(get_bool(json, "initializer", id, false));
  decl->set_physical(get_bool(json, "physical", id, true));
  for (auto& anno : get_strings(json, "annotations", id)) {
    decl->add_annotation(std::move(anno));
  }
  TRACE(LOAD, 3, "Created %s", SHOW(decl));
  return decl;
}

void GraphLoader::link(const std::string& id, const Json::Value& json) {
  auto* decl = m_ids.at(id);
  for (const auto& super_id : get_strings(json, "supertypes", id)) {
    auto* super = resolve(Json::Value(super_id), id, "supertypes");
    if (!decl->is_type() || !super->is_type() || super == decl) {
      invalid("Invalid supertype '" + super_id + "'", id, "supertypes");
    }
    m_graph.add_supertype(decl, super);
  }
  for (const auto& overridden_id : get_strings(json, "overrides", id)) {
    auto* overridden = resolve(Json::Value(overridden_id), id, "overrides");
    if (!decl->is_method() || !overridden->is_method() ||
        overridden == decl) {
      invalid("Invalid overridden method '" + overridden_id + "'", id,
              "overrides");
    }
    m_graph.add_override(decl, overridden);
  }
}

Declaration* GraphLoader::resolve(const Json::Value& id,
                                  const std::string& referrer,
                                  const char* field) {
  if (!id.isString()) {
    invalid("Expected a declaration id", referrer, field);
  }
  auto it = m_ids.find(id.asString());
  if (it == m_ids.end()) {
    invalid("Unknown declaration '" + id.asString() + "'", referrer, field);
  }
  return it->second;
}

UsageSite GraphLoader::parse_site(const Json::Value& json,
                                  const char* section) {
  if (!json.isObject()) {
    invalid("Expected an object", section, "");
  }
  UsageSite site;
  site.in_source = get_bool(json, "in_source", section, true);
  const auto& scope = member(json, "scope");
  if (scope.isString()) {
    site.scope = m_graph.make_scope(scope.asString());
  } else if (!scope.isNull()) {
    invalid("Expected a string", section, "scope");
  } else if (site.in_source) {
    invalid("Source usage without scope", section, "scope");
  }
  if (!member(json, "from").isNull()) {
    site.type = resolve(member(json, "from"), section, "from");
    if (!site.type->is_type()) {
      invalid("Referencing declaration is not a type", section, "from");
    }
  }
  site.qualifier =
      get_enum(json, "qualifier", section, Qualifier::NONE,
               [](const std::string& s) { return parse_qualifier(s); });
  if (!member(json, "qualifier_type").isNull()) {
    site.qualifier_type =
        resolve(member(json, "qualifier_type"), section, "qualifier_type");
  }
  site.context =
      get_enum(json, "context", section, SiteContext::NORMAL,
               [](const std::string& s) { return parse_site_context(s); });
  site.form =
      get_enum(json, "reference", section, ReferenceForm::MEMBER,
               [](const std::string& s) { return parse_reference_form(s); });
  return site;
}
