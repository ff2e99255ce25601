/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "EntryPoints.h"

#include <unordered_set>

#include "Declaration.h"
#include "Show.h"
#include "Trace.h"

namespace {

const char* const SERIALIZABLE = "java.io.Serializable";

const std::unordered_set<std::string>& serialization_methods() {
  static const std::unordered_set<std::string> methods = {
      "writeObject", "readObject",  "readObjectNoData",
      "writeReplace", "readResolve",
  };
  return methods;
}

const std::unordered_set<std::string>& serialization_fields() {
  static const std::unordered_set<std::string> fields = {
      "serialVersionUID",
      "serialPersistentFields",
  };
  return fields;
}

bool implements_named(const Declaration* type, const std::string& name) {
  std::unordered_set<const Declaration*> visited;
  std::vector<const Declaration*> worklist{type};
  while (!worklist.empty()) {
    auto* t = worklist.back();
    worklist.pop_back();
    if (!visited.insert(t).second) {
      continue;
    }
    if (t->str() == name) {
      return true;
    }
    const auto& supers = t->get_supertypes();
    worklist.insert(worklist.end(), supers.begin(), supers.end());
  }
  return false;
}

} // namespace

bool AnnotatedEntryPoints::is_entry_point(const Declaration* decl) const {
  for (const auto& anno : decl->get_annotations()) {
    if (m_rules.count(anno)) {
      return true;
    }
  }
  return false;
}

boost::optional<AccessLevel> AnnotatedEntryPoints::min_visibility(
    const Declaration* decl) const {
  boost::optional<AccessLevel> floor;
  for (const auto& anno : decl->get_annotations()) {
    auto it = m_rules.find(anno);
    if (it == m_rules.end()) {
      continue;
    }
    if (!it->second) {
      return boost::none;
    }
    floor = floor ? join(*floor, *it->second) : *it->second;
  }
  return floor;
}

bool SerializationEntryPoints::is_entry_point(const Declaration* decl) const {
  auto* container = decl->get_container();
  if (container == nullptr) {
    return false;
  }
  if (decl->is_method()) {
    if (!serialization_methods().count(decl->get_name())) {
      return false;
    }
  } else if (decl->is_field()) {
    if (!serialization_fields().count(decl->get_name())) {
      return false;
    }
  } else {
    return false;
  }
  return implements_named(container, SERIALIZABLE);
}

bool KeepListEntryPoints::is_entry_point(const Declaration* decl) const {
  return m_names.count(decl->str()) != 0;
}

bool EntryPointOracle::is_entry_point(const Declaration* decl) const {
  for (const auto& provider : m_providers) {
    if (provider->is_entry_point(decl)) {
      TRACE(ENTRY, 3, "%s is an entry point (%s)", SHOW(decl),
            provider->name().c_str());
      return true;
    }
  }
  return false;
}

boost::optional<AccessLevel> EntryPointOracle::min_visibility(
    const Declaration* decl) const {
  boost::optional<AccessLevel> floor;
  bool claimed = false;
  for (const auto& provider : m_providers) {
    if (!provider->is_entry_point(decl)) {
      continue;
    }
    claimed = true;
    auto provider_floor = provider->min_visibility(decl);
    if (!provider_floor) {
      TRACE(ENTRY, 4, "%s keeps its level (%s)", SHOW(decl),
            provider->name().c_str());
      return boost::none;
    }
    floor = floor ? join(*floor, *provider_floor) : *provider_floor;
  }
  if (claimed && floor) {
    TRACE(ENTRY, 4, "%s has floor %s", SHOW(decl), SHOW(*floor));
  }
  return floor;
}
