/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "Configurable.h"

#include <stdexcept>

#include <boost/optional.hpp>

namespace {

std::string expect_string(const Json::Value& str) {
  if (!str.isString()) {
    throw std::runtime_error("Expected string, got:" + str.toStyledString());
  }
  return str.asString();
}

void expect_array(const Json::Value& value) {
  if (!value.isArray()) {
    throw std::runtime_error("Expected array, got:" + value.toStyledString());
  }
}

void expect_object(const Json::Value& value) {
  if (!value.isObject()) {
    throw std::runtime_error("Expected object, got:" + value.toStyledString());
  }
}

} // namespace

void Configurable::parse_config(const JsonWrapper& json) {
  m_after_configuration = {};
  m_reflecting = false;
  m_param_reflector = [](const ReflectionParam&) {};
  m_parser = [&json](const std::string& name) {
    if (json.contains(name.c_str())) {
      return boost::optional<const Json::Value&>(json[name.c_str()]);
    } else {
      return boost::optional<const Json::Value&>{};
    }
  };
  bind_config();
  // m_after_configuration may have been set in bind_config()
  if (m_after_configuration) {
    m_after_configuration();
  }
}

Configurable::Reflection Configurable::reflect() {
  Configurable::Reflection cr;
  cr.name = get_config_name();
  cr.doc = get_config_doc();
  m_after_configuration = {};
  m_parser = [](const std::string&) {
    return boost::optional<const Json::Value&>{};
  };
  m_reflecting = true;
  m_param_reflector = [&cr](const ReflectionParam& param) {
    cr.params[param.name] = param;
  };
  bind_config();
  m_reflecting = false;
  return cr;
}

template <>
bool Configurable::as<bool>(const Json::Value& value) {
  if (!value.isBool()) {
    throw std::runtime_error("Expected bool, got:" + value.toStyledString());
  }
  return value.asBool();
}

template <>
unsigned int Configurable::as<unsigned int>(const Json::Value& value) {
  return value.asUInt();
}

template <>
std::vector<std::string> Configurable::as<std::vector<std::string>>(
    const Json::Value& value) {
  expect_array(value);
  std::vector<std::string> result;
  for (const auto& str : value) {
    result.emplace_back(expect_string(str));
  }
  return result;
}

template <>
Configurable::MapOfVectorOfStrings
Configurable::as<Configurable::MapOfVectorOfStrings>(const Json::Value& value) {
  expect_object(value);
  MapOfVectorOfStrings result;
  for (auto it = value.begin(); it != value.end(); ++it) {
    auto& list = result[it.key().asString()];
    expect_array(*it);
    for (const auto& str : *it) {
      list.emplace_back(expect_string(str));
    }
  }
  return result;
}

template <>
Configurable::MapOfStrings Configurable::as<Configurable::MapOfStrings>(
    const Json::Value& value) {
  expect_object(value);
  MapOfStrings result;
  for (auto it = value.begin(); it != value.end(); ++it) {
    result[it.key().asString()] = expect_string(*it);
  }
  return result;
}

#define IMPLEMENT_REFLECTOR_EX(T, type_name)                                \
  template <>                                                               \
  void Configurable::reflect(                                               \
      ReflectorParamFunc& reflector, const std::string& param_name,         \
      const std::string& param_doc, const bool param_is_required, T& param, \
      typename DefaultValueType<T>::type default_value) {                   \
    param = default_value;                                                  \
    reflector(ReflectionParam(param_name, param_doc, param_is_required,     \
                              type_name));                                  \
  }

#define IMPLEMENT_REFLECTOR_WITH_DFLT_VALUE(T, type_name)                   \
  template <>                                                               \
  void Configurable::reflect(                                               \
      ReflectorParamFunc& reflector, const std::string& param_name,         \
      const std::string& param_doc, const bool param_is_required, T& param, \
      typename DefaultValueType<T>::type default_value) {                   \
    param = default_value;                                                  \
    reflector(ReflectionParam(param_name, param_doc, param_is_required,     \
                              type_name, Json::Value(default_value)));      \
  }

IMPLEMENT_REFLECTOR_WITH_DFLT_VALUE(bool, "bool")
IMPLEMENT_REFLECTOR_WITH_DFLT_VALUE(unsigned int, "int")
IMPLEMENT_REFLECTOR_EX(std::vector<std::string>, "list")
IMPLEMENT_REFLECTOR_EX(Configurable::MapOfVectorOfStrings, "dict")
IMPLEMENT_REFLECTOR_EX(Configurable::MapOfStrings, "dict")

#undef IMPLEMENT_REFLECTOR_EX
#undef IMPLEMENT_REFLECTOR_WITH_DFLT_VALUE
