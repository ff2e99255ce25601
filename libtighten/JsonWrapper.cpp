/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "JsonWrapper.h"

#include <fstream>

#include <json/json.h>

JsonWrapper::JsonWrapper() : JsonWrapper(Json::Value(Json::objectValue)) {}

JsonWrapper::JsonWrapper(const Json::Value& config)
    : m_config(std::make_unique<Json::Value>(config)) {}

JsonWrapper::~JsonWrapper() {}

JsonWrapper::JsonWrapper(JsonWrapper&& other) noexcept = default;
JsonWrapper& JsonWrapper::operator=(JsonWrapper&& rhs) noexcept = default;

const Json::Value& JsonWrapper::operator[](const char* name) const {
  static const Json::Value s_null;
  if (!m_config->isObject()) {
    return s_null;
  }
  return (*m_config)[name];
}

bool JsonWrapper::contains(const char* name) const {
  return m_config->isObject() && m_config->isMember(name);
}

Json::Value read_json_from_file(const std::string& filename,
                               TightenError error) {
  std::ifstream input(filename);
  assert_or_throw(input.good(), error, "Unable to open JSON file",
                  {{"file", filename}});
  Json::CharReaderBuilder builder;
  Json::Value root;
  std::string errors;
  bool parsed = Json::parseFromStream(builder, input, &root, &errors);
  assert_or_throw(parsed, error, "Failed to parse JSON file",
                  {{"file", filename}, {"errors", errors}});
  return root;
}
