/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <memory>
#include <string>

#include "TightenException.h"

namespace Json {
class Value;
} // namespace Json

/*
 * A configuration object as handed to Configurable::parse_config. Keeps
 * jsoncpp out of the headers of code that only passes configs around.
 */
class JsonWrapper {
 public:
  JsonWrapper();
  explicit JsonWrapper(const Json::Value& config);

  ~JsonWrapper();

  JsonWrapper(JsonWrapper&&) noexcept;
  JsonWrapper& operator=(JsonWrapper&&) noexcept;

  // Null for absent members.
  const Json::Value& operator[](const char* name) const;

  // False unless the config is an object with member `name`.
  bool contains(const char* name) const;

  const Json::Value& unwrap() const { return *m_config; }

 private:
  std::unique_ptr<Json::Value> m_config;
};

/*
 * Reads and parses a JSON document. Throws the exception matching `error`
 * (tighten::InvalidConfigException by default) if the file cannot be opened
 * or is not valid JSON.
 */
Json::Value read_json_from_file(
    const std::string& filename,
    TightenError error = TightenError::INVALID_CONFIG);
