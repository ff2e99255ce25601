/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <map>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

enum TightenError {
  // Error codes are also the exit codes of the tighten tool.
  INTERNAL_ERROR = 1,
  GENERIC_ASSERTION_ERROR = 2,
  INVALID_GRAPH = 3,
  INVALID_CONFIG = 4,
  MAX = 4,
};

class TightenException : public std::exception {
 public:
  const TightenError type;
  const std::string message;
  const std::map<std::string, std::string> extra_info;

  explicit TightenException(
      TightenError type_of_error,
      const std::string& message = "",
      const std::map<std::string, std::string>& extra_info = {});

  const char* what() const noexcept override;

 private:
  std::string m_msg;
};

namespace tighten {

class InvalidGraphException : public TightenException {
 public:
  explicit InvalidGraphException(
      const std::string& message,
      const std::map<std::string, std::string>& extra_info = {})
      : TightenException(TightenError::INVALID_GRAPH, message, extra_info) {}
};

class InvalidConfigException : public TightenException {
 public:
  explicit InvalidConfigException(
      const std::string& message,
      const std::map<std::string, std::string>& extra_info = {})
      : TightenException(TightenError::INVALID_CONFIG, message, extra_info) {}
};

} // namespace tighten

void assert_or_throw(bool cond,
                     TightenError type = TightenError::GENERIC_ASSERTION_ERROR,
                     const std::string& message = "",
                     const std::map<std::string, std::string>& extra_info = {});
