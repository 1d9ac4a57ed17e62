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

enum DispolintError {
  // Error codes here are also surfaced as the exit reason of the dispolint
  // tool.
  INTERNAL_ERROR = 1,
  GENERIC_ASSERTION_ERROR = 2,
  MALFORMED_CODE = 3,
  INVALID_MODULE = 4,
  INVALID_CONFIG = 5,
  MAX = 5,
};

class DispolintException : public std::exception {
 public:
  const DispolintError type;
  const std::string message;
  const std::map<std::string, std::string> extra_info;

  explicit DispolintException(
      DispolintError type_of_error,
      const std::string& message = "",
      const std::map<std::string, std::string>& extra_info = {});

  const char* what() const noexcept override;

 private:
  std::string m_msg;
};

namespace dispolint {

/*
 * A method body that cannot be interpreted: offsets that are not strictly
 * increasing, or a branch to an offset that does not start an instruction.
 * Analyses catch this and give up on the single method.
 */
class MalformedCodeException : public DispolintException {
 public:
  explicit MalformedCodeException(
      const std::string& message,
      const std::map<std::string, std::string>& extra_info = {})
      : DispolintException(DispolintError::MALFORMED_CODE, message, extra_info) {
  }
};

class InvalidModuleException : public DispolintException {
 public:
  explicit InvalidModuleException(
      const std::string& message,
      const std::map<std::string, std::string>& extra_info = {})
      : DispolintException(DispolintError::INVALID_MODULE, message, extra_info) {
  }
};

class InvalidConfigException : public DispolintException {
 public:
  explicit InvalidConfigException(
      const std::string& message,
      const std::map<std::string, std::string>& extra_info = {})
      : DispolintException(DispolintError::INVALID_CONFIG, message, extra_info) {
  }
};

} // namespace dispolint

void assert_or_throw(bool cond,
                     DispolintError type = DispolintError::GENERIC_ASSERTION_ERROR,
                     const std::string& message = "",
                     const std::map<std::string, std::string>& extra_info = {});
