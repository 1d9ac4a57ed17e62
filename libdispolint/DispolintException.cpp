/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "DispolintException.h"

DispolintException::DispolintException(
    DispolintError type_of_error,
    const std::string& message,
    const std::map<std::string, std::string>& extra_info)
    : type(type_of_error), message(message), extra_info(extra_info) {

  std::ostringstream oss;
  if (type_of_error != DispolintError::GENERIC_ASSERTION_ERROR) {
    oss << "DispolintError: " << type << " with message: ";
  }
  oss << message;
  if (!extra_info.empty()) {
    oss << " with extra info:";
    for (auto it = extra_info.begin(); it != extra_info.end(); it++) {
      oss << " (\"" << it->first << "\", \"" << it->second << "\")";
    }
  }
  m_msg = oss.str();
}

const char* DispolintException::what() const noexcept { return m_msg.c_str(); }

void assert_or_throw(bool cond,
                     DispolintError type,
                     const std::string& message,
                     const std::map<std::string, std::string>& extra_info) {
  if (!cond) {
    switch (type) {
    case DispolintError::MALFORMED_CODE:
      throw dispolint::MalformedCodeException(message, extra_info);
    case DispolintError::INVALID_MODULE:
      throw dispolint::InvalidModuleException(message, extra_info);
    case DispolintError::INVALID_CONFIG:
      throw dispolint::InvalidConfigException(message, extra_info);
    default:
      break;
    }
    throw DispolintException(type, message, extra_info);
  }
}
