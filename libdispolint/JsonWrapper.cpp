/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "JsonWrapper.h"

#include <json/value.h>

#include "DispolintException.h"

JsonWrapper::JsonWrapper() : JsonWrapper(Json::nullValue) {}
JsonWrapper::JsonWrapper(const Json::Value& config, std::string section)
    : m_config(std::make_unique<Json::Value>(config)),
      m_section(std::move(section)) {}

JsonWrapper::~JsonWrapper() {}

JsonWrapper::JsonWrapper(JsonWrapper&& other) noexcept = default;
JsonWrapper& JsonWrapper::operator=(JsonWrapper&& rhs) noexcept = default;

std::string JsonWrapper::key_path(const char* name) const {
  return m_section.empty() ? std::string(name) : m_section + "." + name;
}

void JsonWrapper::get(const char* name, size_t dflt, size_t& param) const {
  const auto& val = (*this)[name];
  if (val.isNull()) {
    param = dflt;
    return;
  }
  assert_or_throw(val.isUInt64(), DispolintError::INVALID_CONFIG,
                  key_path(name) + " must be a non-negative integer");
  param = val.asUInt64();
}

void JsonWrapper::get(const char* name,
                      const std::string& dflt,
                      std::string& param) const {
  const auto& val = (*this)[name];
  if (val.isNull()) {
    param = dflt;
    return;
  }
  assert_or_throw(val.isString(), DispolintError::INVALID_CONFIG,
                  key_path(name) + " must be a string");
  param = val.asString();
  assert_or_throw(!param.empty(), DispolintError::INVALID_CONFIG,
                  key_path(name) + " must not be empty");
}

std::string JsonWrapper::get(const char* name, const std::string& dflt) const {
  std::string res;
  get(name, dflt, res);
  return res;
}

void JsonWrapper::get(const char* name,
                      const std::vector<std::string>& dflt,
                      std::vector<std::string>& param) const {
  const auto& val = (*this)[name];
  if (val.isNull()) {
    param = dflt;
    return;
  }
  assert_or_throw(val.isArray(), DispolintError::INVALID_CONFIG,
                  key_path(name) + " must be an array of strings");
  param.clear();
  for (const auto& str : val) {
    assert_or_throw(str.isString(), DispolintError::INVALID_CONFIG,
                    key_path(name) + " must be an array of strings");
    param.emplace_back(str.asString());
  }
}

const Json::Value& JsonWrapper::operator[](const char* name) const {
  static const Json::Value s_null;
  if (!m_config->isObject()) {
    return s_null;
  }
  return (*m_config)[name];
}
