/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

namespace Json {
class Value;
} // namespace Json

/*
 * Read access to one section of the dispolint config. Absent keys yield the
 * default; a present key of the wrong type is an INVALID_CONFIG error naming
 * the section and the key, e.g. "DisposalGuard.guard_exception".
 */
class JsonWrapper {
 public:
  // An empty section: every lookup yields its default.
  JsonWrapper();
  explicit JsonWrapper(const Json::Value& config, std::string section = "");

  ~JsonWrapper();

  JsonWrapper(JsonWrapper&&) noexcept;
  JsonWrapper& operator=(JsonWrapper&&) noexcept;

  void get(const char* name, size_t dflt, size_t& param) const;

  void get(const char* name, const std::string& dflt, std::string& param) const;

  std::string get(const char* name, const std::string& dflt) const;

  void get(const char* name,
           const std::vector<std::string>& dflt,
           std::vector<std::string>& param) const;

  // The raw value of `name`; null when absent.
  const Json::Value& operator[](const char* name) const;

  const std::string& section() const { return m_section; }

  const Json::Value& unwrap() const { return *m_config; }

 private:
  std::string key_path(const char* name) const;

  std::unique_ptr<Json::Value> m_config;
  std::string m_section;
};
