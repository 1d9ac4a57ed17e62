/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <vector>

#include "JsonWrapper.h"

class Rule;

/*
 * The settings of one dispolint run:
 *
 *   {
 *     "rules": ["DisposalGuard"],
 *     "jobs": 8,
 *     "DisposalGuard": { "guard_exception": "My.ClosedException" }
 *   }
 *
 * "rules" lists the enabled rules; when it is absent every registered rule
 * runs. "jobs" of 0 means one worker per hardware thread. Every other
 * top-level key whose name is a rule's is handed to that rule's configure().
 */
struct LintConfig {
  LintConfig();
  explicit LintConfig(const Json::Value& config);

  /*
   * Reads the config from a JSON file. Unreadable or unparseable files are
   * an INVALID_CONFIG error.
   */
  static LintConfig load(const std::string& path);

  const JsonWrapper& get_json_config() const { return m_json; }

  // Empty means all registered rules.
  const std::vector<std::string>& get_rule_names() const {
    return m_rule_names;
  }
  void set_rule_names(std::vector<std::string> names) {
    m_rule_names = std::move(names);
  }

  size_t get_jobs() const { return m_jobs; }
  void set_jobs(size_t jobs) { m_jobs = jobs; }

  /*
   * The enabled rules, configured from their sections. Naming a rule that is
   * not registered is an INVALID_CONFIG error.
   */
  std::vector<Rule*> configure_rules() const;

 private:
  JsonWrapper m_json;
  std::vector<std::string> m_rule_names;
  size_t m_jobs{0};
};
