/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "LintConfig.h"

#include <fstream>
#include <json/json.h>
#include <unordered_set>

#include "Debug.h"
#include "Rule.h"
#include "RuleRegistry.h"
#include "Trace.h"

LintConfig::LintConfig() : LintConfig(Json::Value(Json::objectValue)) {}

LintConfig::LintConfig(const Json::Value& config) : m_json(config) {
  always_assert_type_log(config.isObject(), DispolintError::INVALID_CONFIG,
                         "The configuration must be a JSON object");
  m_json.get("rules", {}, m_rule_names);
  m_json.get("jobs", size_t(0), m_jobs);
}

LintConfig LintConfig::load(const std::string& path) {
  std::ifstream input(path);
  always_assert_type_log(input.good(), DispolintError::INVALID_CONFIG,
                         "Cannot open config file %s", path.c_str());
  Json::Reader reader;
  Json::Value root;
  bool parsing_succeeded = reader.parse(input, root);
  always_assert_type_log(parsing_succeeded, DispolintError::INVALID_CONFIG,
                         "Failed to parse config json from file: %s\n%s",
                         path.c_str(),
                         reader.getFormattedErrorMessages().c_str());
  TRACE(MAIN, 1, "Loaded config from %s", path.c_str());
  return LintConfig(root);
}

std::vector<Rule*> LintConfig::configure_rules() const {
  auto& registry = RuleRegistry::get();
  std::vector<Rule*> rules;
  if (m_rule_names.empty()) {
    rules = registry.get_rules();
  } else {
    std::unordered_set<std::string> seen;
    for (const auto& name : m_rule_names) {
      auto* rule = registry.find(name);
      always_assert_type_log(rule != nullptr, DispolintError::INVALID_CONFIG,
                             "No rule named %s", name.c_str());
      if (seen.insert(name).second) {
        rules.push_back(rule);
      }
    }
  }
  for (auto* rule : rules) {
    const auto& section = m_json[rule->name().c_str()];
    if (!section.isNull()) {
      always_assert_type_log(section.isObject(), DispolintError::INVALID_CONFIG,
                             "The %s section must be a JSON object",
                             rule->name().c_str());
    }
    rule->configure(JsonWrapper(section, rule->name()));
    TRACE(MAIN, 2, "Enabled rule %s", rule->name().c_str());
  }
  return rules;
}
