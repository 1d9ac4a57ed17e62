/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "RuleRegistry.h"

#include <algorithm>

#include "Debug.h"
#include "Rule.h"

RuleRegistry& RuleRegistry::get() {
  static RuleRegistry registry;
  return registry;
}

void RuleRegistry::register_rule(Rule* rule) {
  std::lock_guard<std::mutex> guard(m_lock);
  for (const auto* registered : m_registered_rules) {
    always_assert_log(registered->name() != rule->name(),
                      "A rule named %s is already registered",
                      rule->name().c_str());
  }
  m_registered_rules.push_back(rule);
}

void RuleRegistry::unregister_rule(Rule* rule) {
  std::lock_guard<std::mutex> guard(m_lock);
  m_registered_rules.erase(std::remove(m_registered_rules.begin(),
                                       m_registered_rules.end(), rule),
                           m_registered_rules.end());
}

std::vector<Rule*> RuleRegistry::get_rules() const {
  std::vector<Rule*> rules;
  {
    std::lock_guard<std::mutex> guard(m_lock);
    rules = m_registered_rules;
  }
  std::sort(rules.begin(), rules.end(), [](const Rule* a, const Rule* b) {
    return a->name() < b->name();
  });
  return rules;
}

Rule* RuleRegistry::find(const std::string& name) const {
  std::lock_guard<std::mutex> guard(m_lock);
  for (auto* rule : m_registered_rules) {
    if (rule->name() == name) {
      return rule;
    }
  }
  return nullptr;
}
