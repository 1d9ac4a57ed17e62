/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <mutex>
#include <string>
#include <vector>

class Rule;

struct RuleRegistry {
  /**
   * Get the global registry object.
   */
  static RuleRegistry& get();

  /**
   * Register a rule. Names must be unique.
   */
  void register_rule(Rule* rule);

  void unregister_rule(Rule* rule);

  /**
   * Get the rules, sorted by name.
   */
  std::vector<Rule*> get_rules() const;

  /**
   * The rule called `name`, or nullptr.
   */
  Rule* find(const std::string& name) const;

 private:
  /**
   * Singleton.  Private/deleted constructors.
   */
  RuleRegistry() {}
  RuleRegistry(const RuleRegistry&) = delete;
  RuleRegistry& operator=(const RuleRegistry&) = delete;

  mutable std::mutex m_lock;
  std::vector<Rule*> m_registered_rules;
};
