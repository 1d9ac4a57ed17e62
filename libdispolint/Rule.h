/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>

#include "Finding.h"

class JsonWrapper;
class Method;
class RuleContext;

/*
 * A check applied to every method of a module.
 *
 * Rules are stateless with respect to the methods they inspect:
 * check_method() may run concurrently on any number of methods, so whatever
 * it learns about a method must live on its own stack frame. Configuration
 * happens once, before the first check.
 *
 * Constructing a rule registers it with the RuleRegistry. Rules that ship
 * with the tool are instantiated as statics in their translation unit:
 *
 *   namespace {
 *   static MyRule s_rule;
 *   } // namespace
 */
class Rule {
 public:
  Rule(std::string name, std::string problem, std::string solution);
  virtual ~Rule();

  Rule(const Rule&) = delete;
  Rule& operator=(const Rule&) = delete;

  const std::string& name() const { return m_name; }
  const std::string& problem() const { return m_problem; }
  const std::string& solution() const { return m_solution; }

  /*
   * Reads the rule's own section of the configuration. Unset keys keep their
   * defaults.
   */
  virtual void configure(const JsonWrapper& /* config */) {}

  virtual RuleResult check_method(const Method& method,
                                  const RuleContext& context) const = 0;

 private:
  std::string m_name;
  std::string m_problem;
  std::string m_solution;
};
