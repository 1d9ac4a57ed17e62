/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "Rule.h"

#include "RuleRegistry.h"

Rule::Rule(std::string name, std::string problem, std::string solution)
    : m_name(std::move(name)),
      m_problem(std::move(problem)),
      m_solution(std::move(solution)) {
  RuleRegistry::get().register_rule(this);
}

Rule::~Rule() { RuleRegistry::get().unregister_rule(this); }
