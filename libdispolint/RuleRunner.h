/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstddef>
#include <vector>

#include "Finding.h"

namespace Json {
class Value;
} // namespace Json

class Module;
class Rule;

struct RunStats {
  size_t methods{0};
  size_t does_not_apply{0};
  size_t success{0};
  size_t failure{0};
  // Rule applications that threw and were skipped.
  size_t errors{0};

  RunStats& operator+=(const RunStats& that);
  bool operator==(const RunStats& that) const;

  void record(RuleResult result);

  Json::Value to_json() const;
};

/*
 * Applies a set of rules to every method of a module.
 *
 * A rule that throws on one method is logged and counted in
 * RunStats::errors; the remaining methods and rules still run.
 */
class RuleRunner {
 public:
  RuleRunner(std::vector<Rule*> rules, Reporter& reporter)
      : m_rules(std::move(rules)), m_reporter(reporter) {}

  /*
   * Checks every method of `module` with every rule using `num_threads`
   * workers (0 for one per hardware thread).
   */
  RunStats run(const Module& module, size_t num_threads = 0) const;

  const std::vector<Rule*>& get_rules() const { return m_rules; }

 private:
  std::vector<Rule*> m_rules;
  Reporter& m_reporter;
};
