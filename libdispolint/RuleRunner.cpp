/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "RuleRunner.h"

#include <json/value.h>

#include "Debug.h"
#include "Module.h"
#include "Rule.h"
#include "RuleContext.h"
#include "Show.h"
#include "Timer.h"
#include "Trace.h"
#include "Walkers.h"

RunStats& RunStats::operator+=(const RunStats& that) {
  methods += that.methods;
  does_not_apply += that.does_not_apply;
  success += that.success;
  failure += that.failure;
  errors += that.errors;
  return *this;
}

bool RunStats::operator==(const RunStats& that) const {
  return methods == that.methods && does_not_apply == that.does_not_apply &&
         success == that.success && failure == that.failure &&
         errors == that.errors;
}

void RunStats::record(RuleResult result) {
  switch (result) {
  case RuleResult::DOES_NOT_APPLY:
    ++does_not_apply;
    break;
  case RuleResult::SUCCESS:
    ++success;
    break;
  case RuleResult::FAILURE:
    ++failure;
    break;
  }
}

Json::Value RunStats::to_json() const {
  Json::Value value(Json::objectValue);
  value["methods"] = Json::UInt64(methods);
  value["does_not_apply"] = Json::UInt64(does_not_apply);
  value["success"] = Json::UInt64(success);
  value["failure"] = Json::UInt64(failure);
  value["errors"] = Json::UInt64(errors);
  return value;
}

RunStats RuleRunner::run(const Module& module, size_t num_threads) const {
  Timer t("Running " + std::to_string(m_rules.size()) + " rules");
  if (num_threads == 0) {
    num_threads = dispolint_parallel::default_num_threads();
  }

  std::vector<RuleContext> contexts;
  contexts.reserve(m_rules.size());
  for (const auto* rule : m_rules) {
    contexts.emplace_back(module, module, module, m_reporter, *rule);
  }

  auto stats = walk::parallel::methods<RunStats>(
      module,
      [&](const Method* method, RunStats* acc) {
        ++acc->methods;
        for (const auto& context : contexts) {
          const auto& rule = context.rule();
          try {
            auto result = rule.check_method(*method, context);
            TRACE(RUNNER, 5, "%s on %s: %s", rule.name().c_str(),
                  SHOW(method), show(result).c_str());
            acc->record(result);
          } catch (const std::exception& e) {
            TRACE(RUNNER, 1, "%s failed on %s: %s", rule.name().c_str(),
                  SHOW(method), e.what());
            ++acc->errors;
          }
        }
      },
      num_threads);

  TRACE(RUNNER, 1,
        "%zu methods: %zu findings, %zu passed, %zu not applicable, %zu "
        "errors",
        stats.methods, stats.failure, stats.success, stats.does_not_apply,
        stats.errors);
  return stats;
}
