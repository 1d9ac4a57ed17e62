/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>
#include <json/json.h>
#include <stdexcept>

#include "DispolintTest.h"
#include "JsonWrapper.h"
#include "Rule.h"
#include "RuleContext.h"
#include "RuleRegistry.h"
#include "RuleRunner.h"

using namespace dispolint_test;

namespace {

// Fails on methods called "Explode", flags methods called "Bad".
class ExplodingRule : public Rule {
 public:
  ExplodingRule() : Rule("ExplodingTestRule", "p", "s") {}

  RuleResult check_method(const Method& method,
                          const RuleContext& context) const override {
    if (method.get_name() == "Explode") {
      throw std::runtime_error("exploded");
    }
    if (method.get_name() == "Bad") {
      context.report(method, Severity::LOW, Confidence::LOW);
      return RuleResult::FAILURE;
    }
    return method.has_code() ? RuleResult::SUCCESS
                             : RuleResult::DOES_NOT_APPLY;
  }
};

} // namespace

class RuleRunnerTest : public DispolintTest {
 protected:
  void SetUp() override {
    guard = RuleRegistry::get().find("DisposalGuard");
    ASSERT_NE(nullptr, guard);
    guard->configure(JsonWrapper());
  }

  // A disposable type `name` with one unguarded and one guarded method.
  void add_disposable(const std::string& name) {
    MethodCreator unguarded(name, "Write");
    unguarded.load_self()
        .load_field(field(name, "count"))
        .other(1, 0)
        .ret_void();
    MethodCreator guarded(name, "Flush");
    guarded.load_self()
        .load_field(field(name, "count"))
        .other(1, 0)
        .new_object(ctor(ODE))
        .throwex();
    ClassCreator(name)
        .add_interface(DISPOSABLE)
        .add_method(unguarded.create())
        .add_method(guarded.create())
        .add_method(MethodCreator(name, "Dispose").create_abstract())
        .create(*module);
  }

  Rule* guard{nullptr};
};

TEST_F(RuleRunnerTest, stats) {
  add_disposable("NS.A");
  add_disposable("NS.B");

  RuleRunner runner({guard}, collector);
  auto stats = runner.run(*module, 2);
  EXPECT_EQ(6u, stats.methods);
  EXPECT_EQ(2u, stats.failure);
  EXPECT_EQ(2u, stats.success);
  EXPECT_EQ(2u, stats.does_not_apply);
  EXPECT_EQ(0u, stats.errors);

  auto findings = collector.get_findings();
  ASSERT_EQ(2u, findings.size());
  EXPECT_EQ("NS.A", findings[0].type);
  EXPECT_EQ("NS.B", findings[1].type);

  auto json = stats.to_json();
  EXPECT_EQ(6u, json["methods"].asUInt64());
  EXPECT_EQ(2u, json["failure"].asUInt64());
}

TEST_F(RuleRunnerTest, errorsDoNotStopTheRun) {
  ExplodingRule exploding;
  ClassCreator("NS.C")
      .add_method(MethodCreator("NS.C", "Explode").create_abstract())
      .add_method(MethodCreator("NS.C", "Bad").create_abstract())
      .add_method(MethodCreator("NS.C", "Fine").create_abstract())
      .create(*module);
  add_disposable("NS.A");

  RuleRunner runner({guard, &exploding}, collector);
  auto stats = runner.run(*module, 4);
  EXPECT_EQ(6u, stats.methods);
  EXPECT_EQ(1u, stats.errors);
  // Exploding: Bad fails, the rest lack code. Guard: NS.A::Write fails.
  EXPECT_EQ(2u, stats.failure);
  EXPECT_EQ(2u, collector.size());
}

TEST_F(RuleRunnerTest, threadCountDoesNotMatter) {
  for (int i = 0; i < 20; ++i) {
    add_disposable("NS.T" + std::to_string(i));
  }
  RuleRunner runner({guard}, collector);

  auto single = runner.run(*module, 1);
  auto single_findings = collector.get_findings();
  collector.clear();

  auto multi = runner.run(*module, 8);
  auto multi_findings = collector.get_findings();
  collector.clear();

  auto defaulted = runner.run(*module);

  EXPECT_EQ(single, multi);
  EXPECT_EQ(single, defaulted);
  EXPECT_EQ(single_findings, multi_findings);
  EXPECT_EQ(20u, multi_findings.size());
}

TEST(RunStatsTest, accumulate) {
  RunStats a;
  a.methods = 2;
  a.record(RuleResult::SUCCESS);
  a.record(RuleResult::FAILURE);
  RunStats b;
  b.methods = 1;
  b.record(RuleResult::DOES_NOT_APPLY);
  b.errors = 1;
  a += b;
  EXPECT_EQ(3u, a.methods);
  EXPECT_EQ(1u, a.success);
  EXPECT_EQ(1u, a.failure);
  EXPECT_EQ(1u, a.does_not_apply);
  EXPECT_EQ(1u, a.errors);
}
