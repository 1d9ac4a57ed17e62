/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>
#include <json/json.h>

#include "FindingCollector.h"
#include "WorkQueue.h"

namespace {

Finding make_finding(const std::string& type, const std::string& method) {
  Finding finding;
  finding.rule = "DisposalGuard";
  finding.type = type;
  finding.method = method;
  finding.severity = Severity::MEDIUM;
  finding.confidence = Confidence::HIGH;
  finding.problem = "problem";
  finding.solution = "solution";
  return finding;
}

} // namespace

TEST(FindingCollectorTest, sorted) {
  FindingCollector collector;
  collector.report(make_finding("NS.B", "System.Void NS.B::Write()"));
  collector.report(make_finding("NS.A", "System.Void NS.A::Write()"));
  collector.report(make_finding("NS.A", "System.Void NS.A::Flush()"));

  auto findings = collector.get_findings();
  ASSERT_EQ(3u, findings.size());
  EXPECT_EQ("System.Void NS.A::Flush()", findings[0].method);
  EXPECT_EQ("System.Void NS.A::Write()", findings[1].method);
  EXPECT_EQ("NS.B", findings[2].type);

  collector.clear();
  EXPECT_EQ(0u, collector.size());
}

TEST(FindingCollectorTest, concurrentReports) {
  FindingCollector collector;
  std::vector<int> items(500);
  for (size_t i = 0; i < items.size(); ++i) {
    items[i] = static_cast<int>(i);
  }
  workqueue_run<int>(
      [&collector](int i) {
        collector.report(make_finding("NS.T" + std::to_string(i), "M"));
      },
      items, 8);
  EXPECT_EQ(500u, collector.size());
}

TEST(FindingCollectorTest, toJson) {
  FindingCollector collector;
  EXPECT_EQ(0u, collector.to_json()["findings"].size());

  collector.report(make_finding("NS.A", "System.Void NS.A::Write()"));
  auto json = collector.to_json();
  ASSERT_EQ(1u, json["findings"].size());
  const auto& finding = json["findings"][0];
  EXPECT_EQ("DisposalGuard", finding["rule"].asString());
  EXPECT_EQ("NS.A", finding["type"].asString());
  EXPECT_EQ("System.Void NS.A::Write()", finding["method"].asString());
  EXPECT_EQ("medium", finding["severity"].asString());
  EXPECT_EQ("high", finding["confidence"].asString());
  EXPECT_EQ("problem", finding["problem"].asString());
  EXPECT_EQ("solution", finding["solution"].asString());
}

TEST(FindingTest, defaults) {
  Finding finding;
  EXPECT_EQ(Severity::MEDIUM, finding.severity);
  EXPECT_EQ(Confidence::NORMAL, finding.confidence);
  EXPECT_EQ(finding, Finding());
  EXPECT_EQ("medium", finding.to_json()["severity"].asString());
  EXPECT_EQ("normal", finding.to_json()["confidence"].asString());
}

TEST(FindingTest, names) {
  EXPECT_EQ("critical", show(Severity::CRITICAL));
  EXPECT_EQ("audit", show(Severity::AUDIT));
  EXPECT_EQ("total", show(Confidence::TOTAL));
  EXPECT_EQ("does-not-apply", show(RuleResult::DOES_NOT_APPLY));
  EXPECT_EQ("failure", show(RuleResult::FAILURE));

  EXPECT_EQ(Severity::LOW, *finding::severity_from_name("low"));
  EXPECT_EQ(Confidence::NORMAL, *finding::confidence_from_name("normal"));
  EXPECT_FALSE(finding::severity_from_name("fatal"));
  EXPECT_FALSE(finding::confidence_from_name("certain"));
}
