/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <boost/optional.hpp>
#include <string>

namespace Json {
class Value;
} // namespace Json

class Method;

#define SEVERITIES               \
  SEVERITY(CRITICAL, "critical") \
  SEVERITY(HIGH, "high")         \
  SEVERITY(MEDIUM, "medium")     \
  SEVERITY(LOW, "low")           \
  SEVERITY(AUDIT, "audit")

#define CONFIDENCES            \
  CONFIDENCE(TOTAL, "total")    \
  CONFIDENCE(HIGH, "high")      \
  CONFIDENCE(NORMAL, "normal")  \
  CONFIDENCE(LOW, "low")

// How bad the reported problem is if it is real.
enum class Severity {
#define SEVERITY(uc, name) uc,
  SEVERITIES
#undef SEVERITY
};

// How sure the rule is that the problem is real.
enum class Confidence {
#define CONFIDENCE(uc, name) uc,
  CONFIDENCES
#undef CONFIDENCE
};

// The outcome of applying one rule to one method.
enum class RuleResult {
  DOES_NOT_APPLY,
  SUCCESS,
  FAILURE,
};

std::string show(Severity severity);
std::string show(Confidence confidence);
std::string show(RuleResult result);

namespace finding {
boost::optional<Severity> severity_from_name(const std::string& name);
boost::optional<Confidence> confidence_from_name(const std::string& name);
} // namespace finding

/*
 * A problem a rule found in a method.
 */
struct Finding {
  std::string rule;
  std::string type;
  // The method as rendered by show(const Method&).
  std::string method;
  Severity severity{Severity::MEDIUM};
  Confidence confidence{Confidence::NORMAL};
  std::string problem;
  std::string solution;

  Json::Value to_json() const;

  bool operator==(const Finding& that) const;
  // Orders by type, then method, then rule.
  bool operator<(const Finding& that) const;
};

/*
 * The sink rules send their findings to. Implementations must accept
 * concurrent calls.
 */
class Reporter {
 public:
  virtual ~Reporter() = default;

  virtual void report(Finding finding) = 0;
};
