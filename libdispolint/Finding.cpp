/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "Finding.h"

#include <json/value.h>
#include <tuple>

#include "Debug.h"

std::string show(Severity severity) {
  switch (severity) {
#define SEVERITY(uc, name) \
  case Severity::uc:       \
    return name;
    SEVERITIES
#undef SEVERITY
  }
  not_reached();
}

std::string show(Confidence confidence) {
  switch (confidence) {
#define CONFIDENCE(uc, name) \
  case Confidence::uc:       \
    return name;
    CONFIDENCES
#undef CONFIDENCE
  }
  not_reached();
}

std::string show(RuleResult result) {
  switch (result) {
  case RuleResult::DOES_NOT_APPLY:
    return "does-not-apply";
  case RuleResult::SUCCESS:
    return "success";
  case RuleResult::FAILURE:
    return "failure";
  }
  not_reached();
}

namespace finding {

boost::optional<Severity> severity_from_name(const std::string& name) {
#define SEVERITY(uc, str) \
  if (name == str) {      \
    return Severity::uc;  \
  }
  SEVERITIES
#undef SEVERITY
  return boost::none;
}

boost::optional<Confidence> confidence_from_name(const std::string& name) {
#define CONFIDENCE(uc, str) \
  if (name == str) {        \
    return Confidence::uc;  \
  }
  CONFIDENCES
#undef CONFIDENCE
  return boost::none;
}

} // namespace finding

Json::Value Finding::to_json() const {
  Json::Value value(Json::objectValue);
  value["rule"] = rule;
  value["type"] = type;
  value["method"] = method;
  value["severity"] = show(severity);
  value["confidence"] = show(confidence);
  value["problem"] = problem;
  value["solution"] = solution;
  return value;
}

bool Finding::operator==(const Finding& that) const {
  return rule == that.rule && type == that.type && method == that.method &&
         severity == that.severity && confidence == that.confidence;
}

bool Finding::operator<(const Finding& that) const {
  return std::tie(type, method, rule) <
         std::tie(that.type, that.method, that.rule);
}
