/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "RuleContext.h"

#include "Method.h"
#include "Rule.h"
#include "Show.h"
#include "Trace.h"

void RuleContext::report(const Method& method,
                         Severity severity,
                         Confidence confidence) const {
  TRACE(RULES, 2, "%s: %s (%s/%s)", m_rule.name().c_str(), SHOW(method),
        show(severity).c_str(), show(confidence).c_str());
  Finding finding;
  finding.rule = m_rule.name();
  finding.type = method.get_class();
  finding.method = show(method);
  finding.severity = severity;
  finding.confidence = confidence;
  finding.problem = m_rule.problem();
  finding.solution = m_rule.solution();
  m_reporter.report(std::move(finding));
}
