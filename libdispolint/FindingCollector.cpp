/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "FindingCollector.h"

#include <algorithm>
#include <json/value.h>

void FindingCollector::report(Finding finding) {
  std::lock_guard<std::mutex> guard(m_lock);
  m_findings.push_back(std::move(finding));
}

std::vector<Finding> FindingCollector::get_findings() const {
  std::vector<Finding> findings;
  {
    std::lock_guard<std::mutex> guard(m_lock);
    findings = m_findings;
  }
  std::stable_sort(findings.begin(), findings.end());
  return findings;
}

size_t FindingCollector::size() const {
  std::lock_guard<std::mutex> guard(m_lock);
  return m_findings.size();
}

void FindingCollector::clear() {
  std::lock_guard<std::mutex> guard(m_lock);
  m_findings.clear();
}

Json::Value FindingCollector::to_json() const {
  Json::Value findings(Json::arrayValue);
  for (const auto& finding : get_findings()) {
    findings.append(finding.to_json());
  }
  Json::Value value(Json::objectValue);
  value["findings"] = findings;
  return value;
}
