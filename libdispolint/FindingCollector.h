/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <mutex>
#include <vector>

#include "Finding.h"

/*
 * A Reporter that keeps every finding in memory. Rules running on different
 * threads may report into the same collector.
 */
class FindingCollector final : public Reporter {
 public:
  void report(Finding finding) override;

  // The findings so far, in Finding::operator< order.
  std::vector<Finding> get_findings() const;

  size_t size() const;

  void clear();

  // {"findings": [...]} in the order of get_findings().
  Json::Value to_json() const;

 private:
  mutable std::mutex m_lock;
  std::vector<Finding> m_findings;
};
