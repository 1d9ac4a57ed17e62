/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <chrono>
#include <string>

/*
 * Times one phase of a run (loading, checking) and logs the duration under
 * TRACE(TIME, 1) when it goes out of scope. Phases nested on the main thread
 * are indented below the enclosing one.
 */
class Timer {
 public:
  explicit Timer(std::string phase);
  ~Timer();

  Timer(const Timer&) = delete;
  Timer& operator=(const Timer&) = delete;

  double elapsed_seconds() const;

 private:
  static unsigned s_depth;

  std::string m_phase;
  std::chrono::steady_clock::time_point m_start;
};
