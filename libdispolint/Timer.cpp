/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "Timer.h"

#include <utility>

#include "Trace.h"

unsigned Timer::s_depth = 0;

Timer::Timer(std::string phase)
    : m_phase(std::move(phase)), m_start(std::chrono::steady_clock::now()) {
  ++s_depth;
}

Timer::~Timer() {
  --s_depth;
  TRACE(TIME, 1, "%*s%s took %.3lf s", static_cast<int>(2 * s_depth), "",
        m_phase.c_str(), elapsed_seconds());
}

double Timer::elapsed_seconds() const {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                       m_start)
      .count();
}
