/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>

#include "Macros.h"

class Method;

#define TMS         \
  TM(DGUARD)        \
  TM(LOADER)        \
  TM(MAIN)          \
  TM(RULES)         \
  TM(RUNNER)        \
  TM(TIME)          \
  TM(TRACER)        \
  /* End of list */

enum TraceModule : int {
#define TM(x) x,
  TMS
#undef TM
      N_TRACE_MODULES,
};

// Keep the TRACE arguments visible to the compiler in NDEBUG builds, and
// let the constexpr condition remove them.
#ifdef NDEBUG
constexpr bool traceEnabled(TraceModule, int) { return false; }
#else
bool traceEnabled(TraceModule module, int level);
#endif // NDEBUG

// Prints one line to stderr, prefixed with the module name.
void trace(TraceModule module, int level, const char* fmt, ...)
    ATTR_FORMAT(3, 4);

#define TRACE(module, level, fmt, ...)                \
  do {                                                \
    if (traceEnabled(module, level)) {                \
      trace(module, level, fmt, ##__VA_ARGS__);       \
    }                                                 \
  } while (0)

/*
 * Names what the current thread is checking, usually a method. Contexts
 * nest; the innermost one shows up in assertion messages, and
 * TRACE_METHOD_FILTER is matched against it.
 */
class TraceContext {
 public:
  explicit TraceContext(const Method* method);
  explicit TraceContext(std::string name);
  ~TraceContext();

  TraceContext(const TraceContext&) = delete;
  TraceContext& operator=(const TraceContext&) = delete;

  // The innermost context of the calling thread, or nullptr.
  static const TraceContext* current() { return s_current; }

  const std::string& name() const;

 private:
  thread_local static const TraceContext* s_current;

  const TraceContext* m_outer;
  const Method* m_method{nullptr};
  mutable std::string m_name;
};
