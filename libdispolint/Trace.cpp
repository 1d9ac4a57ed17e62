/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "Trace.h"

#include <array>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

#include "Show.h"

namespace {

constexpr std::array<const char*, N_TRACE_MODULES> MODULE_NAMES = {{
#define TM(x) #x,
    TMS
#undef TM
}};

/*
 * Reads TRACE once at startup. The value is a list of levels separated by
 * commas, colons or spaces; a bare level applies to all modules and a
 * "MODULE:level" pair to one, e.g. TRACE=1,DGUARD:3.
 */
class Tracer {
 public:
  Tracer() {
    m_levels.fill(0);
    const char* method_filter = getenv("TRACE_METHOD_FILTER");
    if (method_filter != nullptr) {
      m_method_filter = method_filter;
    }
    const char* traceenv = getenv("TRACE");
    if (traceenv != nullptr) {
      parse_levels(traceenv);
    }
  }

  bool enabled(TraceModule module, int level) const {
    if (level > m_global_level && level > m_levels[module]) {
      return false;
    }
    if (m_method_filter.empty()) {
      return true;
    }
    const auto* context = TraceContext::current();
    return context == nullptr ||
           context->name().find(m_method_filter) != std::string::npos;
  }

  void print(TraceModule module, const char* fmt, va_list ap) {
    std::lock_guard<std::mutex> guard(m_lock);
    fprintf(stderr, "[%s] ", MODULE_NAMES[module]);
    vfprintf(stderr, fmt, ap);
    fputc('\n', stderr);
    fflush(stderr);
  }

 private:
  void parse_levels(const std::string& spec) {
    std::string normalized = spec;
    for (auto& c : normalized) {
      if (c == ',' || c == ':') {
        c = ' ';
      }
    }
    std::istringstream tokens(normalized);
    std::string module;
    std::string tok;
    while (tokens >> tok) {
      int level = atoi(tok.c_str());
      if (level == 0) {
        module = tok;
        continue;
      }
      if (module.empty()) {
        m_global_level = level;
      } else {
        set_module_level(module, level);
      }
      module.clear();
    }
  }

  void set_module_level(const std::string& module, int level) {
    for (size_t i = 0; i < MODULE_NAMES.size(); ++i) {
      if (module == MODULE_NAMES[i]) {
        m_levels[i] = level;
        return;
      }
    }
    fprintf(stderr, "Ignoring unknown trace module %s\n", module.c_str());
  }

  int m_global_level{0};
  std::array<int, N_TRACE_MODULES> m_levels;
  std::string m_method_filter;
  std::mutex m_lock;
};

Tracer& tracer() {
  static Tracer s_tracer;
  return s_tracer;
}

} // namespace

#ifndef NDEBUG
bool traceEnabled(TraceModule module, int level) {
  return tracer().enabled(module, level);
}
#endif

void trace(TraceModule module, int /* level */, const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  tracer().print(module, fmt, ap);
  va_end(ap);
}

thread_local const TraceContext* TraceContext::s_current = nullptr;

TraceContext::TraceContext(const Method* method)
    : m_outer(s_current), m_method(method) {
  s_current = this;
}

TraceContext::TraceContext(std::string name)
    : m_outer(s_current), m_name(std::move(name)) {
  s_current = this;
}

TraceContext::~TraceContext() { s_current = m_outer; }

const std::string& TraceContext::name() const {
  if (m_name.empty() && m_method != nullptr) {
    m_name = show(m_method);
  }
  return m_name;
}
