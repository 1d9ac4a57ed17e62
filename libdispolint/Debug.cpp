/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "Debug.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <execinfo.h>
#include <iostream>
#include <memory>
#include <signal.h>
#include <string>
#include <unistd.h>

#include "Trace.h"

#include <boost/exception/all.hpp>
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wshadow"
#include <boost/stacktrace.hpp>
#pragma GCC diagnostic pop

namespace {

std::atomic<size_t> g_crashing{0};

std::string v_format2string(const char* fmt, va_list ap) {
  va_list backup;
  va_copy(backup, ap);
  // Number of chars that would have been written.
  int size = vsnprintf(nullptr, 0, fmt, ap);
  auto buffer = std::make_unique<char[]>(size + 1);
  vsnprintf(buffer.get(), size + 1, fmt, backup);
  va_end(backup);
  return std::string(buffer.get(), size);
}

using traced = boost::error_info<struct tag_stacktrace,
                                 boost::stacktrace::stacktrace>;

template <typename Exception>
[[noreturn]] void throw_traced(Exception e) {
  throw boost::enable_error_info(std::move(e))
      << traced(boost::stacktrace::stacktrace());
}

} // namespace

void crash_backtrace_handler(int sig) {
  if (g_crashing.fetch_add(1) == 0) {
    // backtrace_symbols_fd does not allocate, unlike boost::stacktrace.
    constexpr int max_frames = 256;
    void* frames[max_frames];
    int len = backtrace(frames, max_frames);
    backtrace_symbols_fd(frames, len, STDERR_FILENO);
  } else {
    // Another thread is already dumping its backtrace.
    sleep(60);
  }
  signal(sig, SIG_DFL);
  raise(sig);
}

std::string format2string(const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  auto ret = v_format2string(fmt, ap);
  va_end(ap);
  return ret;
}

void assert_fail(const char* expr,
                 const char* file,
                 unsigned line,
                 const char* func,
                 DispolintError type,
                 const char* fmt,
                 ...) {
  std::string context;
  if (const auto* trace_context = TraceContext::current()) {
    context = " (Context: " + trace_context->name() + ")";
  }
  std::string msg = format2string("%s:%u: %s: assertion `%s' failed.%s\n", file,
                                  line, func, expr, context.c_str());
  if (strcmp(fmt, " ") != 0) {
    va_list ap;
    va_start(ap, fmt);
    msg += v_format2string(fmt, ap);
    va_end(ap);
  }

  // Keep the subclass so that callers can catch the errors they recover
  // from, like a malformed body that only fails its own method.
  switch (type) {
  case DispolintError::MALFORMED_CODE:
    throw_traced(dispolint::MalformedCodeException(msg));
  case DispolintError::INVALID_MODULE:
    throw_traced(dispolint::InvalidModuleException(msg));
  case DispolintError::INVALID_CONFIG:
    throw_traced(dispolint::InvalidConfigException(msg));
  default:
    throw_traced(DispolintException(type, msg));
  }
}

void print_stack_trace(std::ostream& os, const std::exception& e) {
  if (const auto* st = boost::get_error_info<traced>(e)) {
    os << *st << std::endl;
  }
}
