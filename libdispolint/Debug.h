/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include "DispolintException.h"
#include "Macros.h" // For ATTR_FORMAT.

#include <exception>
#include <iosfwd>
#include <string>

constexpr bool debug =
#ifdef NDEBUG
    false
#else
    true
#endif // NDEBUG
    ;

#define not_reached()        \
  do {                       \
    dispolint_assert(false); \
    __builtin_unreachable(); \
  } while (true)
#define not_reached_log(msg, ...)          \
  do {                                     \
    assert_log(false, msg, ##__VA_ARGS__); \
    __builtin_unreachable();               \
  } while (true)

#define assert_fail_impl(e, type, msg, ...) \
  assert_fail(#e, __FILE__, __LINE__, __PRETTY_FUNCTION__, type, msg, \
              ##__VA_ARGS__)

[[noreturn]] void assert_fail(const char* expr,
                              const char* file,
                              unsigned line,
                              const char* func,
                              DispolintError type,
                              const char* fmt,
                              ...) ATTR_FORMAT(6, 7);

#define assert_impl(cond, fail) \
  ((cond) ? static_cast<void>(0) : ((fail), static_cast<void>(0)))

// Note: Using " " and detecting that, so that GCC's `-Wformat-zero-length`
//       does not apply.
#define always_assert(e)                                         \
  assert_impl(e, assert_fail_impl(e,                             \
                                  DispolintError::GENERIC_ASSERTION_ERROR, \
                                  " "))
#define always_assert_log(e, msg, ...)                                   \
  assert_impl(e,                                                         \
              assert_fail_impl(e, DispolintError::GENERIC_ASSERTION_ERROR, \
                               msg, ##__VA_ARGS__))
#define always_assert_type_log(e, type, msg, ...) \
  assert_impl(e, assert_fail_impl(e, type, msg, ##__VA_ARGS__))
#undef assert

// Non-always asserts. `!debug` folds away since it is a constexpr.
#define dispolint_assert(e) always_assert(!debug || (e))
#define assert_log(e, msg, ...) \
  always_assert_log(!debug || e, msg, ##__VA_ARGS__)

std::string format2string(const char* fmt, ...) ATTR_FORMAT(1, 2);

// Prints the stack trace that assert_fail attached to `e`, if any.
void print_stack_trace(std::ostream& os, const std::exception& e);

// For SIGSEGV, SIGABRT and SIGBUS: dumps the backtrace of the first crashing
// thread to stderr, then re-raises `sig` with the default action.
void crash_backtrace_handler(int sig);
