/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>

#include "Rule.h"

class Code;

/*
 * Using an object after it has been disposed can crash native code or
 * corrupt state. Types that implement the disposal interface should make
 * their public methods fail fast with the "already disposed" exception once
 * Dispose has run:
 *
 *   public void Write(string message) {
 *     if (disposed) {
 *       throw new ObjectDisposedException(GetType().Name);
 *     }
 *     writer.Write(message);
 *   }
 *
 * The rule flags public methods of such types that touch the object's own
 * state (an instance field of the type, or a non-public instance method of
 * the type, reached through `self`) without either constructing the guard
 * exception or calling a helper whose name contains both "Check" and
 * "Dispose" (CheckDisposed, CheckObjectDisposedException, ...).
 *
 * Methods that must keep working after disposal are exempt: constructors,
 * finalizers, property getters, event accessors, Equals(x), GetHashCode(),
 * ToString(), Close() and Dispose itself.
 *
 * The helper-name match is a heuristic. A helper named differently is not
 * recognized (a false positive), and a method called e.g. CheckDisposeFlags
 * that does not throw counts as a guard (a false negative).
 */
class DisposalGuardRule : public Rule {
 public:
  DisposalGuardRule();

  void configure(const JsonWrapper& config) override;

  RuleResult check_method(const Method& method,
                          const RuleContext& context) const override;

  /*
   * Whether the method is worth a look at all: it has a body, is public and
   * not generated, belongs to a type implementing the lifecycle interface,
   * contains a call or a field access, and is not exempt.
   */
  bool is_eligible(const Method& method, const RuleContext& context) const;

  // Whether the method may be called on a disposed object.
  bool is_exempt(const Method& method) const;

  const std::string& lifecycle_interface() const {
    return m_lifecycle_interface;
  }
  const std::string& guard_exception() const { return m_guard_exception; }
  const std::string& disposal_method() const { return m_disposal_method; }

 private:
  std::string m_lifecycle_interface;
  std::string m_guard_exception;
  std::string m_disposal_method;
};
