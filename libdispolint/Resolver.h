/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

struct MethodRef;
class Method;

/*
 * Finds the definition behind a method reference.
 */
class MethodResolver {
 public:
  virtual ~MethodResolver() = default;

  /*
   * The method `ref` names, or nullptr if it is not defined in the module
   * (e.g. it lives in another assembly). Callers must treat nullptr as
   * "unknown" and not guess at the callee's attributes.
   */
  virtual const Method* resolve(const MethodRef& ref) const = 0;
};
