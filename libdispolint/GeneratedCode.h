/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>

class Method;

/*
 * Tells compiler-synthesized bodies (iterator and async state machines,
 * lambdas, auto-property accessors) apart from code the user wrote. Their
 * control flow is the compiler's, not the user's, so rules skip them.
 */
class GeneratedCodeMarker {
 public:
  virtual ~GeneratedCodeMarker() = default;

  virtual bool is_generated_code(const Method& method) const = 0;
};

namespace generated_code {

/*
 * Compilers name the types and methods they synthesize so that a segment of
 * the name starts with '<', which no source identifier can: "<Run>b__0",
 * "NS.Foo/<GetEnumerator>d__0". Angle brackets after an identifier are
 * generic arguments ("NS.Box<T>") and do not count.
 */
inline bool is_compiler_generated_name(const std::string& name) {
  int depth = 0;
  bool segment_start = true;
  for (char c : name) {
    if (c == '<') {
      if (segment_start) {
        return true;
      }
      ++depth;
    } else if (c == '>') {
      depth = depth > 0 ? depth - 1 : 0;
    }
    segment_start = depth == 0 && (c == '.' || c == '/');
  }
  return false;
}

} // namespace generated_code
