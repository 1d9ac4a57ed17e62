/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <boost/optional.hpp>
#include <string>
#include <vector>

class Method;

/*
 * A partial description of a method's signature. Unset parts match
 * anything; a parameter type left empty matches any type at that position.
 *
 *   MethodSignature("Equals", "System.Boolean", {""})
 *
 * matches every single-argument Equals returning bool, and
 *
 *   MethodSignature("Close", "", {})
 *
 * every parameterless Close.
 */
struct MethodSignature {
  std::string name;
  std::string rtype;
  boost::optional<std::vector<std::string>> params;

  MethodSignature(std::string name,
                  std::string rtype,
                  boost::optional<std::vector<std::string>> params)
      : name(std::move(name)), rtype(std::move(rtype)), params(std::move(params)) {}

  bool matches(const Method& method) const;
};

namespace method_signatures {

const MethodSignature& finalize();
const MethodSignature& get_hash_code();
const MethodSignature& to_string();
const MethodSignature& equals_one();
const MethodSignature& close();

} // namespace method_signatures
