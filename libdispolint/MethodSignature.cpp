/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "MethodSignature.h"

#include "MemberRefs.h"
#include "Method.h"

bool MethodSignature::matches(const Method& method) const {
  if (!name.empty() && method.get_name() != name) {
    return false;
  }
  if (!rtype.empty() && method.get_rtype() != rtype) {
    return false;
  }
  if (!params) {
    return true;
  }
  const auto& actual = method.get_params();
  if (actual.size() != params->size()) {
    return false;
  }
  for (size_t i = 0; i < actual.size(); ++i) {
    const auto& expected = (*params)[i];
    if (!expected.empty() && expected != actual[i]) {
      return false;
    }
  }
  return true;
}

namespace method_signatures {

const MethodSignature& finalize() {
  static const MethodSignature sig("Finalize", VOID_TYPE,
                                   std::vector<std::string>{});
  return sig;
}

const MethodSignature& get_hash_code() {
  static const MethodSignature sig("GetHashCode", "System.Int32",
                                   std::vector<std::string>{});
  return sig;
}

const MethodSignature& to_string() {
  static const MethodSignature sig("ToString", "System.String",
                                   std::vector<std::string>{});
  return sig;
}

const MethodSignature& equals_one() {
  static const MethodSignature sig("Equals", "System.Boolean",
                                   std::vector<std::string>{""});
  return sig;
}

const MethodSignature& close() {
  static const MethodSignature sig("Close", VOID_TYPE,
                                   std::vector<std::string>{});
  return sig;
}

} // namespace method_signatures
