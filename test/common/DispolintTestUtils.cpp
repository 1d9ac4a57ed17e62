/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "DispolintTestUtils.h"

#include <cstdlib>

namespace dispolint_test {

MethodRef instance_method(const std::string& cls,
                          const std::string& name,
                          std::vector<std::string> params,
                          const std::string& rtype) {
  return MethodRef(cls, name, std::move(params), rtype, /* has_this */ true);
}

MethodRef static_method(const std::string& cls,
                        const std::string& name,
                        std::vector<std::string> params,
                        const std::string& rtype) {
  return MethodRef(cls, name, std::move(params), rtype, /* has_this */ false);
}

MethodRef ctor(const std::string& cls, std::vector<std::string> params) {
  return MethodRef(cls, ".ctor", std::move(params), VOID_TYPE,
                   /* has_this */ true);
}

FieldRef field(const std::string& cls,
               const std::string& name,
               const std::string& type) {
  return FieldRef(cls, name, type);
}

std::string sample_path(const std::string& name) {
  // ctest runs the unit tests from test/samples; `samples_dir` overrides.
  const char* dir = std::getenv("samples_dir");
  return std::string(dir != nullptr ? dir : ".") + "/" + name;
}

} // namespace dispolint_test
