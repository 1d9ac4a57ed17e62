/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <vector>

#include "MemberRefs.h"

namespace dispolint_test {

constexpr const char* DISPOSABLE = "System.IDisposable";
constexpr const char* ODE = "System.ObjectDisposedException";

// `System.Void cls::name(params)` called on an instance.
MethodRef instance_method(const std::string& cls,
                          const std::string& name,
                          std::vector<std::string> params = {},
                          const std::string& rtype = VOID_TYPE);

MethodRef static_method(const std::string& cls,
                        const std::string& name,
                        std::vector<std::string> params = {},
                        const std::string& rtype = VOID_TYPE);

// The constructor of `cls` taking `params`.
MethodRef ctor(const std::string& cls, std::vector<std::string> params = {});

FieldRef field(const std::string& cls,
               const std::string& name,
               const std::string& type = "System.Int32");

// The path of a sample module under test/samples.
std::string sample_path(const std::string& name);

} // namespace dispolint_test
