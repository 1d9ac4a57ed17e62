/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <memory>
#include <string>

#include "Module.h"

namespace Json {
class Value;
} // namespace Json

/*
 * Builds a Module from its JSON description:
 *
 *   {"types": [{
 *      "name": "NS.Stream", "base": "System.Object",
 *      "interfaces": ["System.IDisposable"],
 *      "methods": [{
 *        "name": "Write", "params": ["System.Byte[]"],
 *        "return": "System.Void", "flags": ["public"],
 *        "code": [
 *          {"op": "load-self"},
 *          {"op": "invoke-direct",
 *           "method": {"type": "NS.Stream", "name": "EnsureOpen"}},
 *          {"op": "return", "pops": 0}
 *        ]}]}]}
 *
 * Structural problems reject the whole module with an InvalidModuleException.
 * Problems that only make one method body unusable (out-of-order offsets,
 * branches into the middle of nowhere) are kept, so that the analyses can
 * skip just that method.
 */
namespace module_loader {

std::unique_ptr<Module> load_module(const std::string& path);

std::unique_ptr<Module> load_module_from_string(const std::string& text);

std::unique_ptr<Module> load_module_from_json(const Json::Value& root);

} // namespace module_loader
