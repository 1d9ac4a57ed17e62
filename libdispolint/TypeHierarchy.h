/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>

/*
 * Subtyping queries over the types known to the loader.
 */
class TypeHierarchy {
 public:
  virtual ~TypeHierarchy() = default;

  /*
   * Whether `type` implements the interface named `interface`, either
   * directly, through an interface it implements, or through a base type.
   * Unknown types implement nothing.
   */
  virtual bool implements_interface(const std::string& type,
                                    const std::string& interface) const = 0;
};
