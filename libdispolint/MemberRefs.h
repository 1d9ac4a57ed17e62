/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <tuple>
#include <utility>
#include <vector>

/*
 * Symbolic references as they appear in instruction operands. Types are
 * identified by their fully qualified name, e.g. "System.IO.Stream". A
 * reference says nothing about whether its target exists in the module;
 * see MethodResolver.
 */

constexpr const char* VOID_TYPE = "System.Void";

struct FieldRef {
  std::string cls;
  std::string name;
  std::string type;

  FieldRef() = default;
  FieldRef(std::string cls, std::string name, std::string type)
      : cls(std::move(cls)), name(std::move(name)), type(std::move(type)) {}

  bool operator==(const FieldRef& that) const {
    return std::tie(cls, name, type) == std::tie(that.cls, that.name, that.type);
  }
  bool operator!=(const FieldRef& that) const { return !(*this == that); }
};

struct MethodRef {
  std::string cls;
  std::string name;
  std::vector<std::string> params;
  std::string rtype{VOID_TYPE};
  // Whether the callee takes an implicit `self` argument ahead of `params`.
  bool has_this{true};

  MethodRef() = default;
  MethodRef(std::string cls,
            std::string name,
            std::vector<std::string> params,
            std::string rtype,
            bool has_this = true)
      : cls(std::move(cls)),
        name(std::move(name)),
        params(std::move(params)),
        rtype(std::move(rtype)),
        has_this(has_this) {}

  bool returns_void() const { return rtype == VOID_TYPE; }

  // Number of values an invoke of this method takes off the stack.
  size_t arg_count() const { return params.size() + (has_this ? 1 : 0); }

  bool operator==(const MethodRef& that) const {
    return std::tie(cls, name, params, rtype, has_this) ==
           std::tie(that.cls, that.name, that.params, that.rtype,
                    that.has_this);
  }
  bool operator!=(const MethodRef& that) const { return !(*this == that); }
};
