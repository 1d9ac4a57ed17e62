/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "GeneratedCode.h"
#include "Method.h"
#include "Resolver.h"
#include "TypeHierarchy.h"

/*
 * A type known to the module. Types that are only referenced (framework
 * types such as System.IO.Stream) may be present without methods, so that
 * the hierarchy above the analyzed types is known.
 */
class TypeDef final {
 public:
  explicit TypeDef(std::string name,
                   std::string base = "",
                   std::vector<std::string> interfaces = {},
                   bool generated = false)
      : m_name(std::move(name)),
        m_base(std::move(base)),
        m_interfaces(std::move(interfaces)),
        m_generated(generated) {}

  TypeDef(const TypeDef&) = delete;
  TypeDef& operator=(const TypeDef&) = delete;

  const std::string& get_name() const { return m_name; }
  const std::string& get_base() const { return m_base; }
  const std::vector<std::string>& get_interfaces() const {
    return m_interfaces;
  }
  bool is_generated() const { return m_generated; }

  const std::vector<std::unique_ptr<Method>>& get_methods() const {
    return m_methods;
  }

  Method* add_method(std::unique_ptr<Method> method);

  const Method* find_method(const MethodRef& ref) const;

 private:
  std::string m_name;
  std::string m_base;
  std::vector<std::string> m_interfaces;
  bool m_generated;
  std::vector<std::unique_ptr<Method>> m_methods;
};

/*
 * The decoded contents of one compiled unit. Once loading is done a Module is
 * only read, so the queries below may be issued from any thread.
 */
class Module final : public TypeHierarchy,
                     public MethodResolver,
                     public GeneratedCodeMarker {
 public:
  Module() = default;
  Module(const Module&) = delete;
  Module& operator=(const Module&) = delete;

  TypeDef* add_type(std::unique_ptr<TypeDef> type);

  // nullptr for types the module does not know.
  const TypeDef* get_type(const std::string& name) const;

  const std::vector<std::unique_ptr<TypeDef>>& get_types() const {
    return m_types;
  }

  // All methods of all types, in declaration order.
  std::vector<const Method*> get_methods() const;

  bool implements_interface(const std::string& type,
                            const std::string& interface) const override;

  const Method* resolve(const MethodRef& ref) const override;

  bool is_generated_code(const Method& method) const override;

 private:
  std::vector<std::unique_ptr<TypeDef>> m_types;
  std::unordered_map<std::string, TypeDef*> m_types_by_name;
};
