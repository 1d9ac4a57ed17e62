/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "Module.h"

#include <unordered_set>

#include "Debug.h"
#include "Show.h"

Method* TypeDef::add_method(std::unique_ptr<Method> method) {
  always_assert_log(method->get_class() == m_name,
                    "%s does not belong to %s", SHOW(*method), m_name.c_str());
  assert_or_throw(find_method(method->get_ref()) == nullptr,
                  DispolintError::INVALID_MODULE,
                  "Duplicate method " + show(*method));
  m_methods.push_back(std::move(method));
  return m_methods.back().get();
}

const Method* TypeDef::find_method(const MethodRef& ref) const {
  for (const auto& method : m_methods) {
    if (method->matches(ref)) {
      return method.get();
    }
  }
  return nullptr;
}

TypeDef* Module::add_type(std::unique_ptr<TypeDef> type) {
  const auto& name = type->get_name();
  assert_or_throw(m_types_by_name.count(name) == 0,
                  DispolintError::INVALID_MODULE, "Duplicate type " + name);
  auto* ptr = type.get();
  m_types_by_name.emplace(name, ptr);
  m_types.push_back(std::move(type));
  return ptr;
}

const TypeDef* Module::get_type(const std::string& name) const {
  auto it = m_types_by_name.find(name);
  return it == m_types_by_name.end() ? nullptr : it->second;
}

std::vector<const Method*> Module::get_methods() const {
  std::vector<const Method*> methods;
  for (const auto& type : m_types) {
    for (const auto& method : type->get_methods()) {
      methods.push_back(method.get());
    }
  }
  return methods;
}

bool Module::implements_interface(const std::string& type,
                                  const std::string& interface) const {
  // Walk base types and implemented interfaces. The visited set guards
  // against cycles in malformed hierarchies.
  std::unordered_set<std::string> visited;
  std::vector<const TypeDef*> worklist;
  auto push = [&](const std::string& name) {
    if (name.empty() || !visited.insert(name).second) {
      return;
    }
    auto* def = get_type(name);
    if (def != nullptr) {
      worklist.push_back(def);
    }
  };
  push(type);
  while (!worklist.empty()) {
    const auto* def = worklist.back();
    worklist.pop_back();
    for (const auto& intf : def->get_interfaces()) {
      if (intf == interface) {
        return true;
      }
      push(intf);
    }
    push(def->get_base());
  }
  return false;
}

const Method* Module::resolve(const MethodRef& ref) const {
  auto* def = get_type(ref.cls);
  if (def == nullptr) {
    return nullptr;
  }
  return def->find_method(ref);
}

bool Module::is_generated_code(const Method& method) const {
  if (is_generated(&method) ||
      generated_code::is_compiler_generated_name(method.get_name())) {
    return true;
  }
  const auto& cls = method.get_class();
  if (generated_code::is_compiler_generated_name(cls)) {
    return true;
  }
  auto* def = get_type(cls);
  return def != nullptr && def->is_generated();
}
