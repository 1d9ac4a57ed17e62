/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "AccessFlags.h"
#include "Code.h"
#include "MemberRefs.h"

/*
 * A method definition: identity, attributes and, unless it is abstract or
 * implemented outside the module, a body.
 *
 * Methods are owned by their TypeDef and are read-only once the module has
 * been loaded.
 */
class Method final {
 public:
  Method(MethodRef ref, AccessFlags access, std::unique_ptr<Code> code = nullptr)
      : m_ref(std::move(ref)), m_access(access), m_code(std::move(code)) {
    m_ref.has_this = !is_static(access);
  }

  Method(const Method&) = delete;
  Method& operator=(const Method&) = delete;

  const MethodRef& get_ref() const { return m_ref; }
  const std::string& get_class() const { return m_ref.cls; }
  const std::string& get_name() const { return m_ref.name; }
  const std::vector<std::string>& get_params() const { return m_ref.params; }
  const std::string& get_rtype() const { return m_ref.rtype; }

  AccessFlags get_access() const { return m_access; }

  const Code* get_code() const { return m_code.get(); }
  bool has_code() const { return m_code != nullptr; }

  /*
   * Whether a call through `ref` names this method: same declaring type,
   * name and parameter types.
   */
  bool matches(const MethodRef& ref) const {
    return ref.cls == m_ref.cls && ref.name == m_ref.name &&
           ref.params == m_ref.params;
  }

 private:
  MethodRef m_ref;
  AccessFlags m_access;
  std::unique_ptr<Code> m_code;
};
