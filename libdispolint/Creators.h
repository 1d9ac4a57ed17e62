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

#include "AccessFlags.h"
#include "Instruction.h"
#include "MemberRefs.h"

class Method;
class Module;
class TypeDef;

/*
 * Builds a method body instruction by instruction. Instructions get
 * consecutive offsets starting at 0; branches name their targets by label
 * and the labels are resolved when the method is created:
 *
 *   MethodCreator mc("NS.Stream", "Write", {"System.String"});
 *   mc.load_self()
 *       .load_field(disposed)
 *       .if_test("ok")
 *       .new_object(ode_ctor)
 *       .throwex()
 *       .mark_label("ok")
 *       .ret_void();
 *   auto method = mc.create();
 */
struct MethodCreator {
  MethodCreator(std::string cls,
                std::string name,
                std::vector<std::string> params = {},
                std::string rtype = VOID_TYPE,
                AccessFlags access = ACC_PUBLIC);

  MethodCreator& load_self();
  MethodCreator& invoke(Opcode op, const MethodRef& callee);
  MethodCreator& invoke_direct(const MethodRef& callee) {
    return invoke(OPCODE_INVOKE_DIRECT, callee);
  }
  MethodCreator& invoke_virtual(const MethodRef& callee) {
    return invoke(OPCODE_INVOKE_VIRTUAL, callee);
  }
  MethodCreator& new_object(const MethodRef& ctor);
  MethodCreator& load_field(const FieldRef& field);
  MethodCreator& load_field_address(const FieldRef& field);
  MethodCreator& store_field(const FieldRef& field);
  MethodCreator& dup();

  // A conditional branch popping `pops` values.
  MethodCreator& if_test(const std::string& label, uint16_t pops = 1);
  MethodCreator& goto_(const std::string& label);
  MethodCreator& switch_op(const std::vector<std::string>& labels);
  MethodCreator& ret(uint16_t pops = 1);
  MethodCreator& ret_void() { return ret(0); }
  MethodCreator& throwex();
  MethodCreator& other(uint16_t pops, uint16_t pushes);

  // The next instruction is the target of branches to `label`.
  MethodCreator& mark_label(const std::string& label);

  /*
   * Appends `insn` as is, offset included. Later instructions continue
   * from its offset. Branch targets are not checked, so this can build
   * ill-formed bodies.
   */
  MethodCreator& push_instruction(Instruction insn);

  // A method without a body.
  std::unique_ptr<Method> create_abstract();

  std::unique_ptr<Method> create();

 private:
  MethodCreator& push(Instruction insn);
  MethodCreator& push_branch(Opcode op, std::vector<std::string> labels);

  MethodRef m_ref;
  AccessFlags m_access;
  std::vector<Instruction> m_insns;
  uint32_t m_next_offset{0};
  std::unordered_map<std::string, uint32_t> m_labels;
  // Instruction index -> the labels it branches to.
  std::unordered_map<size_t, std::vector<std::string>> m_branches;
};

struct ClassCreator {
  explicit ClassCreator(std::string name) : m_name(std::move(name)) {}

  ClassCreator& set_super(std::string base) {
    m_base = std::move(base);
    return *this;
  }
  ClassCreator& add_interface(std::string intf) {
    m_interfaces.push_back(std::move(intf));
    return *this;
  }
  ClassCreator& set_generated(bool generated = true) {
    m_generated = generated;
    return *this;
  }
  ClassCreator& add_method(std::unique_ptr<Method> method) {
    m_methods.push_back(std::move(method));
    return *this;
  }

  TypeDef* create(Module& module);

 private:
  std::string m_name;
  std::string m_base;
  std::vector<std::string> m_interfaces;
  bool m_generated{false};
  std::vector<std::unique_ptr<Method>> m_methods;
};
