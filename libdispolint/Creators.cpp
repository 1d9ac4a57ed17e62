/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "Creators.h"

#include "Debug.h"
#include "Method.h"
#include "Module.h"

MethodCreator::MethodCreator(std::string cls,
                             std::string name,
                             std::vector<std::string> params,
                             std::string rtype,
                             AccessFlags access)
    : m_ref(std::move(cls),
            std::move(name),
            std::move(params),
            std::move(rtype),
            !is_static(access)),
      m_access(access) {}

MethodCreator& MethodCreator::push(Instruction insn) {
  m_next_offset = insn.offset() + 1;
  m_insns.push_back(std::move(insn));
  return *this;
}

MethodCreator& MethodCreator::push_instruction(Instruction insn) {
  return push(std::move(insn));
}

MethodCreator& MethodCreator::push_branch(Opcode op,
                                          std::vector<std::string> labels) {
  Instruction insn(op, m_next_offset);
  // Placeholder, replaced once the labels are known.
  insn.set_targets(std::vector<uint32_t>(labels.size(), m_next_offset));
  m_branches.emplace(m_insns.size(), std::move(labels));
  return push(std::move(insn));
}

MethodCreator& MethodCreator::load_self() {
  return push(Instruction(OPCODE_LOAD_SELF, m_next_offset));
}

MethodCreator& MethodCreator::invoke(Opcode op, const MethodRef& callee) {
  always_assert(opcode::is_an_invoke(op));
  Instruction insn(op, m_next_offset);
  insn.set_method(callee);
  return push(std::move(insn));
}

MethodCreator& MethodCreator::new_object(const MethodRef& ctor) {
  Instruction insn(OPCODE_NEW_OBJECT, m_next_offset);
  insn.set_method(ctor);
  return push(std::move(insn));
}

MethodCreator& MethodCreator::load_field(const FieldRef& field) {
  Instruction insn(OPCODE_LOAD_FIELD, m_next_offset);
  insn.set_field(field);
  return push(std::move(insn));
}

MethodCreator& MethodCreator::load_field_address(const FieldRef& field) {
  Instruction insn(OPCODE_LOAD_FIELD_ADDRESS, m_next_offset);
  insn.set_field(field);
  return push(std::move(insn));
}

MethodCreator& MethodCreator::store_field(const FieldRef& field) {
  Instruction insn(OPCODE_STORE_FIELD, m_next_offset);
  insn.set_field(field);
  return push(std::move(insn));
}

MethodCreator& MethodCreator::dup() {
  return push(Instruction(OPCODE_DUP, m_next_offset));
}

MethodCreator& MethodCreator::if_test(const std::string& label,
                                      uint16_t pops) {
  push_branch(OPCODE_IF, {label});
  m_insns.back().set_stack_effect(pops, 0);
  return *this;
}

MethodCreator& MethodCreator::goto_(const std::string& label) {
  return push_branch(OPCODE_GOTO, {label});
}

MethodCreator& MethodCreator::switch_op(
    const std::vector<std::string>& labels) {
  return push_branch(OPCODE_SWITCH, labels);
}

MethodCreator& MethodCreator::ret(uint16_t pops) {
  Instruction insn(OPCODE_RETURN, m_next_offset);
  insn.set_stack_effect(pops, 0);
  return push(std::move(insn));
}

MethodCreator& MethodCreator::throwex() {
  return push(Instruction(OPCODE_THROW, m_next_offset));
}

MethodCreator& MethodCreator::other(uint16_t pops, uint16_t pushes) {
  Instruction insn(OPCODE_OTHER, m_next_offset);
  insn.set_stack_effect(pops, pushes);
  return push(std::move(insn));
}

MethodCreator& MethodCreator::mark_label(const std::string& label) {
  always_assert_log(m_labels.count(label) == 0, "Label %s defined twice",
                    label.c_str());
  m_labels.emplace(label, m_next_offset);
  return *this;
}

std::unique_ptr<Method> MethodCreator::create_abstract() {
  always_assert_log(m_insns.empty(), "%s has instructions",
                    m_ref.name.c_str());
  return std::make_unique<Method>(m_ref, m_access);
}

std::unique_ptr<Method> MethodCreator::create() {
  for (const auto& branch : m_branches) {
    std::vector<uint32_t> targets;
    for (const auto& label : branch.second) {
      auto it = m_labels.find(label);
      always_assert_log(it != m_labels.end(), "Undefined label %s",
                        label.c_str());
      targets.push_back(it->second);
    }
    m_insns.at(branch.first).set_targets(std::move(targets));
  }
  return std::make_unique<Method>(m_ref, m_access,
                                  std::make_unique<Code>(std::move(m_insns)));
}

TypeDef* ClassCreator::create(Module& module) {
  auto* type = module.add_type(std::make_unique<TypeDef>(
      m_name, m_base, m_interfaces, m_generated));
  for (auto& method : m_methods) {
    type->add_method(std::move(method));
  }
  m_methods.clear();
  return type;
}
