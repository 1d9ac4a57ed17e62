/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "Instruction.h"

#include <limits>

Instruction::Instruction(Opcode op, uint32_t offset)
    : m_opcode(op),
      m_offset(offset),
      m_pops(opcode::pops(op)),
      m_pushes(opcode::pushes(op)) {}

Instruction& Instruction::set_field(FieldRef field) {
  always_assert_log(has_field(), "%s takes no field operand",
                    show(m_opcode).c_str());
  m_operand = std::move(field);
  return *this;
}

Instruction& Instruction::set_method(MethodRef method) {
  always_assert_log(has_method(), "%s takes no method operand",
                    show(m_opcode).c_str());
  always_assert(method.arg_count() <=
                (size_t)std::numeric_limits<int16_t>::max());
  m_pops = static_cast<int16_t>(method.arg_count());
  if (opcode::is_new_object(m_opcode)) {
    // The constructor's `self` is the object being created; it is not on
    // the stack before the instruction runs.
    if (method.has_this) {
      --m_pops;
    }
  } else {
    m_pushes = method.returns_void() ? 0 : 1;
  }
  m_operand = std::move(method);
  return *this;
}

Instruction& Instruction::set_target(uint32_t target) {
  return set_targets({target});
}

Instruction& Instruction::set_targets(std::vector<uint32_t> targets) {
  always_assert_log(has_targets(), "%s takes no branch target",
                    show(m_opcode).c_str());
  always_assert_log(!targets.empty(), "%s needs at least one target",
                    show(m_opcode).c_str());
  always_assert_log(opcode::is_switch(m_opcode) || targets.size() == 1,
                    "%s takes a single target", show(m_opcode).c_str());
  m_operand = std::move(targets);
  return *this;
}

Instruction& Instruction::set_stack_effect(uint16_t pops, uint16_t pushes) {
  always_assert_log(opcode::pops(m_opcode) == opcode::VAR ||
                        opcode::pops(m_opcode) == pops,
                    "%s always pops %d", show(m_opcode).c_str(),
                    opcode::pops(m_opcode));
  always_assert_log(opcode::pushes(m_opcode) == opcode::VAR ||
                        opcode::pushes(m_opcode) == pushes,
                    "%s always pushes %d", show(m_opcode).c_str(),
                    opcode::pushes(m_opcode));
  m_pops = static_cast<int16_t>(pops);
  m_pushes = static_cast<int16_t>(pushes);
  return *this;
}

bool Instruction::operator==(const Instruction& that) const {
  return m_opcode == that.m_opcode && m_offset == that.m_offset &&
         m_pops == that.m_pops && m_pushes == that.m_pushes &&
         m_operand == that.m_operand;
}
