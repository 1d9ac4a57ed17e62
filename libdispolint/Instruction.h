/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "Debug.h"
#include "MemberRefs.h"
#include "Opcode.h"

/*
 * A decoded instruction of a stack machine. Every instruction takes
 * `pops()` values off the evaluation stack and then pushes `pushes()` values.
 * Where the opcode does not fix those numbers the operand or the decoder
 * supplies them; an instruction whose stack effect was never supplied
 * reports `has_stack_effect() == false` and analyses must not look past it.
 *
 * Instructions are immutable once they are part of a Code object.
 */
class Instruction final {
 public:
  Instruction(Opcode op, uint32_t offset);

  Opcode opcode() const { return m_opcode; }
  uint32_t offset() const { return m_offset; }

  bool has_field() const { return opcode::ref(m_opcode) == opcode::Ref::Field; }

  bool has_method() const {
    return opcode::ref(m_opcode) == opcode::Ref::Method;
  }

  bool has_targets() const {
    return opcode::ref(m_opcode) == opcode::Ref::Target;
  }

  const FieldRef& get_field() const {
    always_assert_log(has_field(), "%s has no field operand",
                      show(m_opcode).c_str());
    return std::get<FieldRef>(m_operand);
  }

  const MethodRef& get_method() const {
    always_assert_log(has_method(), "%s has no method operand",
                      show(m_opcode).c_str());
    return std::get<MethodRef>(m_operand);
  }

  const std::vector<uint32_t>& get_targets() const {
    always_assert_log(has_targets(), "%s has no branch target",
                      show(m_opcode).c_str());
    return std::get<std::vector<uint32_t>>(m_operand);
  }

  Instruction& set_field(FieldRef field);
  Instruction& set_method(MethodRef method);
  Instruction& set_target(uint32_t target);
  Instruction& set_targets(std::vector<uint32_t> targets);

  /*
   * State the stack effect of an opcode that does not define one itself.
   */
  Instruction& set_stack_effect(uint16_t pops, uint16_t pushes);

  bool has_stack_effect() const { return m_pops >= 0 && m_pushes >= 0; }
  uint16_t pops() const {
    dispolint_assert(m_pops >= 0);
    return static_cast<uint16_t>(m_pops);
  }
  uint16_t pushes() const {
    dispolint_assert(m_pushes >= 0);
    return static_cast<uint16_t>(m_pushes);
  }

  bool falls_through() const { return opcode::falls_through(m_opcode); }

  bool operator==(const Instruction& that) const;
  bool operator!=(const Instruction& that) const { return !(*this == that); }

 private:
  Opcode m_opcode;
  uint32_t m_offset;
  int16_t m_pops;
  int16_t m_pushes;
  std::variant<std::monostate, FieldRef, MethodRef, std::vector<uint32_t>>
      m_operand;
};
