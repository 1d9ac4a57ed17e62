/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

#include "Opcode.h"

class Instruction;

/*
 * A set of opcodes in a single machine word. Code keeps the union of the
 * opcodes of its instructions, so that an analysis can decide in constant
 * time whether a method contains anything it could act on before walking
 * the body.
 */
class OpcodeBitmask final {
  static_assert(N_OPCODES <= 64, "OpcodeBitmask holds at most 64 opcodes");

 public:
  OpcodeBitmask() = default;
  OpcodeBitmask(std::initializer_list<Opcode> ops) {
    for (auto op : ops) {
      set(op);
    }
  }

  void set(Opcode op) { m_mask |= bit(op); }
  void clear(Opcode op) { m_mask &= ~bit(op); }
  bool get(Opcode op) const { return (m_mask & bit(op)) != 0; }

  bool empty() const { return m_mask == 0; }

  // Whether the two sets have an opcode in common.
  bool intersects(const OpcodeBitmask& that) const {
    return (m_mask & that.m_mask) != 0;
  }

  // Whether every opcode in `that` is also in this set.
  bool includes(const OpcodeBitmask& that) const {
    return (m_mask & that.m_mask) == that.m_mask;
  }

  OpcodeBitmask& operator|=(const OpcodeBitmask& that) {
    m_mask |= that.m_mask;
    return *this;
  }

  bool operator==(const OpcodeBitmask& that) const {
    return m_mask == that.m_mask;
  }
  bool operator!=(const OpcodeBitmask& that) const { return !(*this == that); }

  uint64_t raw() const { return m_mask; }

 private:
  static uint64_t bit(Opcode op) { return uint64_t(1) << op; }

  uint64_t m_mask{0};
};

namespace opcode_bitmask {

/*
 * Union of the opcodes of `insns`.
 */
OpcodeBitmask summarize(const std::vector<Instruction>& insns);

/*
 * The opcodes through which a method can touch instance state: calls and
 * instance field accesses.
 */
const OpcodeBitmask& calls_and_fields();

} // namespace opcode_bitmask

std::string show(const OpcodeBitmask& mask);
