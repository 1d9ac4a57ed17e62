/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "OpcodeBitmask.h"

#include <sstream>

#include "Instruction.h"

namespace opcode_bitmask {

OpcodeBitmask summarize(const std::vector<Instruction>& insns) {
  OpcodeBitmask mask;
  for (const auto& insn : insns) {
    mask.set(insn.opcode());
  }
  return mask;
}

const OpcodeBitmask& calls_and_fields() {
  static const OpcodeBitmask mask{
      OPCODE_INVOKE_DIRECT, OPCODE_INVOKE_VIRTUAL, OPCODE_LOAD_FIELD,
      OPCODE_LOAD_FIELD_ADDRESS, OPCODE_STORE_FIELD};
  return mask;
}

} // namespace opcode_bitmask

std::string show(const OpcodeBitmask& mask) {
  std::ostringstream ss;
  ss << "{";
  bool first = true;
  for (size_t i = 0; i < N_OPCODES; ++i) {
    auto op = static_cast<Opcode>(i);
    if (!mask.get(op)) {
      continue;
    }
    if (!first) {
      ss << ", ";
    }
    first = false;
    ss << show(op);
  }
  ss << "}";
  return ss.str();
}
