/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <boost/optional.hpp>
#include <cstdint>
#include <string>
#include <vector>

#include "Instruction.h"
#include "OpcodeBitmask.h"

/*
 * The body of a method: its instructions in offset order.
 *
 * Code is built once from the decoder's output and never changes afterwards,
 * so it can be read from any number of threads. Construction does not reject
 * ill-formed input; it records the first problem it sees, and
 * check_well_formed() raises it as a MalformedCodeException. The queries
 * about control flow (index_of, is_branch_target) are only meaningful on
 * well-formed code.
 */
class Code final {
 public:
  explicit Code(std::vector<Instruction> insns);

  const std::vector<Instruction>& instructions() const { return m_insns; }
  size_t size() const { return m_insns.size(); }
  bool empty() const { return m_insns.empty(); }
  const Instruction& at(size_t idx) const { return m_insns.at(idx); }

  // The opcodes that occur anywhere in the body.
  const OpcodeBitmask& opcodes() const { return m_opcodes; }

  /*
   * Offsets are strictly increasing and every branch target is the offset
   * of an instruction of this body.
   */
  bool is_well_formed() const { return m_malformed_reason.empty(); }
  void check_well_formed() const;

  // Index of the instruction starting at `offset`, if any.
  boost::optional<size_t> index_of(uint32_t offset) const;

  // Whether some branch jumps to the instruction at `idx`.
  bool is_branch_target(size_t idx) const { return m_branch_targets.at(idx); }

 private:
  std::vector<Instruction> m_insns;
  OpcodeBitmask m_opcodes;
  std::vector<bool> m_branch_targets;
  std::string m_malformed_reason;
};
