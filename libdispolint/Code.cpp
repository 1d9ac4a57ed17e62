/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "Code.h"

#include <algorithm>

#include "Show.h"

Code::Code(std::vector<Instruction> insns)
    : m_insns(std::move(insns)),
      m_opcodes(opcode_bitmask::summarize(m_insns)),
      m_branch_targets(m_insns.size(), false) {
  for (size_t i = 1; i < m_insns.size(); ++i) {
    if (m_insns[i - 1].offset() >= m_insns[i].offset()) {
      m_malformed_reason =
          format2string("offset %04x follows offset %04x", m_insns[i].offset(),
                        m_insns[i - 1].offset());
      return;
    }
  }
  for (const auto& insn : m_insns) {
    if (!insn.has_targets()) {
      continue;
    }
    for (auto target : insn.get_targets()) {
      auto idx = index_of(target);
      if (!idx) {
        m_malformed_reason =
            format2string("%s branches to %04x, which starts no instruction",
                          SHOW(insn), target);
        return;
      }
      m_branch_targets[*idx] = true;
    }
  }
}

void Code::check_well_formed() const {
  assert_or_throw(is_well_formed(), DispolintError::MALFORMED_CODE,
                  m_malformed_reason);
}

boost::optional<size_t> Code::index_of(uint32_t offset) const {
  auto it = std::lower_bound(
      m_insns.begin(), m_insns.end(), offset,
      [](const Instruction& insn, uint32_t off) { return insn.offset() < off; });
  if (it == m_insns.end() || it->offset() != offset) {
    return boost::none;
  }
  return static_cast<size_t>(std::distance(m_insns.begin(), it));
}
