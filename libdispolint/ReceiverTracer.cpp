/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "ReceiverTracer.h"

#include "Code.h"
#include "Instruction.h"
#include "Show.h"
#include "Trace.h"

namespace receiver {

boost::optional<size_t> receiver_depth(const Instruction& insn) {
  auto op = insn.opcode();
  if (opcode::is_an_invoke(op)) {
    const auto& callee = insn.get_method();
    if (!callee.has_this) {
      return boost::none;
    }
    return callee.arg_count();
  }
  switch (op) {
  case OPCODE_LOAD_FIELD:
  case OPCODE_LOAD_FIELD_ADDRESS:
    return 1;
  case OPCODE_STORE_FIELD:
    // The object is below the value being stored.
    return 2;
  default:
    return boost::none;
  }
}

boost::optional<size_t> trace_back(const Code& code, size_t idx) {
  const auto& insns = code.instructions();
  auto depth = receiver_depth(insns.at(idx));
  if (!depth) {
    return boost::none;
  }
  // `need` is the depth of the value we are looking for on the stack as it
  // is when insns[i] starts executing.
  size_t need = *depth;
  size_t i = idx;
  while (true) {
    if (code.is_branch_target(i)) {
      TRACE(TRACER, 5, "%s: merge point at %s", SHOW(insns[idx]),
            SHOW(insns[i]));
      return boost::none;
    }
    if (i == 0) {
      TRACE(TRACER, 5, "%s: reached method entry", SHOW(insns[idx]));
      return boost::none;
    }
    const auto& prev = insns[--i];
    if (!prev.falls_through() || !prev.has_stack_effect()) {
      TRACE(TRACER, 5, "%s: cannot step over %s", SHOW(insns[idx]),
            SHOW(prev));
      return boost::none;
    }
    if (need <= prev.pushes()) {
      if (opcode::is_dup(prev.opcode())) {
        // Both copies are the value below the dup.
        need = 1;
        continue;
      }
      if (prev.pushes() != 1) {
        TRACE(TRACER, 5, "%s: ambiguous producer %s", SHOW(insns[idx]),
              SHOW(prev));
        return boost::none;
      }
      return i;
    }
    need = need - prev.pushes() + prev.pops();
  }
}

bool is_self(const Code& code, size_t idx) {
  auto producer = trace_back(code, idx);
  return producer && opcode::is_load_self(code.at(*producer).opcode());
}

} // namespace receiver
