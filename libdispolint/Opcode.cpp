/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "Opcode.h"

#include <unordered_map>

#include "Debug.h"

std::string show(Opcode op) {
  switch (op) {
#define OP(UC, LC, NAME, ...) \
  case OPCODE_##UC:           \
    return NAME;
#include "Opcodes.def"
  }
  not_reached_log("Unknown opcode 0x%x", static_cast<unsigned>(op));
}

namespace opcode {

Ref ref(Opcode op) {
  switch (op) {
#define OP(UC, LC, NAME, REF, ...) \
  case OPCODE_##UC:                \
    return Ref::REF;
#include "Opcodes.def"
  }
  not_reached_log("Unknown opcode 0x%x", static_cast<unsigned>(op));
}

Branchingness branchingness(Opcode op) {
  switch (op) {
#define OP(UC, LC, NAME, REF, POPS, PUSHES, BRANCH) \
  case OPCODE_##UC:                                 \
    return BRANCH;
#include "Opcodes.def"
  }
  not_reached_log("Unknown opcode 0x%x", static_cast<unsigned>(op));
}

int16_t pops(Opcode op) {
  switch (op) {
#define OP(UC, LC, NAME, REF, POPS, ...) \
  case OPCODE_##UC:                      \
    return POPS;
#include "Opcodes.def"
  }
  not_reached_log("Unknown opcode 0x%x", static_cast<unsigned>(op));
}

int16_t pushes(Opcode op) {
  switch (op) {
#define OP(UC, LC, NAME, REF, POPS, PUSHES, ...) \
  case OPCODE_##UC:                              \
    return PUSHES;
#include "Opcodes.def"
  }
  not_reached_log("Unknown opcode 0x%x", static_cast<unsigned>(op));
}

bool falls_through(Opcode op) {
  switch (branchingness(op)) {
  case BRANCH_GOTO:
  case BRANCH_RETURN:
  case BRANCH_THROW:
    return false;
  case BRANCH_NONE:
  case BRANCH_IF:
  case BRANCH_SWITCH:
    return true;
  }
  not_reached();
}

boost::optional<Opcode> from_name(const std::string& name) {
  static const std::unordered_map<std::string, Opcode> by_name{{
#define OP(UC, LC, NAME, ...) {NAME, OPCODE_##UC},
#include "Opcodes.def"
  }};
  auto it = by_name.find(name);
  if (it == by_name.end()) {
    return boost::none;
  }
  return it->second;
}

} // namespace opcode
