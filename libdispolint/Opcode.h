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

/*
 * The decoded instruction set. It is deliberately coarse: the analyses only
 * need to tell calls, field accesses, object construction and the load of
 * the implicit `self` argument apart from everything else, plus enough
 * control-flow and stack information to trace an operand back to the
 * instruction that produced it. Every other bytecode instruction is decoded
 * as OPCODE_OTHER with an explicit stack effect.
 */
enum Opcode : uint8_t {
#define OP(uc, ...) OPCODE_##uc,
#include "Opcodes.def"
};

constexpr size_t N_OPCODES = 0
#define OP(...) +1
#include "Opcodes.def"
    ;

std::string show(Opcode);

namespace opcode {

enum class Ref {
  None,
  Field,
  Method,
  Target,
};

enum Branchingness : uint8_t {
  BRANCH_NONE,
  BRANCH_IF,
  BRANCH_SWITCH,
  BRANCH_GOTO,
  BRANCH_RETURN,
  BRANCH_THROW,
};

// Stack effect that is not a property of the opcode alone.
constexpr int16_t VAR = -1;

Ref ref(Opcode);

Branchingness branchingness(Opcode);

int16_t pops(Opcode);

int16_t pushes(Opcode);

/*
 * Whether execution can continue with the next instruction in offset order.
 * Conditional branches and switches fall through; goto, return and throw do
 * not.
 */
bool falls_through(Opcode);

/*
 * Parse the textual name used by show(Opcode), e.g. "invoke-virtual".
 */
boost::optional<Opcode> from_name(const std::string& name);

/**
 * Creates predicates from definitions in Opcodes.def, e.g. with the
 * following signatures:
 *
 *   inline bool is_load_self(Opcode op);  // OP(LOAD_SELF, load_self, ...)
 *   inline bool is_an_invoke(Opcode op);  // OPRANGE(an_invoke, ...)
 */
#define OPRANGE(NAME, FST, LST) \
  inline bool is_##NAME(Opcode op) { return (FST) <= op && op <= (LST); }
#define OP(UC, LC, ...) \
  inline bool is_##LC(Opcode op) { return op == OPCODE_##UC; }
#include "Opcodes.def"

} // namespace opcode
