/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <boost/optional.hpp>
#include <cstddef>

class Code;
class Instruction;

/*
 * Finds out which instruction produced the receiver of a call or an instance
 * field access by walking backwards from the consumer and replaying the
 * stack effects in reverse.
 *
 * This is a purely local, straight-line trace. It gives up (returns none)
 * instead of guessing as soon as the answer could depend on control flow:
 *
 *  - the walk would step back across the entry of a branch target, where
 *    values may arrive from more than one predecessor;
 *  - the preceding instruction does not fall through (goto, return, throw),
 *    so it is not a predecessor at all;
 *  - an instruction on the way has no known stack effect;
 *  - the producer pushes several values and is not a `dup`, whose copies
 *    are traced on to the value it duplicated;
 *  - the start of the method is reached.
 *
 * Callers therefore get false negatives on convoluted code, but never a
 * receiver that the bytecode does not demonstrably produce.
 */
namespace receiver {

/*
 * How many values sit on the stack above the receiver of `insn`, plus one;
 * i.e. the receiver's depth counted from the top when `insn` starts.
 * boost::none for instructions without a receiver (including calls to
 * static methods).
 */
boost::optional<size_t> receiver_depth(const Instruction& insn);

/*
 * Index of the instruction that pushed the receiver consumed by the
 * instruction at `idx`, or none if the trace is inconclusive.
 */
boost::optional<size_t> trace_back(const Code& code, size_t idx);

/*
 * Whether the receiver of the instruction at `idx` is demonstrably the
 * method's own `self` argument.
 */
bool is_self(const Code& code, size_t idx);

} // namespace receiver
