/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "Show.h"

#include <iomanip>
#include <sstream>

#include "Code.h"
#include "Instruction.h"
#include "MemberRefs.h"
#include "Method.h"

std::string show_params(const MethodRef& ref) {
  std::ostringstream ss;
  ss << "(";
  for (size_t i = 0; i < ref.params.size(); ++i) {
    if (i != 0) {
      ss << ",";
    }
    ss << ref.params[i];
  }
  ss << ")";
  return ss.str();
}

std::string show(const MethodRef& ref) {
  return ref.rtype + " " + ref.cls + "::" + ref.name + show_params(ref);
}

std::string show(const MethodRef* ref) {
  if (ref == nullptr) {
    return "";
  }
  return show(*ref);
}

std::string show(const FieldRef& ref) {
  return ref.type + " " + ref.cls + "::" + ref.name;
}

std::string show(const Method& method) { return show(method.get_ref()); }

std::string show(const Method* method) {
  if (method == nullptr) {
    return "";
  }
  return show(*method);
}

std::string show(const Instruction& insn) {
  std::ostringstream ss;
  ss << "IL_" << std::hex << std::setw(4) << std::setfill('0') << insn.offset()
     << std::dec << ": " << show(insn.opcode());
  if (insn.has_field()) {
    ss << " " << show(insn.get_field());
  } else if (insn.has_method()) {
    ss << " " << show(insn.get_method());
  } else if (insn.has_targets()) {
    for (auto target : insn.get_targets()) {
      ss << " IL_" << std::hex << std::setw(4) << std::setfill('0') << target
         << std::dec;
    }
  }
  return ss.str();
}

std::string show(const Instruction* insn) {
  if (insn == nullptr) {
    return "";
  }
  return show(*insn);
}

std::string show(const Code& code) {
  std::ostringstream ss;
  for (const auto& insn : code.instructions()) {
    ss << show(insn) << "\n";
  }
  return ss.str();
}

std::string show(const Code* code) {
  if (code == nullptr) {
    return "";
  }
  return show(*code);
}
