/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>

/*
 * Stringification functions for core types.
 */
struct FieldRef;
struct MethodRef;
class Instruction;
class Code;
class Method;

// "System.Boolean NS.Foo::Equals(System.Object)"
std::string show(const MethodRef& ref);
std::string show(const MethodRef* ref);

// "System.Int32 NS.Foo::count"
std::string show(const FieldRef& ref);

std::string show(const Method& method);
std::string show(const Method* method);

// "IL_0004: invoke-virtual System.Void NS.Foo::Flush()"
std::string show(const Instruction& insn);
std::string show(const Instruction* insn);

std::string show(const Code& code);
std::string show(const Code* code);

// "(System.String,System.Int32)"
std::string show_params(const MethodRef& ref);

#define SHOW(...) show(__VA_ARGS__).c_str()
