/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "ModuleLoader.h"

#include <fstream>
#include <json/json.h>
#include <sstream>

#include "Debug.h"
#include "Show.h"
#include "Timer.h"
#include "Trace.h"

namespace {

#define check_module(cond, msg, ...)                                \
  always_assert_type_log(cond, DispolintError::INVALID_MODULE, msg, \
                         ##__VA_ARGS__)

const Json::Value& get_member(const Json::Value& obj,
                              const char* key,
                              const char* where) {
  check_module(obj.isObject(), "%s must be a JSON object", where);
  const auto& value = obj[key];
  check_module(!value.isNull(), "%s has no \"%s\"", where, key);
  return value;
}

std::string get_string(const Json::Value& obj,
                       const char* key,
                       const char* where) {
  const auto& value = get_member(obj, key, where);
  check_module(value.isString(), "\"%s\" of %s must be a string", key, where);
  return value.asString();
}

std::string get_string(const Json::Value& obj,
                       const char* key,
                       const char* where,
                       const std::string& dflt) {
  if (!obj.isMember(key)) {
    return dflt;
  }
  return get_string(obj, key, where);
}

std::vector<std::string> get_strings(const Json::Value& obj,
                                     const char* key,
                                     const char* where) {
  std::vector<std::string> result;
  if (!obj.isMember(key)) {
    return result;
  }
  const auto& value = obj[key];
  check_module(value.isArray(), "\"%s\" of %s must be an array", key, where);
  for (const auto& str : value) {
    check_module(str.isString(), "\"%s\" of %s must hold strings", key, where);
    result.push_back(str.asString());
  }
  return result;
}

uint32_t get_offset(const Json::Value& value, const char* where) {
  check_module(value.isUInt(), "%s must be an offset", where);
  return value.asUInt();
}

boost::optional<uint16_t> get_count(const Json::Value& insn,
                                    const char* key,
                                    const std::string& where) {
  if (!insn.isMember(key)) {
    return boost::none;
  }
  const auto& value = insn[key];
  check_module(value.isUInt() && value.asUInt() <= 0x7fff,
               "\"%s\" of %s must be a small non-negative integer", key,
               where.c_str());
  return static_cast<uint16_t>(value.asUInt());
}

AccessFlags parse_flags(const Json::Value& method, const std::string& where) {
  AccessFlags access = ACC_NONE;
  for (const auto& flag : get_strings(method, "flags", where.c_str())) {
    if (flag == "public") {
      access |= ACC_PUBLIC;
    } else if (flag == "static") {
      access |= ACC_STATIC;
    } else if (flag == "constructor") {
      access |= ACC_CONSTRUCTOR;
    } else if (flag == "finalizer") {
      access |= ACC_FINALIZER;
    } else if (flag == "getter") {
      access |= ACC_GETTER;
    } else if (flag == "event") {
      access |= ACC_EVENT_ACCESSOR;
    } else if (flag == "generated") {
      access |= ACC_GENERATED;
    } else {
      check_module(false, "Unknown flag \"%s\" on %s", flag.c_str(),
                   where.c_str());
    }
  }
  return access;
}

FieldRef parse_field_ref(const Json::Value& value, const std::string& where) {
  const char* w = where.c_str();
  return FieldRef(get_string(value, "type", w), get_string(value, "name", w),
                  get_string(value, "field_type", w, ""));
}

MethodRef parse_method_ref(const Json::Value& value, const std::string& where) {
  const char* w = where.c_str();
  bool has_this = true;
  if (value.isMember("has_this")) {
    check_module(value["has_this"].isBool(), "\"has_this\" of %s must be a bool",
                 w);
    has_this = value["has_this"].asBool();
  }
  return MethodRef(get_string(value, "type", w), get_string(value, "name", w),
                   get_strings(value, "params", w),
                   get_string(value, "return", w, VOID_TYPE), has_this);
}

void parse_stack_effect(const Json::Value& value,
                        const std::string& where,
                        Instruction& insn) {
  auto op = insn.opcode();
  auto pops = get_count(value, "pops", where);
  auto pushes = get_count(value, "pushes", where);
  if (!pops && !pushes) {
    return;
  }
  check_module(!insn.has_method(),
               "The stack effect of %s follows from its method operand",
               where.c_str());
  auto fixed_pops = opcode::pops(op);
  auto fixed_pushes = opcode::pushes(op);
  if (pops) {
    check_module(fixed_pops == opcode::VAR || fixed_pops == *pops,
                 "%s always pops %d", SHOW(op), fixed_pops);
  } else {
    check_module(fixed_pops != opcode::VAR, "%s needs \"pops\"", where.c_str());
    pops = static_cast<uint16_t>(fixed_pops);
  }
  if (pushes) {
    check_module(fixed_pushes == opcode::VAR || fixed_pushes == *pushes,
                 "%s always pushes %d", SHOW(op), fixed_pushes);
  } else {
    check_module(fixed_pushes != opcode::VAR, "%s needs \"pushes\"",
                 where.c_str());
    pushes = static_cast<uint16_t>(fixed_pushes);
  }
  insn.set_stack_effect(*pops, *pushes);
}

Instruction parse_instruction(const Json::Value& value,
                              uint32_t offset,
                              const std::string& where) {
  auto name = get_string(value, "op", where.c_str());
  auto op = opcode::from_name(name);
  check_module(op != boost::none, "Unknown opcode \"%s\" in %s", name.c_str(),
               where.c_str());
  Instruction insn(*op, offset);
  switch (opcode::ref(*op)) {
  case opcode::Ref::None:
    break;
  case opcode::Ref::Field:
    insn.set_field(parse_field_ref(get_member(value, "field", where.c_str()),
                                   where));
    break;
  case opcode::Ref::Method:
    insn.set_method(parse_method_ref(
        get_member(value, "method", where.c_str()), where));
    break;
  case opcode::Ref::Target:
    if (value.isMember("targets")) {
      check_module(opcode::is_switch(*op), "Only a switch has \"targets\": %s",
                   where.c_str());
      const auto& targets = value["targets"];
      check_module(targets.isArray() && !targets.empty(),
                   "\"targets\" of %s must be a non-empty array",
                   where.c_str());
      std::vector<uint32_t> offsets;
      for (const auto& target : targets) {
        offsets.push_back(get_offset(target, where.c_str()));
      }
      insn.set_targets(std::move(offsets));
    } else {
      insn.set_target(
          get_offset(get_member(value, "target", where.c_str()), where.c_str()));
    }
    break;
  }
  parse_stack_effect(value, where, insn);
  return insn;
}

std::unique_ptr<Code> parse_code(const Json::Value& code,
                                 const std::string& where) {
  check_module(code.isArray(), "\"code\" of %s must be an array",
               where.c_str());
  std::vector<Instruction> insns;
  insns.reserve(code.size());
  uint32_t next_offset = 0;
  for (Json::ArrayIndex i = 0; i < code.size(); ++i) {
    const auto& value = code[i];
    auto insn_where = where + " instruction #" + std::to_string(i);
    check_module(value.isObject(), "%s must be a JSON object",
                 insn_where.c_str());
    uint32_t offset = next_offset;
    if (value.isMember("offset")) {
      offset = get_offset(value["offset"], insn_where.c_str());
    }
    insns.push_back(parse_instruction(value, offset, insn_where));
    next_offset = offset + 1;
  }
  return std::make_unique<Code>(std::move(insns));
}

void parse_method(const Json::Value& value, TypeDef& type) {
  auto where = "method of " + type.get_name();
  auto name = get_string(value, "name", where.c_str());
  where = type.get_name() + "::" + name;
  MethodRef ref(type.get_name(), name, get_strings(value, "params",
                                                   where.c_str()),
                get_string(value, "return", where.c_str(), VOID_TYPE));
  auto access = parse_flags(value, where);
  std::unique_ptr<Code> code;
  if (value.isMember("code")) {
    code = parse_code(value["code"], where);
  }
  auto* method = type.add_method(
      std::make_unique<Method>(std::move(ref), access, std::move(code)));
  TRACE(LOADER, 4, "Loaded %s (%zu instructions)", SHOW(method),
        method->has_code() ? method->get_code()->size() : (size_t)0);
}

void parse_type(const Json::Value& value, Module& module) {
  auto name = get_string(value, "name", "type");
  const char* where = name.c_str();
  bool generated = false;
  if (value.isMember("generated")) {
    check_module(value["generated"].isBool(),
                 "\"generated\" of %s must be a bool", where);
    generated = value["generated"].asBool();
  }
  auto* type = module.add_type(std::make_unique<TypeDef>(
      name, get_string(value, "base", where, ""),
      get_strings(value, "interfaces", where), generated));
  if (value.isMember("methods")) {
    const auto& methods = value["methods"];
    check_module(methods.isArray(), "\"methods\" of %s must be an array",
                 where);
    for (const auto& method : methods) {
      parse_method(method, *type);
    }
  }
  TRACE(LOADER, 3, "Loaded type %s with %zu methods", where,
        type->get_methods().size());
}

} // namespace

namespace module_loader {

std::unique_ptr<Module> load_module(const std::string& path) {
  Timer t("Loading module " + path);
  std::ifstream input(path);
  check_module(input.good(), "Cannot open module file %s", path.c_str());
  std::stringstream buffer;
  buffer << input.rdbuf();
  return load_module_from_string(buffer.str());
}

std::unique_ptr<Module> load_module_from_string(const std::string& text) {
  Json::Reader reader;
  Json::Value root;
  bool parsing_succeeded = reader.parse(text, root);
  check_module(parsing_succeeded, "Failed to parse module json\n%s",
               reader.getFormattedErrorMessages().c_str());
  return load_module_from_json(root);
}

std::unique_ptr<Module> load_module_from_json(const Json::Value& root) {
  const auto& types = get_member(root, "types", "module");
  check_module(types.isArray(), "\"types\" must be an array");
  auto module = std::make_unique<Module>();
  for (const auto& type : types) {
    parse_type(type, *module);
  }
  TRACE(LOADER, 1, "Loaded %zu types", module->get_types().size());
  return module;
}

} // namespace module_loader
