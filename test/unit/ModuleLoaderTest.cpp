/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include "Code.h"
#include "DispolintException.h"
#include "DispolintTestUtils.h"
#include "ModuleLoader.h"
#include "Show.h"

using namespace dispolint_test;

namespace {

const char* STREAM_MODULE = R"({
  "types": [
    {"name": "System.IO.Stream", "interfaces": ["System.IDisposable"]},
    {
      "name": "NS.Pipe",
      "base": "System.IO.Stream",
      "methods": [
        {
          "name": "Write",
          "params": ["System.String"],
          "flags": ["public"],
          "code": [
            {"op": "load-self"},
            {"op": "invoke-direct",
             "method": {"type": "NS.Pipe", "name": "EnsureOpen"}},
            {"op": "load-self"},
            {"op": "load-field",
             "field": {"type": "NS.Pipe", "name": "count",
                       "field_type": "System.Int32"}},
            {"op": "other", "pops": 1, "pushes": 0},
            {"op": "return", "pops": 0}
          ]
        },
        {"name": "EnsureOpen"},
        {"name": "Create", "return": "NS.Pipe", "flags": ["public", "static"]}
      ]
    }
  ]
})";

std::string module_with_code(const std::string& code) {
  return R"({"types": [{"name": "NS.Pipe", "methods": [{"name": "Run", "code": )" +
         code + "}]}]}";
}

} // namespace

TEST(ModuleLoaderTest, loadsTypesAndMethods) {
  auto module = module_loader::load_module_from_string(STREAM_MODULE);
  ASSERT_EQ(2u, module->get_types().size());
  EXPECT_TRUE(module->implements_interface("NS.Pipe", DISPOSABLE));

  const auto* pipe = module->get_type("NS.Pipe");
  ASSERT_NE(nullptr, pipe);
  EXPECT_EQ("System.IO.Stream", pipe->get_base());
  ASSERT_EQ(3u, pipe->get_methods().size());

  const auto& write = *pipe->get_methods()[0];
  EXPECT_EQ("System.Void NS.Pipe::Write(System.String)", show(write));
  EXPECT_TRUE(is_public(&write));
  EXPECT_TRUE(write.get_ref().has_this);
  ASSERT_TRUE(write.has_code());

  const auto& code = *write.get_code();
  ASSERT_EQ(6u, code.size());
  for (size_t i = 0; i < code.size(); ++i) {
    EXPECT_EQ(i, code.at(i).offset());
  }
  EXPECT_EQ(OPCODE_INVOKE_DIRECT, code.at(1).opcode());
  EXPECT_EQ("EnsureOpen", code.at(1).get_method().name);
  EXPECT_EQ(1, code.at(1).pops());
  EXPECT_EQ("count", code.at(3).get_field().name);
  EXPECT_TRUE(code.is_well_formed());

  const auto& ensure_open = *pipe->get_methods()[1];
  EXPECT_FALSE(is_public(&ensure_open));
  EXPECT_FALSE(ensure_open.has_code());
  EXPECT_EQ(&ensure_open,
            module->resolve(instance_method("NS.Pipe", "EnsureOpen")));

  const auto& create = *pipe->get_methods()[2];
  EXPECT_TRUE(is_static(&create));
  EXPECT_FALSE(create.get_ref().has_this);
  EXPECT_EQ("NS.Pipe", create.get_rtype());
}

TEST(ModuleLoaderTest, explicitOffsetsAndTargets) {
  auto module = module_loader::load_module_from_string(module_with_code(R"([
    {"offset": 0, "op": "other", "pops": 0, "pushes": 1},
    {"offset": 1, "op": "switch", "targets": [7, 8]},
    {"offset": 6, "op": "if", "target": 8, "pops": 0},
    {"offset": 7, "op": "goto", "target": 8},
    {"op": "return", "pops": 0}
  ])"));
  const auto& code =
      *module->get_type("NS.Pipe")->get_methods()[0]->get_code();
  ASSERT_EQ(5u, code.size());
  EXPECT_EQ(8u, code.at(4).offset());
  EXPECT_EQ((std::vector<uint32_t>{7, 8}), code.at(1).get_targets());
  EXPECT_TRUE(code.is_well_formed());
  EXPECT_TRUE(code.is_branch_target(3));
  EXPECT_TRUE(code.is_branch_target(4));
}

TEST(ModuleLoaderTest, keepsMalformedBodies) {
  // Ill-formed bodies only disqualify their own method.
  auto module = module_loader::load_module_from_string(module_with_code(R"([
    {"offset": 4, "op": "load-self"},
    {"offset": 2, "op": "return", "pops": 1}
  ])"));
  const auto& code =
      *module->get_type("NS.Pipe")->get_methods()[0]->get_code();
  EXPECT_FALSE(code.is_well_formed());
}

TEST(ModuleLoaderTest, rejectsBadModules) {
  auto expect_invalid = [](const std::string& text) {
    EXPECT_THROW(module_loader::load_module_from_string(text),
                 dispolint::InvalidModuleException)
        << text;
  };
  expect_invalid("{");
  expect_invalid("[]");
  expect_invalid(R"({"types": {}})");
  expect_invalid(R"({"types": [{"methods": []}]})");
  expect_invalid(R"({"types": [{"name": "A"}, {"name": "A"}]})");
  expect_invalid(
      R"({"types": [{"name": "A", "methods": [{"name": "M", "flags": ["sealed"]}]}]})");
  expect_invalid(module_with_code(R"([{"op": "callvirt"}])"));
  expect_invalid(module_with_code(R"([{"op": "load-field"}])"));
  expect_invalid(module_with_code(R"([{"op": "invoke-direct", "method": {"name": "M"}}])"));
  expect_invalid(module_with_code(R"([{"op": "goto"}])"));
  expect_invalid(module_with_code(R"([{"op": "goto", "targets": [1, 2]}])"));
  expect_invalid(module_with_code(
      R"([{"op": "invoke-direct", "method": {"type": "A", "name": "M"}, "pops": 1}])"));
  expect_invalid(module_with_code(R"([{"op": "dup", "pops": 2}])"));
  expect_invalid(module_with_code(R"([{"op": "other", "pops": 1}])"));
  expect_invalid(module_with_code(R"([{"op": "load-self", "offset": -1}])"));
}

TEST(ModuleLoaderTest, missingFile) {
  EXPECT_THROW(module_loader::load_module("/nonexistent/module.json"),
               dispolint::InvalidModuleException);
}

TEST(ModuleLoaderTest, sampleFile) {
  auto module = module_loader::load_module(sample_path("unguarded.json"));
  EXPECT_NE(nullptr, module->get_type("Samples.LogWriter"));
}
