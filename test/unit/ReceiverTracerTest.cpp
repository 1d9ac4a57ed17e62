/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include "Code.h"
#include "Creators.h"
#include "DispolintTestUtils.h"
#include "Method.h"
#include "ReceiverTracer.h"

using namespace dispolint_test;

namespace {

const char* FOO = "NS.Foo";

std::unique_ptr<Method> make(MethodCreator& mc) { return mc.create(); }

} // namespace

class ReceiverTracerTest : public testing::Test {};

TEST_F(ReceiverTracerTest, receiverDepth) {
  Instruction call(OPCODE_INVOKE_VIRTUAL, 0);
  call.set_method(instance_method(FOO, "Write", {"System.String"}));
  EXPECT_EQ(2u, *receiver::receiver_depth(call));

  Instruction scall(OPCODE_INVOKE_DIRECT, 1);
  scall.set_method(static_method(FOO, "Create"));
  EXPECT_FALSE(receiver::receiver_depth(scall));

  Instruction store(OPCODE_STORE_FIELD, 2);
  store.set_field(field(FOO, "count"));
  EXPECT_EQ(2u, *receiver::receiver_depth(store));

  Instruction load(OPCODE_LOAD_FIELD_ADDRESS, 3);
  load.set_field(field(FOO, "count"));
  EXPECT_EQ(1u, *receiver::receiver_depth(load));

  Instruction make_obj(OPCODE_NEW_OBJECT, 4);
  make_obj.set_method(ctor(FOO));
  EXPECT_FALSE(receiver::receiver_depth(make_obj));
}

TEST_F(ReceiverTracerTest, directReceiver) {
  MethodCreator mc(FOO, "Run");
  mc.load_self().invoke_direct(instance_method(FOO, "EnsureOpen")).ret_void();
  auto method = make(mc);
  const auto& code = *method->get_code();
  EXPECT_EQ(0u, *receiver::trace_back(code, 1));
  EXPECT_TRUE(receiver::is_self(code, 1));
}

TEST_F(ReceiverTracerTest, receiverBelowArguments) {
  // self.Write(<expr>, <expr>)
  MethodCreator mc(FOO, "Run");
  mc.load_self()
      .other(0, 1)
      .other(0, 2)
      .other(2, 1)
      .invoke_virtual(
          instance_method(FOO, "Write", {"System.String", "System.Int32"}))
      .ret_void();
  auto method = make(mc);
  EXPECT_TRUE(receiver::is_self(*method->get_code(), 4));
}

TEST_F(ReceiverTracerTest, argumentsComputedByCalls) {
  // self.Write(self.Describe())
  MethodCreator mc(FOO, "Run");
  mc.load_self()
      .load_self()
      .invoke_virtual(instance_method(FOO, "Describe", {}, "System.String"))
      .invoke_virtual(instance_method(FOO, "Write", {"System.String"}))
      .ret_void();
  auto method = make(mc);
  const auto& code = *method->get_code();
  EXPECT_EQ(1u, *receiver::trace_back(code, 2));
  EXPECT_EQ(0u, *receiver::trace_back(code, 3));
}

TEST_F(ReceiverTracerTest, storeField) {
  // self.count = <expr>
  MethodCreator mc(FOO, "Reset");
  mc.load_self().other(0, 1).store_field(field(FOO, "count")).ret_void();
  auto method = make(mc);
  EXPECT_TRUE(receiver::is_self(*method->get_code(), 2));
}

TEST_F(ReceiverTracerTest, throughDup) {
  MethodCreator mc(FOO, "Run");
  mc.load_self()
      .dup()
      .load_field(field(FOO, "count"))
      .store_field(field(FOO, "previous"))
      .ret_void();
  auto method = make(mc);
  const auto& code = *method->get_code();
  // Both copies made by the dup are `self`.
  EXPECT_EQ(0u, *receiver::trace_back(code, 2));
  EXPECT_EQ(0u, *receiver::trace_back(code, 3));
  EXPECT_TRUE(receiver::is_self(code, 2));
  EXPECT_TRUE(receiver::is_self(code, 3));
}

TEST_F(ReceiverTracerTest, otherReceiver) {
  // this.writer.Flush(): the receiver of Flush is a field value.
  MethodCreator mc(FOO, "Flush");
  mc.load_self()
      .load_field(field(FOO, "writer", "System.IO.TextWriter"))
      .invoke_virtual(instance_method("System.IO.TextWriter", "Flush"))
      .ret_void();
  auto method = make(mc);
  const auto& code = *method->get_code();
  EXPECT_EQ(1u, *receiver::trace_back(code, 2));
  EXPECT_FALSE(receiver::is_self(code, 2));
  EXPECT_TRUE(receiver::is_self(code, 1));
}

TEST_F(ReceiverTracerTest, stopsAtMergePoint) {
  MethodCreator mc(FOO, "Run");
  mc.other(0, 1)
      .if_test("join")
      .other(0, 0)
      .mark_label("join")
      .load_self()
      .invoke_direct(instance_method(FOO, "EnsureOpen"))
      .ret_void();
  auto method = make(mc);
  const auto& code = *method->get_code();
  // The receiver is pushed at the merge point itself, so nothing is crossed.
  EXPECT_TRUE(receiver::is_self(code, 4));

  MethodCreator mc2(FOO, "Run2");
  mc2.load_self()
      .other(0, 1)
      .if_test("join")
      .other(0, 0)
      .mark_label("join")
      .invoke_direct(instance_method(FOO, "EnsureOpen"))
      .ret_void();
  auto method2 = make(mc2);
  // The receiver would have to be traced back across the merge point.
  EXPECT_FALSE(receiver::trace_back(*method2->get_code(), 4));
}

TEST_F(ReceiverTracerTest, stopsAfterUnconditionalTransfer) {
  MethodCreator mc(FOO, "Run");
  mc.load_self()
      .goto_("end")
      .invoke_direct(instance_method(FOO, "EnsureOpen"))
      .mark_label("end")
      .ret_void();
  auto method = make(mc);
  EXPECT_FALSE(receiver::trace_back(*method->get_code(), 2));

  MethodCreator mc2(FOO, "Run2");
  mc2.load_self().throwex().invoke_direct(instance_method(FOO, "EnsureOpen"));
  auto method2 = make(mc2);
  EXPECT_FALSE(receiver::trace_back(*method2->get_code(), 2));
}

TEST_F(ReceiverTracerTest, stopsAtMethodEntry) {
  // The receiver is not produced inside the method at all.
  MethodCreator mc(FOO, "Run");
  mc.other(0, 0).invoke_direct(instance_method(FOO, "EnsureOpen")).ret_void();
  auto method = make(mc);
  EXPECT_FALSE(receiver::trace_back(*method->get_code(), 1));
}

TEST_F(ReceiverTracerTest, stopsAtAmbiguousProducer) {
  MethodCreator mc(FOO, "Run");
  mc.other(0, 2)
      .invoke_virtual(instance_method(FOO, "Write", {"System.String"}))
      .ret_void();
  auto method = make(mc);
  EXPECT_FALSE(receiver::trace_back(*method->get_code(), 1));
}

TEST_F(ReceiverTracerTest, stopsAtUnknownStackEffect) {
  MethodCreator mc(FOO, "Run");
  mc.load_self()
      .push_instruction(Instruction(OPCODE_OTHER, 1))
      .invoke_direct(instance_method(FOO, "EnsureOpen"))
      .ret_void();
  auto method = make(mc);
  EXPECT_FALSE(receiver::trace_back(*method->get_code(), 2));
}

TEST_F(ReceiverTracerTest, noReceiver) {
  MethodCreator mc(FOO, "Run");
  mc.load_self().invoke_direct(static_method(FOO, "Log")).ret_void();
  auto method = make(mc);
  EXPECT_FALSE(receiver::trace_back(*method->get_code(), 1));
  EXPECT_FALSE(receiver::is_self(*method->get_code(), 1));
}
