/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include "Creators.h"
#include "Method.h"
#include "Timer.h"
#include "Trace.h"

TEST(TraceContextTest, nesting) {
  EXPECT_EQ(nullptr, TraceContext::current());
  {
    TraceContext outer(std::string("outer"));
    EXPECT_EQ("outer", TraceContext::current()->name());
    {
      TraceContext inner(std::string("inner"));
      EXPECT_EQ("inner", TraceContext::current()->name());
    }
    EXPECT_EQ("outer", TraceContext::current()->name());
  }
  EXPECT_EQ(nullptr, TraceContext::current());
}

TEST(TraceContextTest, namedByMethod) {
  auto method = MethodCreator("NS.Foo", "Run", {"System.Int32"})
                    .create_abstract();
  TraceContext context(method.get());
  EXPECT_EQ("System.Void NS.Foo::Run(System.Int32)",
            TraceContext::current()->name());
}

TEST(TimerTest, elapsed) {
  Timer outer("outer");
  double before;
  {
    Timer inner("inner");
    before = inner.elapsed_seconds();
    EXPECT_GE(before, 0.0);
  }
  EXPECT_GE(outer.elapsed_seconds(), before);
}
