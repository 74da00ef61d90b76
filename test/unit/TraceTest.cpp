/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "Trace.h"

#include <gtest/gtest.h>

TEST(TraceTest, globalLevel) {
  auto levels = parse_trace_levels("2");
  EXPECT_EQ(levels.global, 2);
  EXPECT_EQ(levels.modules[ENGINE], 0);
}

TEST(TraceTest, moduleLevels) {
  auto levels = parse_trace_levels("ENGINE:3,DETECT:2");
  EXPECT_EQ(levels.global, 0);
  EXPECT_EQ(levels.modules[ENGINE], 3);
  EXPECT_EQ(levels.modules[DETECT], 2);
  EXPECT_EQ(levels.modules[SWEEP], 0);
}

TEST(TraceTest, mixedAndMalformedSettings) {
  auto levels = parse_trace_levels("1, NOPE:4,SWEEP:5,JAR:x,CODEC:");
  EXPECT_EQ(levels.global, 1);
  EXPECT_EQ(levels.modules[SWEEP], 5);
  EXPECT_EQ(levels.modules[JAR], 0);
  EXPECT_EQ(levels.modules[CODEC], 0);
}

TEST(TraceTest, moduleNames) {
  EXPECT_STREQ(trace_module_name(ENGINE), "ENGINE");
  EXPECT_STREQ(trace_module_name(XFORM), "XFORM");
}
