/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include "JavaClass.h"

/*
 * Serializes a JavaClass. Unmodified methods are written back with their
 * original max_stack, max_locals and StackMapTable. Modified methods get
 * both maxima recomputed and lose their StackMapTable; if such a method
 * still needs frames (class version 50+ with branches or handlers) the
 * write fails with UNSUPPORTED_CODE.
 *
 * The class is updated in place: constants and bootstrap methods needed by
 * new code are appended to its pool.
 */
std::vector<uint8_t> write_class(JavaClass& cls);

/*
 * Operand stack words popped and pushed by `insn`, resolving member and
 * constant references against `pool`.
 */
std::pair<int, int> stack_effect(const ConstantPool& pool,
                                 const JvmInstruction& insn);

uint16_t compute_max_stack(const JavaMethod& method);
uint16_t compute_max_locals(const JavaMethod& method);

// Interns the call site's bootstrap method and returns its
// CONSTANT_InvokeDynamic index.
uint16_t intern_call_site(JavaClass& cls, const DynamicCallSite& call_site);
