/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <string>

// clang-format off
enum JvmOpcode : uint8_t {
#define OP(uc, lc, code, ...) OPCODE_##uc = code,
#include "JvmOpcodes.def"
};
// clang-format on

std::string show(JvmOpcode);

namespace opcode {

/*
 * How the operand bytes following an opcode are laid out in the Code
 * attribute.
 */
enum class Format {
  NONE,
  // bipush
  S1,
  // sipush
  S2,
  // ldc: one byte constant pool index
  CP1,
  // two byte constant pool index
  CP2,
  // local variable index, widened by a `wide` prefix
  LOCAL,
  // local variable index plus signed increment, both widened by `wide`
  IINC,
  // signed 16 bit branch offset
  BRANCH2,
  // signed 32 bit branch offset
  BRANCH4,
  TABLESWITCH,
  LOOKUPSWITCH,
  // index, count, zero
  INVOKEINTERFACE,
  // index, zero, zero
  INVOKEDYNAMIC,
  // primitive array type code
  NEWARRAY,
  // index, dimensions
  MULTIANEWARRAY,
  WIDE,
};

// Marks a pop or push count that depends on the referenced constant.
constexpr int kVariableStack = -1;

bool is_valid(uint8_t code);

Format format(JvmOpcode op);

int stack_pops(JvmOpcode op);
int stack_pushes(JvmOpcode op);

bool is_branch(JvmOpcode op);
bool is_conditional_branch(JvmOpcode op);
bool is_goto(JvmOpcode op);
bool is_jsr(JvmOpcode op);
bool is_switch(JvmOpcode op);
bool is_return(JvmOpcode op);
bool is_invoke(JvmOpcode op);
bool is_field_op(JvmOpcode op);

/*
 * True if control never falls through to the next instruction: unconditional
 * jumps, switches, returns, athrow and ret.
 */
bool is_block_end(JvmOpcode op);

} // namespace opcode
