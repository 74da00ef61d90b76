/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "JvmOpcode.h"

#include <array>

#include "Debug.h"

namespace {

struct OpcodeInfo {
  const char* name;
  opcode::Format format;
  int8_t pops;
  int8_t pushes;
  bool valid;
};

constexpr int VAR = opcode::kVariableStack;

std::array<OpcodeInfo, 256> make_opcode_table() {
  std::array<OpcodeInfo, 256> table{};
  for (auto& info : table) {
    info = {"<invalid>", opcode::Format::NONE, 0, 0, false};
  }
#define OP(uc, lc, code, fmt, pop, push) \
  table[code] = {#lc, opcode::Format::fmt, pop, push, true};
#include "JvmOpcodes.def"
  return table;
}

const std::array<OpcodeInfo, 256>& opcode_table() {
  static const auto table = make_opcode_table();
  return table;
}

const OpcodeInfo& info(JvmOpcode op) {
  const auto& entry = opcode_table()[op];
  always_assert_type_log(entry.valid, AgentGuardError::INVALID_JAVA,
                         "Unknown opcode 0x%x", op);
  return entry;
}

} // namespace

std::string show(JvmOpcode op) {
  return opcode_table()[op].valid ? opcode_table()[op].name : "<invalid>";
}

namespace opcode {

bool is_valid(uint8_t code) { return opcode_table()[code].valid; }

Format format(JvmOpcode op) { return info(op).format; }

int stack_pops(JvmOpcode op) { return info(op).pops; }

int stack_pushes(JvmOpcode op) { return info(op).pushes; }

bool is_branch(JvmOpcode op) {
  auto fmt = format(op);
  return fmt == Format::BRANCH2 || fmt == Format::BRANCH4;
}

bool is_conditional_branch(JvmOpcode op) {
  return is_branch(op) && !is_goto(op) && !is_jsr(op);
}

bool is_goto(JvmOpcode op) {
  return op == OPCODE_GOTO || op == OPCODE_GOTO_W;
}

bool is_jsr(JvmOpcode op) { return op == OPCODE_JSR || op == OPCODE_JSR_W; }

bool is_switch(JvmOpcode op) {
  return op == OPCODE_TABLESWITCH || op == OPCODE_LOOKUPSWITCH;
}

bool is_return(JvmOpcode op) {
  return op >= OPCODE_IRETURN && op <= OPCODE_RETURN;
}

bool is_invoke(JvmOpcode op) {
  return op >= OPCODE_INVOKEVIRTUAL && op <= OPCODE_INVOKEDYNAMIC;
}

bool is_field_op(JvmOpcode op) {
  return op >= OPCODE_GETSTATIC && op <= OPCODE_PUTFIELD;
}

bool is_block_end(JvmOpcode op) {
  return is_goto(op) || is_switch(op) || is_return(op) ||
         op == OPCODE_ATHROW || op == OPCODE_RET;
}

} // namespace opcode
