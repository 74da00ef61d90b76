/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "Transformer.h"

#include "Debug.h"
#include "Show.h"
#include "Trace.h"
#include "TypeUtil.h"

namespace {

class CleanerTransformer : public Transformer {
 public:
  CleanerTransformer() : Transformer("CLEANER") {}

  bool transform(JavaMethod* method, InsnList&, InsnNode*) const override {
    empty_method(method);
    return true;
  }
};

} // namespace

bool Transformer::process(JavaMethod* method) const {
  always_assert(method != nullptr);
  auto& code = method->get_code();
  for (auto* insn : code.to_vector()) {
    if (transform(method, code, insn)) {
      TRACE(XFORM, 5, "%s stopped on %s", m_name.c_str(), SHOW(method));
      return true;
    }
  }
  return false;
}

std::vector<std::unique_ptr<JvmInstruction>> Transformer::generate_return(
    const std::string& method_desc) {
  std::vector<std::unique_ptr<JvmInstruction>> insns;
  auto push = [&](JvmOpcode op) {
    insns.push_back(std::make_unique<JvmInstruction>(op));
  };
  switch (descriptor::return_data_type(method_desc)) {
  case DataType::Void:
    push(OPCODE_RETURN);
    break;
  case DataType::Boolean:
  case DataType::Char:
  case DataType::Byte:
  case DataType::Short:
  case DataType::Int:
    push(OPCODE_ICONST_0);
    push(OPCODE_IRETURN);
    break;
  case DataType::Float:
    push(OPCODE_FCONST_0);
    push(OPCODE_FRETURN);
    break;
  case DataType::Long:
    push(OPCODE_LCONST_0);
    push(OPCODE_LRETURN);
    break;
  case DataType::Double:
    push(OPCODE_DCONST_0);
    push(OPCODE_DRETURN);
    break;
  case DataType::Array:
  case DataType::Object:
    push(OPCODE_ACONST_NULL);
    push(OPCODE_ARETURN);
    break;
  case DataType::Method:
    throw_typed(AgentGuardError::INVALID_DESCRIPTOR,
                "Unexpected return type in " + method_desc);
  }
  return insns;
}

void Transformer::empty_method(JavaMethod* method) {
  always_assert(method != nullptr);
  auto insns = generate_return(method->get_desc());
  auto& code = method->get_code();
  code.clear();
  for (auto& insn : insns) {
    code.push_back(std::move(insn));
  }
  method->get_try_catch_blocks().clear();
  method->get_local_variables().clear();
  method->get_local_variable_types().clear();
  method->get_line_numbers().clear();
  method->get_exceptions().clear();
  method->set_modified();
  TRACE(XFORM, 3, "Emptied %s", SHOW(method));
}

std::shared_ptr<const Transformer> Transformer::cleaner() {
  static const std::shared_ptr<const Transformer> s_cleaner =
      std::make_shared<CleanerTransformer>();
  return s_cleaner;
}
