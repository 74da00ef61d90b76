/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "Creators.h"

#include <algorithm>
#include <limits>

#include "Debug.h"
#include "Show.h"

ClassCreator::ClassCreator(const std::string& name,
                           const std::string& super_name)
    : m_cls(std::make_unique<JavaClass>(name, super_name)) {
  always_assert_log(!name.empty(), "A class needs a name");
}

void ClassCreator::add_interface(const std::string& iface) {
  always_assert(m_cls != nullptr);
  if (!m_cls->implements_directly(iface)) {
    m_cls->add_interface(iface);
  }
}

void ClassCreator::add_field(uint16_t access,
                             const std::string& name,
                             const std::string& desc) {
  always_assert(m_cls != nullptr);
  auto& pool = m_cls->get_pool();
  m_cls->get_fields().push_back(
      FieldInfo{access, pool.add_utf8(name), pool.add_utf8(desc), {}});
}

std::unique_ptr<JavaClass> ClassCreator::create() {
  always_assert_log(m_cls != nullptr, "Class already created");
  return std::move(m_cls);
}

MethodCreator::MethodCreator(JavaClass* cls,
                             uint16_t access,
                             const std::string& name,
                             const std::string& desc)
    : m_cls(cls),
      m_method(std::make_unique<JavaMethod>(cls, access, name, desc)) {}

InsnNode* MethodCreator::insn(JvmOpcode op) {
  always_assert_log(opcode::format(op) == opcode::Format::NONE,
                    "%s takes operands", SHOW(op));
  return get_code().push_back(op);
}

InsnNode* MethodCreator::local(JvmOpcode op, uint16_t index) {
  always_assert(opcode::format(op) == opcode::Format::LOCAL);
  auto insn = std::make_unique<JvmInstruction>(op);
  insn->set_local(index)->set_wide(index > 0xff);
  return get_code().push_back(std::move(insn));
}

InsnNode* MethodCreator::iinc(uint16_t index, int32_t increment) {
  auto insn = std::make_unique<JvmInstruction>(OPCODE_IINC);
  insn->set_local(index)->set_literal(increment)->set_wide(
      index > 0xff || increment < -128 || increment > 127);
  return get_code().push_back(std::move(insn));
}

InsnNode* MethodCreator::push_int(int32_t value) {
  if (value >= -1 && value <= 5) {
    return get_code().push_back((JvmOpcode)(OPCODE_ICONST_0 + value));
  }
  if (value >= std::numeric_limits<int8_t>::min() &&
      value <= std::numeric_limits<int8_t>::max()) {
    auto insn = std::make_unique<JvmInstruction>(OPCODE_BIPUSH);
    insn->set_literal(value);
    return get_code().push_back(std::move(insn));
  }
  if (value >= std::numeric_limits<int16_t>::min() &&
      value <= std::numeric_limits<int16_t>::max()) {
    auto insn = std::make_unique<JvmInstruction>(OPCODE_SIPUSH);
    insn->set_literal(value);
    return get_code().push_back(std::move(insn));
  }
  uint16_t index = m_cls->get_pool().add_integer(value);
  auto insn =
      std::make_unique<JvmInstruction>(index <= 0xff ? OPCODE_LDC : OPCODE_LDC_W);
  insn->set_cp_index(index);
  return get_code().push_back(std::move(insn));
}

InsnNode* MethodCreator::ldc_string(const std::string& value) {
  uint16_t index = m_cls->get_pool().add_string(value);
  auto insn =
      std::make_unique<JvmInstruction>(index <= 0xff ? OPCODE_LDC : OPCODE_LDC_W);
  insn->set_cp_index(index);
  return get_code().push_back(std::move(insn));
}

InsnNode* MethodCreator::type_op(JvmOpcode op,
                                 const std::string& internal_name) {
  always_assert(op == OPCODE_NEW || op == OPCODE_ANEWARRAY ||
                op == OPCODE_CHECKCAST || op == OPCODE_INSTANCEOF);
  auto insn = std::make_unique<JvmInstruction>(op);
  insn->set_cp_index(m_cls->get_pool().add_class(internal_name));
  return get_code().push_back(std::move(insn));
}

InsnNode* MethodCreator::field_op(JvmOpcode op,
                                  const std::string& owner,
                                  const std::string& name,
                                  const std::string& desc) {
  always_assert(opcode::is_field_op(op));
  auto insn = std::make_unique<JvmInstruction>(op);
  insn->set_cp_index(
      m_cls->get_pool().add_member_ref(CpTag::Fieldref, owner, name, desc));
  return get_code().push_back(std::move(insn));
}

InsnNode* MethodCreator::invoke(JvmOpcode op,
                                const std::string& owner,
                                const std::string& name,
                                const std::string& desc,
                                bool is_interface) {
  always_assert(opcode::is_invoke(op) && op != OPCODE_INVOKEDYNAMIC);
  auto tag = (is_interface || op == OPCODE_INVOKEINTERFACE)
                 ? CpTag::InterfaceMethodref
                 : CpTag::Methodref;
  auto insn = std::make_unique<JvmInstruction>(op);
  insn->set_cp_index(m_cls->get_pool().add_member_ref(tag, owner, name, desc));
  return get_code().push_back(std::move(insn));
}

InsnNode* MethodCreator::invoke_dynamic(
    std::unique_ptr<DynamicCallSite> call_site) {
  auto insn = std::make_unique<JvmInstruction>(OPCODE_INVOKEDYNAMIC);
  insn->set_call_site(std::move(call_site));
  return get_code().push_back(std::move(insn));
}

InsnNode* MethodCreator::make_label() {
  m_pending_labels.push_back(InsnList::make_label());
  return m_pending_labels.back().get();
}

void MethodCreator::mark(InsnNode* label) {
  auto it = std::find_if(m_pending_labels.begin(), m_pending_labels.end(),
                         [label](const auto& l) { return l.get() == label; });
  always_assert_log(it != m_pending_labels.end(),
                    "Label was not made by this creator or is already marked");
  get_code().push_back_label(std::move(*it));
  m_pending_labels.erase(it);
}

InsnNode* MethodCreator::branch(JvmOpcode op, InsnNode* label) {
  always_assert(opcode::is_branch(op));
  auto insn = std::make_unique<JvmInstruction>(op);
  insn->set_target(label);
  return get_code().push_back(std::move(insn));
}

InsnNode* MethodCreator::table_switch(InsnNode* default_label,
                                      int32_t low,
                                      const std::vector<InsnNode*>& labels) {
  std::vector<SwitchCase> cases;
  for (size_t i = 0; i < labels.size(); i++) {
    cases.push_back(SwitchCase{low + (int32_t)i, labels[i]});
  }
  auto insn = std::make_unique<JvmInstruction>(OPCODE_TABLESWITCH);
  insn->set_target(default_label)->set_cases(std::move(cases));
  return get_code().push_back(std::move(insn));
}

void MethodCreator::add_try_catch(InsnNode* start,
                                  InsnNode* end,
                                  InsnNode* handler,
                                  const std::string& catch_type) {
  uint16_t type =
      catch_type.empty() ? 0 : m_cls->get_pool().add_class(catch_type);
  m_method->get_try_catch_blocks().push_back(
      TryCatchBlock{start, end, handler, type});
}

void MethodCreator::add_line_number(InsnNode* label, uint16_t line) {
  m_method->get_line_numbers().push_back(LineNumber{label, line});
}

void MethodCreator::add_exception(const std::string& internal_name) {
  m_method->get_exceptions().push_back(
      m_cls->get_pool().add_class(internal_name));
}

JavaMethod* MethodCreator::create() {
  always_assert_log(m_method != nullptr, "Method already created");
  always_assert_log(m_pending_labels.empty(), "%zu labels were never marked",
                    m_pending_labels.size());
  return m_cls->add_method(std::move(m_method));
}
