/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "JvmInstruction.h"

#include <sstream>

#include "Debug.h"

bool MethodHandleConstant::operator==(const MethodHandleConstant& other) const {
  return kind == other.kind && owner == other.owner && name == other.name &&
         desc == other.desc && is_interface == other.is_interface;
}

JvmInstruction::JvmInstruction(JvmOpcode op) : m_opcode(op) {
  always_assert_log(opcode::is_valid(op), "Invalid opcode 0x%x", op);
}

JvmInstruction::JvmInstruction(const JvmInstruction& other)
    : m_opcode(other.m_opcode),
      m_wide(other.m_wide),
      m_local(other.m_local),
      m_cp_index(other.m_cp_index),
      m_literal(other.m_literal),
      m_target(other.m_target),
      m_cases(other.m_cases),
      m_call_site(other.m_call_site
                      ? std::make_unique<DynamicCallSite>(*other.m_call_site)
                      : nullptr) {}

JvmInstruction::~JvmInstruction() {}

JvmInstruction* JvmInstruction::set_target(InsnNode* target) {
  always_assert_log(opcode::is_branch(m_opcode) || opcode::is_switch(m_opcode),
                    "%s takes no target", show(m_opcode).c_str());
  m_target = target;
  return this;
}

JvmInstruction* JvmInstruction::set_cases(std::vector<SwitchCase> cases) {
  always_assert(opcode::is_switch(m_opcode));
  m_cases = std::move(cases);
  return this;
}

JvmInstruction* JvmInstruction::set_call_site(
    std::unique_ptr<DynamicCallSite> call_site) {
  always_assert(m_opcode == OPCODE_INVOKEDYNAMIC);
  m_call_site = std::move(call_site);
  return this;
}

bool JvmInstruction::operator==(const JvmInstruction& other) const {
  if (m_opcode != other.m_opcode || m_wide != other.m_wide ||
      m_local != other.m_local || m_cp_index != other.m_cp_index ||
      m_literal != other.m_literal || m_target != other.m_target ||
      m_cases.size() != other.m_cases.size()) {
    return false;
  }
  for (size_t i = 0; i < m_cases.size(); i++) {
    if (m_cases[i].key != other.m_cases[i].key ||
        m_cases[i].target != other.m_cases[i].target) {
      return false;
    }
  }
  if (has_call_site() != other.has_call_site()) {
    return false;
  }
  if (has_call_site()) {
    const auto& a = *m_call_site;
    const auto& b = *other.m_call_site;
    return a.name() == b.name() && a.desc() == b.desc() &&
           a.bootstrap() == b.bootstrap() &&
           a.bootstrap_args() == b.bootstrap_args();
  }
  return true;
}

namespace {

class ShowConstant : public boost::static_visitor<std::string> {
 public:
  std::string operator()(int32_t v) const { return std::to_string(v); }
  std::string operator()(int64_t v) const { return std::to_string(v) + "L"; }
  std::string operator()(float v) const { return std::to_string(v) + "F"; }
  std::string operator()(double v) const { return std::to_string(v) + "D"; }
  std::string operator()(const StringConstant& v) const {
    return "\"" + v.value + "\"";
  }
  std::string operator()(const TypeConstant& v) const { return v.desc; }
  std::string operator()(const MethodHandleConstant& v) const {
    std::ostringstream ss;
    ss << "handle(" << (unsigned)v.kind << ") " << v.owner << "." << v.name
       << ":" << v.desc;
    return ss.str();
  }
  std::string operator()(const PoolConstant& v) const {
    return "#" + std::to_string(v.index);
  }
};

} // namespace

std::string show(const BootstrapConstant& constant) {
  return boost::apply_visitor(ShowConstant(), constant);
}
