/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "Show.h"

#include <sstream>
#include <unordered_map>

#include "JavaClass.h"

namespace {

std::string show_cp(const ConstantPool* pool, uint16_t index) {
  std::ostringstream ss;
  ss << "#" << index;
  if (pool == nullptr) {
    return ss.str();
  }
  const auto& entry = pool->at(index);
  switch (entry.tag) {
  case CpTag::Class:
    ss << " " << pool->class_name(index);
    break;
  case CpTag::String:
    ss << " \"" << pool->string(index) << "\"";
    break;
  case CpTag::Integer:
    ss << " " << (int32_t)(uint32_t)entry.bits;
    break;
  case CpTag::Long:
    ss << " " << (int64_t)entry.bits << "L";
    break;
  case CpTag::Fieldref:
  case CpTag::Methodref:
  case CpTag::InterfaceMethodref: {
    auto ref = pool->member_ref(index);
    ss << " " << ref.owner << "." << ref.name << ":" << ref.desc;
    break;
  }
  default:
    break;
  }
  return ss.str();
}

} // namespace

std::string show(const JvmInstruction* insn, const ConstantPool* pool) {
  if (insn == nullptr) {
    return "";
  }
  std::ostringstream ss;
  auto op = insn->opcode();
  ss << show(op);
  switch (opcode::format(op)) {
  case opcode::Format::S1:
  case opcode::Format::S2:
  case opcode::Format::NEWARRAY:
    ss << " " << insn->get_literal();
    break;
  case opcode::Format::CP1:
  case opcode::Format::CP2:
  case opcode::Format::INVOKEINTERFACE:
    ss << " " << show_cp(pool, insn->get_cp_index());
    break;
  case opcode::Format::MULTIANEWARRAY:
    ss << " " << show_cp(pool, insn->get_cp_index()) << " "
       << insn->get_literal();
    break;
  case opcode::Format::LOCAL:
    ss << (insn->is_wide() ? " (wide) " : " ") << insn->get_local();
    break;
  case opcode::Format::IINC:
    ss << (insn->is_wide() ? " (wide) " : " ") << insn->get_local() << " "
       << insn->get_literal();
    break;
  case opcode::Format::INVOKEDYNAMIC:
    ss << " " << show(insn->get_call_site());
    break;
  case opcode::Format::BRANCH2:
  case opcode::Format::BRANCH4:
  case opcode::Format::TABLESWITCH:
  case opcode::Format::LOOKUPSWITCH:
  case opcode::Format::NONE:
  case opcode::Format::WIDE:
    break;
  }
  return ss.str();
}

std::string show(const DynamicCallSite* call_site) {
  if (call_site == nullptr) {
    return "";
  }
  std::ostringstream ss;
  ss << call_site->name() << ":" << call_site->desc() << " bsm "
     << show(BootstrapConstant(call_site->bootstrap())) << " [";
  bool first = true;
  for (const auto& arg : call_site->bootstrap_args()) {
    ss << (first ? "" : ", ") << show(arg);
    first = false;
  }
  ss << "]";
  return ss.str();
}

std::string show(const InsnList& code, const ConstantPool* pool) {
  std::unordered_map<const InsnNode*, size_t> labels;
  for (const auto& node : code) {
    if (node.is_label()) {
      labels.emplace(&node, labels.size());
    }
  }
  auto label_name = [&](const InsnNode* node) {
    auto it = labels.find(node);
    return it == labels.end() ? std::string("L?")
                              : "L" + std::to_string(it->second);
  };
  std::ostringstream ss;
  for (const auto& node : code) {
    if (node.is_label()) {
      ss << label_name(&node) << ":\n";
      continue;
    }
    ss << "  " << show(node.insn.get(), pool);
    if (node.insn->get_target() != nullptr) {
      ss << " " << label_name(node.insn->get_target());
    }
    for (const auto& c : node.insn->get_cases()) {
      ss << " " << c.key << "->" << label_name(c.target);
    }
    ss << "\n";
  }
  return ss.str();
}

std::string show(const JavaMethod* method) {
  if (method == nullptr) {
    return "";
  }
  return method->get_class()->get_name() + "." + method->get_name() + ":" +
         method->get_desc();
}

std::string show(const JavaClass* cls) {
  if (cls == nullptr) {
    return "";
  }
  return cls->get_name();
}

std::string vshow(uint16_t access, bool is_method) {
  std::ostringstream ss;
  if (access & ACC_PUBLIC) ss << "public ";
  if (access & ACC_PRIVATE) ss << "private ";
  if (access & ACC_PROTECTED) ss << "protected ";
  if (access & ACC_STATIC) ss << "static ";
  if (access & ACC_FINAL) ss << "final ";
  if (is_method) {
    if (access & ACC_SYNCHRONIZED) ss << "synchronized ";
    if (access & ACC_BRIDGE) ss << "bridge ";
    if (access & ACC_VARARGS) ss << "varargs ";
    if (access & ACC_NATIVE) ss << "native ";
  } else if (access & ACC_INTERFACE) {
    ss << "interface ";
  }
  if (access & ACC_ABSTRACT) ss << "abstract ";
  if (access & ACC_SYNTHETIC) ss << "synthetic ";
  if (access & ACC_ENUM) ss << "enum ";
  auto str = ss.str();
  if (!str.empty()) {
    str.pop_back();
  }
  return str;
}

std::string vshow(const JavaMethod* method) {
  if (method == nullptr) {
    return "";
  }
  std::ostringstream ss;
  ss << vshow(method->get_access()) << " " << show(method) << "\n"
     << show(method->get_code(), &method->get_class()->get_pool());
  return ss.str();
}
