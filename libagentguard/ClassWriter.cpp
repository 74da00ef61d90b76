/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "ClassWriter.h"

#include <algorithm>
#include <limits>
#include <unordered_map>

#include "ByteIO.h"
#include "ClassReader.h"
#include "Debug.h"
#include "Trace.h"
#include "TypeUtil.h"

using namespace byte_io;

namespace {

constexpr uint32_t kMaxCodeLength = 65535;

using OffsetMap = std::unordered_map<const InsnNode*, uint32_t>;

uint16_t value_size(std::string_view desc) {
  return descriptor::slot_size(descriptor::data_type(desc));
}

uint8_t switch_padding(uint32_t pc) { return (uint8_t)((4 - (pc + 1) % 4) % 4); }

uint32_t encoded_size(const JvmInstruction& insn, uint32_t pc) {
  switch (opcode::format(insn.opcode())) {
  case opcode::Format::NONE:
    return 1;
  case opcode::Format::S1:
  case opcode::Format::CP1:
  case opcode::Format::NEWARRAY:
    return 2;
  case opcode::Format::S2:
  case opcode::Format::CP2:
  case opcode::Format::BRANCH2:
    return 3;
  case opcode::Format::LOCAL:
    return insn.is_wide() ? 4 : 2;
  case opcode::Format::IINC:
    return insn.is_wide() ? 6 : 3;
  case opcode::Format::MULTIANEWARRAY:
    return 4;
  case opcode::Format::BRANCH4:
  case opcode::Format::INVOKEINTERFACE:
  case opcode::Format::INVOKEDYNAMIC:
    return 5;
  case opcode::Format::TABLESWITCH:
    return 1 + switch_padding(pc) + 12 + 4 * (uint32_t)insn.get_cases().size();
  case opcode::Format::LOOKUPSWITCH:
    return 1 + switch_padding(pc) + 8 + 8 * (uint32_t)insn.get_cases().size();
  case opcode::Format::WIDE:
    break;
  }
  throw_typed(AgentGuardError::UNSUPPORTED_CODE,
              "A bare wide prefix cannot be encoded");
}

uint32_t lookup_offset(const OffsetMap& offsets, const InsnNode* label) {
  auto it = offsets.find(label);
  if (it == offsets.end()) {
    throw_typed(AgentGuardError::UNSUPPORTED_CODE,
                "Reference to a label that is not in the method");
  }
  return it->second;
}

class CodeEncoder {
 public:
  CodeEncoder(JavaClass& cls, const JavaMethod& method)
      : m_cls(cls), m_method(method) {}

  // Returns the code bytes; offsets() is valid afterwards.
  std::vector<uint8_t> encode();

  const OffsetMap& offsets() const { return m_offsets; }
  uint32_t code_length() const { return m_code_length; }

 private:
  void emit(std::vector<uint8_t>& out, const JvmInstruction& insn, uint32_t pc);
  int32_t relative(uint32_t pc, const InsnNode* target) const {
    return (int32_t)lookup_offset(m_offsets, target) - (int32_t)pc;
  }

  JavaClass& m_cls;
  const JavaMethod& m_method;
  OffsetMap m_offsets;
  uint32_t m_code_length{0};
};

std::vector<uint8_t> CodeEncoder::encode() {
  uint32_t pc = 0;
  for (const auto& node : m_method.get_code()) {
    m_offsets.emplace(&node, pc);
    if (node.type == INSN_OPCODE) {
      pc += encoded_size(*node.insn, pc);
      always_assert_type_log(pc <= kMaxCodeLength,
                             AgentGuardError::UNSUPPORTED_CODE,
                             "Code of %s%s is too large",
                             m_method.get_name().c_str(),
                             m_method.get_desc().c_str());
    }
  }
  m_code_length = pc;
  always_assert_type_log(pc > 0, AgentGuardError::UNSUPPORTED_CODE,
                         "Method %s%s has an empty body",
                         m_method.get_name().c_str(),
                         m_method.get_desc().c_str());

  std::vector<uint8_t> out;
  out.reserve(pc);
  for (const auto& node : m_method.get_code()) {
    if (node.type == INSN_OPCODE) {
      emit(out, *node.insn, (uint32_t)out.size());
    }
  }
  always_assert(out.size() == m_code_length);
  return out;
}

void CodeEncoder::emit(std::vector<uint8_t>& out,
                       const JvmInstruction& insn,
                       uint32_t pc) {
  auto op = insn.opcode();
  auto fmt = opcode::format(op);
  if (insn.is_wide()) {
    write8(out, OPCODE_WIDE);
  }
  write8(out, op);
  switch (fmt) {
  case opcode::Format::NONE:
    break;
  case opcode::Format::S1:
    write8(out, (uint8_t)(int8_t)insn.get_literal());
    break;
  case opcode::Format::S2:
    write16(out, (uint16_t)(int16_t)insn.get_literal());
    break;
  case opcode::Format::CP1:
    always_assert_type_log(insn.get_cp_index() <= 0xff,
                           AgentGuardError::UNSUPPORTED_CODE,
                           "ldc operand #%u needs ldc_w", insn.get_cp_index());
    write8(out, (uint8_t)insn.get_cp_index());
    break;
  case opcode::Format::CP2:
    write16(out, insn.get_cp_index());
    break;
  case opcode::Format::LOCAL:
    if (insn.is_wide()) {
      write16(out, insn.get_local());
    } else {
      always_assert_type_log(insn.get_local() <= 0xff,
                             AgentGuardError::UNSUPPORTED_CODE,
                             "Local %u needs a wide prefix", insn.get_local());
      write8(out, (uint8_t)insn.get_local());
    }
    break;
  case opcode::Format::IINC:
    if (insn.is_wide()) {
      write16(out, insn.get_local());
      write16(out, (uint16_t)(int16_t)insn.get_literal());
    } else {
      always_assert_type_log(insn.get_local() <= 0xff &&
                                 insn.get_literal() >= -128 &&
                                 insn.get_literal() <= 127,
                             AgentGuardError::UNSUPPORTED_CODE,
                             "iinc operands need a wide prefix");
      write8(out, (uint8_t)insn.get_local());
      write8(out, (uint8_t)(int8_t)insn.get_literal());
    }
    break;
  case opcode::Format::NEWARRAY:
    write8(out, (uint8_t)insn.get_literal());
    break;
  case opcode::Format::BRANCH2: {
    int32_t rel = relative(pc, insn.get_target());
    always_assert_type_log(rel >= std::numeric_limits<int16_t>::min() &&
                               rel <= std::numeric_limits<int16_t>::max(),
                           AgentGuardError::UNSUPPORTED_CODE,
                           "Branch offset %d does not fit %s", rel,
                           show(op).c_str());
    write16(out, (uint16_t)(int16_t)rel);
    break;
  }
  case opcode::Format::BRANCH4:
    write32(out, (uint32_t)relative(pc, insn.get_target()));
    break;
  case opcode::Format::TABLESWITCH:
  case opcode::Format::LOOKUPSWITCH: {
    for (uint8_t i = 0; i < switch_padding(pc); i++) {
      write8(out, 0);
    }
    write32(out, (uint32_t)relative(pc, insn.get_target()));
    const auto& cases = insn.get_cases();
    if (op == OPCODE_TABLESWITCH) {
      always_assert_type_log(!cases.empty(), AgentGuardError::UNSUPPORTED_CODE,
                             "tableswitch without cases");
      int32_t low = cases.front().key;
      for (size_t i = 0; i < cases.size(); i++) {
        always_assert_type_log((int64_t)cases[i].key == (int64_t)low + (int64_t)i,
                               AgentGuardError::UNSUPPORTED_CODE,
                               "tableswitch keys must be consecutive");
      }
      write32(out, (uint32_t)low);
      write32(out, (uint32_t)cases.back().key);
      for (const auto& c : cases) {
        write32(out, (uint32_t)relative(pc, c.target));
      }
    } else {
      write32(out, (uint32_t)cases.size());
      for (const auto& c : cases) {
        write32(out, (uint32_t)c.key);
        write32(out, (uint32_t)relative(pc, c.target));
      }
    }
    break;
  }
  case opcode::Format::INVOKEINTERFACE: {
    write16(out, insn.get_cp_index());
    auto ref = m_cls.get_pool().member_ref(insn.get_cp_index());
    write8(out, (uint8_t)(1 + descriptor::argument_slots(ref.desc)));
    write8(out, 0);
    break;
  }
  case opcode::Format::INVOKEDYNAMIC: {
    uint16_t index = insn.has_call_site()
                         ? intern_call_site(m_cls, *insn.get_call_site())
                         : insn.get_cp_index();
    write16(out, index);
    write16(out, 0);
    break;
  }
  case opcode::Format::MULTIANEWARRAY:
    write16(out, insn.get_cp_index());
    write8(out, (uint8_t)insn.get_literal());
    break;
  case opcode::Format::WIDE:
    not_reached();
  }
}

uint16_t intern_method_handle(ConstantPool& pool,
                              const MethodHandleConstant& handle) {
  CpTag tag;
  switch (handle.kind) {
  case REF_getField:
  case REF_getStatic:
  case REF_putField:
  case REF_putStatic:
    tag = CpTag::Fieldref;
    break;
  case REF_invokeInterface:
    tag = CpTag::InterfaceMethodref;
    break;
  default:
    tag = handle.is_interface ? CpTag::InterfaceMethodref : CpTag::Methodref;
    break;
  }
  return pool.add_method_handle(
      handle.kind,
      pool.add_member_ref(tag, handle.owner, handle.name, handle.desc));
}

class InternConstant : public boost::static_visitor<uint16_t> {
 public:
  explicit InternConstant(ConstantPool& pool) : m_pool(pool) {}

  uint16_t operator()(int32_t v) const { return m_pool.add_integer(v); }
  uint16_t operator()(int64_t v) const { return m_pool.add_long(v); }
  uint16_t operator()(float v) const { return m_pool.add_float(v); }
  uint16_t operator()(double v) const { return m_pool.add_double(v); }
  uint16_t operator()(const StringConstant& v) const {
    return m_pool.add_string(v.value);
  }
  uint16_t operator()(const TypeConstant& v) const {
    if (v.is_method_type()) {
      return m_pool.add_method_type(v.desc);
    }
    const auto& desc = v.desc;
    if (desc.size() > 2 && desc.front() == 'L' && desc.back() == ';') {
      return m_pool.add_class(desc.substr(1, desc.size() - 2));
    }
    return m_pool.add_class(desc);
  }
  uint16_t operator()(const MethodHandleConstant& v) const {
    return intern_method_handle(m_pool, v);
  }
  uint16_t operator()(const PoolConstant& v) const {
    m_pool.at(v.index);
    return v.index;
  }

 private:
  ConstantPool& m_pool;
};

void write_attribute(std::vector<uint8_t>& out,
                     uint16_t name_index,
                     const std::vector<uint8_t>& data) {
  write16(out, name_index);
  write32(out, (uint32_t)data.size());
  write_bytes(out, data.data(), data.size());
}

void write_attributes(std::vector<uint8_t>& out,
                      const std::vector<RawAttribute>& attributes) {
  for (const auto& attr : attributes) {
    write_attribute(out, attr.name_index, attr.data);
  }
}

bool needs_frames(const JavaClass& cls, const JavaMethod& method) {
  if (cls.get_major_version() < kFirstVersionWithFrames) {
    return false;
  }
  if (!method.get_try_catch_blocks().empty()) {
    return true;
  }
  for (const auto& node : method.get_code()) {
    if (node.type != INSN_OPCODE) {
      continue;
    }
    auto op = node.insn->opcode();
    if (opcode::is_branch(op) || opcode::is_switch(op)) {
      return true;
    }
  }
  return false;
}

/*
 * Drops debug entries whose labels were removed from the list. They carry
 * no semantics, unlike exception ranges.
 */
template <typename Entry, typename Fn>
std::vector<Entry> live_entries(const std::vector<Entry>& entries,
                                const OffsetMap& offsets,
                                const Fn& labels_of) {
  std::vector<Entry> live;
  for (const auto& entry : entries) {
    auto labels = labels_of(entry);
    if (std::all_of(labels.begin(), labels.end(), [&](const InsnNode* l) {
          return offsets.count(l) != 0;
        })) {
      live.push_back(entry);
    }
  }
  return live;
}

void write_local_table(std::vector<uint8_t>& out,
                       ConstantPool& pool,
                       const char* name,
                       const std::vector<LocalVariable>& locals,
                       const OffsetMap& offsets) {
  auto live = live_entries(locals, offsets, [](const LocalVariable& l) {
    return std::vector<const InsnNode*>{l.start, l.end};
  });
  std::vector<uint8_t> data;
  write16(data, (uint16_t)live.size());
  for (const auto& local : live) {
    uint32_t start = lookup_offset(offsets, local.start);
    uint32_t end = std::max(start, lookup_offset(offsets, local.end));
    write16(data, (uint16_t)start);
    write16(data, (uint16_t)(end - start));
    write16(data, local.name_index);
    write16(data, local.type_index);
    write16(data, local.index);
  }
  write_attribute(out, pool.add_utf8(name), data);
}

std::vector<uint8_t> encode_code_attribute(JavaClass& cls, JavaMethod& method) {
  auto& pool = cls.get_pool();
  CodeEncoder encoder(cls, method);
  auto code = encoder.encode();
  const auto& offsets = encoder.offsets();

  bool modified = method.is_modified();
  uint16_t max_stack = method.get_max_stack();
  uint16_t max_locals = method.get_max_locals();
  if (modified) {
    always_assert_type_log(!needs_frames(cls, method),
                           AgentGuardError::UNSUPPORTED_CODE,
                           "Rewritten %s.%s%s needs stack map frames",
                           cls.get_name().c_str(), method.get_name().c_str(),
                           method.get_desc().c_str());
    max_stack = compute_max_stack(method);
    max_locals = compute_max_locals(method);
  }

  std::vector<uint8_t> out;
  write16(out, max_stack);
  write16(out, max_locals);
  write32(out, (uint32_t)code.size());
  write_bytes(out, code.data(), code.size());

  std::vector<std::vector<uint8_t>> handlers;
  for (const auto& tcb : method.get_try_catch_blocks()) {
    uint32_t start = lookup_offset(offsets, tcb.start);
    uint32_t end = lookup_offset(offsets, tcb.end);
    if (start >= end) {
      TRACE(CODEC, 3, "Dropping empty handler range in %s%s",
            method.get_name().c_str(), method.get_desc().c_str());
      continue;
    }
    std::vector<uint8_t> entry;
    write16(entry, (uint16_t)start);
    write16(entry, (uint16_t)end);
    write16(entry, (uint16_t)lookup_offset(offsets, tcb.handler));
    write16(entry, tcb.catch_type);
    handlers.push_back(std::move(entry));
  }
  write16(out, (uint16_t)handlers.size());
  for (const auto& entry : handlers) {
    write_bytes(out, entry.data(), entry.size());
  }

  size_t attr_count_pos = out.size();
  write16(out, 0);
  uint16_t attr_count = 0;

  auto lines = live_entries(method.get_line_numbers(), offsets,
                            [](const LineNumber& l) {
                              return std::vector<const InsnNode*>{l.start};
                            });
  if (!lines.empty()) {
    std::vector<uint8_t> data;
    write16(data, (uint16_t)lines.size());
    for (const auto& line : lines) {
      write16(data, (uint16_t)lookup_offset(offsets, line.start));
      write16(data, line.line);
    }
    write_attribute(out, pool.add_utf8("LineNumberTable"), data);
    attr_count++;
  }
  if (!method.get_local_variables().empty()) {
    write_local_table(out, pool, "LocalVariableTable",
                      method.get_local_variables(), offsets);
    attr_count++;
  }
  if (!method.get_local_variable_types().empty()) {
    write_local_table(out, pool, "LocalVariableTypeTable",
                      method.get_local_variable_types(), offsets);
    attr_count++;
  }
  if (!modified) {
    if (method.get_stack_map()) {
      write_attribute(out, pool.add_utf8("StackMapTable"),
                      *method.get_stack_map());
      attr_count++;
    }
    write_attributes(out, method.get_code_attributes());
    attr_count += (uint16_t)method.get_code_attributes().size();
  } else if (!method.get_code_attributes().empty() ||
             method.get_stack_map()) {
    // Offsets in these no longer hold.
    TRACE(CODEC, 3, "Dropping code attributes of rewritten %s%s",
          method.get_name().c_str(), method.get_desc().c_str());
  }
  out[attr_count_pos] = (uint8_t)(attr_count >> 8);
  out[attr_count_pos + 1] = (uint8_t)attr_count;
  return out;
}

void write_method(std::vector<uint8_t>& out, JavaClass& cls, JavaMethod& method) {
  auto& pool = cls.get_pool();
  write16(out, method.get_access());
  write16(out, pool.add_utf8(method.get_name()));
  write16(out, pool.add_utf8(method.get_desc()));

  uint16_t attr_count = (uint16_t)method.get_attributes().size();
  std::vector<uint8_t> code;
  if (method.has_code()) {
    code = encode_code_attribute(cls, method);
    attr_count++;
  } else if (!method.get_code().empty()) {
    TRACE(CODEC, 2, "Ignoring instructions of bodiless method %s.%s%s",
          cls.get_name().c_str(), method.get_name().c_str(),
          method.get_desc().c_str());
  }
  if (!method.get_exceptions().empty()) {
    attr_count++;
  }
  write16(out, attr_count);
  if (method.has_code()) {
    write_attribute(out, pool.add_utf8("Code"), code);
  }
  if (!method.get_exceptions().empty()) {
    std::vector<uint8_t> data;
    write16(data, (uint16_t)method.get_exceptions().size());
    for (auto index : method.get_exceptions()) {
      write16(data, index);
    }
    write_attribute(out, pool.add_utf8("Exceptions"), data);
  }
  write_attributes(out, method.get_attributes());
}

} // namespace

std::pair<int, int> stack_effect(const ConstantPool& pool,
                                 const JvmInstruction& insn) {
  auto op = insn.opcode();
  int pops = opcode::stack_pops(op);
  int pushes = opcode::stack_pushes(op);
  if (pops != opcode::kVariableStack && pushes != opcode::kVariableStack) {
    return {pops, pushes};
  }
  switch (op) {
  case OPCODE_LDC:
  case OPCODE_LDC_W:
    return {0, pool.is_wide_constant(insn.get_cp_index()) ? 2 : 1};
  case OPCODE_GETSTATIC:
    return {0, value_size(pool.member_ref(insn.get_cp_index()).desc)};
  case OPCODE_PUTSTATIC:
    return {value_size(pool.member_ref(insn.get_cp_index()).desc), 0};
  case OPCODE_GETFIELD:
    return {1, value_size(pool.member_ref(insn.get_cp_index()).desc)};
  case OPCODE_PUTFIELD:
    return {1 + value_size(pool.member_ref(insn.get_cp_index()).desc), 0};
  case OPCODE_INVOKEVIRTUAL:
  case OPCODE_INVOKESPECIAL:
  case OPCODE_INVOKESTATIC:
  case OPCODE_INVOKEINTERFACE: {
    auto desc = pool.member_ref(insn.get_cp_index()).desc;
    int receiver = op == OPCODE_INVOKESTATIC ? 0 : 1;
    return {receiver + descriptor::argument_slots(desc),
            descriptor::slot_size(descriptor::return_data_type(desc))};
  }
  case OPCODE_INVOKEDYNAMIC: {
    std::string desc;
    if (insn.has_call_site()) {
      desc = insn.get_call_site()->desc();
    } else {
      const auto& entry = pool.at(insn.get_cp_index(), CpTag::InvokeDynamic);
      desc = pool.name_and_type(entry.ref1).second;
    }
    return {descriptor::argument_slots(desc),
            descriptor::slot_size(descriptor::return_data_type(desc))};
  }
  case OPCODE_MULTIANEWARRAY:
    return {insn.get_literal(), 1};
  default:
    not_reached_log("No variable stack effect for %s", show(op).c_str());
  }
}

uint16_t compute_max_stack(const JavaMethod& method) {
  const auto& pool = method.get_class()->get_pool();
  auto nodes = method.get_code().to_vector();
  std::unordered_map<const InsnNode*, size_t> position;
  for (size_t i = 0; i < nodes.size(); i++) {
    position.emplace(nodes[i], i);
  }
  auto index_of = [&](const InsnNode* node) {
    auto it = position.find(node);
    if (it == position.end()) {
      throw_typed(AgentGuardError::UNSUPPORTED_CODE,
                  "Reference to a label that is not in the method");
    }
    return it->second;
  };

  std::vector<int> depth(nodes.size(), -1);
  std::vector<size_t> worklist;
  int max_depth = 0;
  auto visit = [&](size_t i, int d) {
    always_assert_type_log(i < nodes.size(), AgentGuardError::UNSUPPORTED_CODE,
                           "Execution falls off the end of %s%s",
                           method.get_name().c_str(),
                           method.get_desc().c_str());
    if (depth[i] == -1) {
      depth[i] = d;
      worklist.push_back(i);
    } else {
      always_assert_type_log(depth[i] == d, AgentGuardError::UNSUPPORTED_CODE,
                             "Inconsistent stack depth in %s%s",
                             method.get_name().c_str(),
                             method.get_desc().c_str());
    }
  };

  if (nodes.empty()) {
    return 0;
  }
  visit(0, 0);
  for (const auto& tcb : method.get_try_catch_blocks()) {
    visit(index_of(tcb.handler), 1);
    max_depth = std::max(max_depth, 1);
  }
  while (!worklist.empty()) {
    size_t i = worklist.back();
    worklist.pop_back();
    int d = depth[i];
    const auto* node = nodes[i];
    if (node->type != INSN_OPCODE) {
      visit(i + 1, d);
      continue;
    }
    const auto& insn = *node->insn;
    auto op = insn.opcode();
    auto effect = stack_effect(pool, insn);
    always_assert_type_log(d >= effect.first, AgentGuardError::UNSUPPORTED_CODE,
                           "Stack underflow at %s in %s%s", show(op).c_str(),
                           method.get_name().c_str(),
                           method.get_desc().c_str());
    int next = d - effect.first + effect.second;
    max_depth = std::max(max_depth, next);
    if (opcode::is_jsr(op)) {
      visit(index_of(insn.get_target()), next);
      visit(i + 1, d);
    } else if (opcode::is_branch(op)) {
      visit(index_of(insn.get_target()), next);
      if (opcode::is_conditional_branch(op)) {
        visit(i + 1, next);
      }
    } else if (opcode::is_switch(op)) {
      visit(index_of(insn.get_target()), next);
      for (const auto& c : insn.get_cases()) {
        visit(index_of(c.target), next);
      }
    } else if (!opcode::is_block_end(op)) {
      visit(i + 1, next);
    }
  }
  always_assert_type_log(max_depth <= std::numeric_limits<uint16_t>::max(),
                         AgentGuardError::UNSUPPORTED_CODE,
                         "Operand stack too deep");
  return (uint16_t)max_depth;
}

uint16_t compute_max_locals(const JavaMethod& method) {
  uint32_t max_locals = descriptor::argument_slots(method.get_desc()) +
                        (method.is_static() ? 0 : 1);
  for (const auto& node : method.get_code()) {
    if (node.type != INSN_OPCODE) {
      continue;
    }
    auto op = node.insn->opcode();
    auto fmt = opcode::format(op);
    if (fmt != opcode::Format::LOCAL && fmt != opcode::Format::IINC) {
      continue;
    }
    bool wide_value = op == OPCODE_LLOAD || op == OPCODE_DLOAD ||
                      op == OPCODE_LSTORE || op == OPCODE_DSTORE;
    max_locals = std::max<uint32_t>(
        max_locals, (uint32_t)node.insn->get_local() + (wide_value ? 2 : 1));
  }
  always_assert_type_log(max_locals <= std::numeric_limits<uint16_t>::max(),
                         AgentGuardError::UNSUPPORTED_CODE,
                         "Too many locals");
  return (uint16_t)max_locals;
}

uint16_t intern_call_site(JavaClass& cls, const DynamicCallSite& call_site) {
  auto& pool = cls.get_pool();
  BootstrapMethod bsm;
  bsm.method_handle = intern_method_handle(pool, call_site.bootstrap());
  InternConstant intern(pool);
  for (const auto& arg : call_site.bootstrap_args()) {
    bsm.arguments.push_back(boost::apply_visitor(intern, arg));
  }
  uint16_t bsm_index = cls.add_bootstrap_method(std::move(bsm));
  return pool.add_invoke_dynamic(bsm_index, call_site.name(),
                                 call_site.desc());
}

std::vector<uint8_t> write_class(JavaClass& cls) {
  auto& pool = cls.get_pool();
  uint16_t this_index = pool.add_class(cls.get_name());
  uint16_t super_index =
      cls.get_super_name().empty() ? 0 : pool.add_class(cls.get_super_name());

  // Everything after the pool is written first, since it may add constants.
  std::vector<uint8_t> body;
  write16(body, cls.get_access());
  write16(body, this_index);
  write16(body, super_index);
  write16(body, (uint16_t)cls.get_interfaces().size());
  for (const auto& iface : cls.get_interfaces()) {
    write16(body, pool.add_class(iface));
  }
  write16(body, (uint16_t)cls.get_fields().size());
  for (const auto& field : cls.get_fields()) {
    write16(body, field.access);
    write16(body, field.name_index);
    write16(body, field.desc_index);
    write16(body, (uint16_t)field.attributes.size());
    write_attributes(body, field.attributes);
  }
  write16(body, (uint16_t)cls.get_methods().size());
  for (const auto& method : cls.get_methods()) {
    write_method(body, cls, *method);
  }

  const auto& bsms = cls.get_bootstrap_methods();
  uint16_t attr_count = (uint16_t)cls.get_attributes().size();
  if (!bsms.empty()) {
    attr_count++;
  }
  write16(body, attr_count);
  if (!bsms.empty()) {
    std::vector<uint8_t> data;
    write16(data, (uint16_t)bsms.size());
    for (const auto& bsm : bsms) {
      write16(data, bsm.method_handle);
      write16(data, (uint16_t)bsm.arguments.size());
      for (auto arg : bsm.arguments) {
        write16(data, arg);
      }
    }
    write_attribute(body, pool.add_utf8("BootstrapMethods"), data);
  }
  write_attributes(body, cls.get_attributes());

  std::vector<uint8_t> out;
  write32(out, kClassMagic);
  write16(out, cls.get_minor_version());
  write16(out, cls.get_major_version());
  pool.write(out);
  write_bytes(out, body.data(), body.size());

  TRACE(CODEC, 4, "Wrote class %s (%zu bytes)", cls.get_name().c_str(),
        out.size());
  return out;
}
