/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "ClassReader.h"

#include <cstring>
#include <map>
#include <set>
#include <string_view>

#include "ByteIO.h"
#include "Debug.h"
#include "Trace.h"

using namespace byte_io;

namespace {

constexpr uint32_t kMaxCodeLength = 65535;

struct PendingBranch {
  JvmInstruction* insn;
  uint32_t target;
  std::vector<std::pair<int32_t, uint32_t>> cases;
};

struct PendingRange {
  uint32_t start;
  uint32_t end;
  uint32_t handler;
  uint16_t catch_type;
};

struct PendingLocal {
  uint32_t start;
  uint32_t end;
  uint16_t name_index;
  uint16_t type_index;
  uint16_t index;
  bool is_type_table;
};

/*
 * Decodes one Code attribute into its method. Offsets referenced from the
 * instruction stream and the tables are collected first; labels are then
 * materialized in offset order in front of the instruction they name.
 */
class CodeDecoder {
 public:
  CodeDecoder(JavaClass& cls, JavaMethod& method)
      : m_cls(cls), m_pool(cls.get_pool()), m_method(method) {}

  void decode(const uint8_t* buffer, const uint8_t* buffer_end);

 private:
  void decode_instructions(const uint8_t* code, uint32_t code_length);
  void decode_attribute(uint16_t name_index,
                        const uint8_t* buffer,
                        const uint8_t* buffer_end);
  uint32_t branch_target(uint32_t pc, int32_t offset);
  void build_list(uint32_t code_length);
  InsnNode* label_at(uint32_t offset) const;

  JavaClass& m_cls;
  const ConstantPool& m_pool;
  JavaMethod& m_method;

  std::vector<std::pair<uint32_t, std::unique_ptr<JvmInstruction>>>
      m_instructions;
  std::vector<PendingBranch> m_branches;
  std::vector<PendingRange> m_ranges;
  std::vector<PendingLocal> m_locals;
  std::vector<std::pair<uint32_t, uint16_t>> m_lines;
  std::set<uint32_t> m_label_offsets;
  std::map<uint32_t, InsnNode*> m_labels;
};

uint32_t CodeDecoder::branch_target(uint32_t pc, int32_t offset) {
  int64_t target = (int64_t)pc + offset;
  always_assert_type_log(target >= 0 && target < kMaxCodeLength,
                         AgentGuardError::INVALID_JAVA,
                         "Branch at %u leaves the method", pc);
  m_label_offsets.insert((uint32_t)target);
  return (uint32_t)target;
}

std::unique_ptr<DynamicCallSite> make_call_site(const JavaClass& cls,
                                                uint16_t index) {
  const auto& pool = cls.get_pool();
  const auto& entry = pool.at(index, CpTag::InvokeDynamic);
  const auto& bsms = cls.get_bootstrap_methods();
  always_assert_type_log(entry.ref0 < bsms.size(),
                         AgentGuardError::INVALID_JAVA,
                         "Bad bootstrap method index %u", entry.ref0);
  const auto& bsm = bsms[entry.ref0];
  auto nat = pool.name_and_type(entry.ref1);
  std::vector<BootstrapConstant> args;
  args.reserve(bsm.arguments.size());
  for (auto arg : bsm.arguments) {
    args.push_back(resolve_bootstrap_constant(pool, arg));
  }
  return std::make_unique<DynamicCallSite>(
      std::move(nat.first), std::move(nat.second),
      resolve_method_handle(pool, bsm.method_handle), std::move(args));
}

void CodeDecoder::decode_instructions(const uint8_t* code,
                                      uint32_t code_length) {
  const uint8_t* end = code + code_length;
  const uint8_t* ptr = code;
  while (ptr < end) {
    uint32_t pc = (uint32_t)(ptr - code);
    uint8_t raw = read8(ptr, end);
    always_assert_type_log(opcode::is_valid(raw),
                           AgentGuardError::INVALID_JAVA,
                           "Invalid opcode 0x%x at %u", raw, pc);
    auto op = (JvmOpcode)raw;
    auto insn = std::make_unique<JvmInstruction>(op);
    switch (opcode::format(op)) {
    case opcode::Format::NONE:
      break;
    case opcode::Format::S1:
      insn->set_literal((int8_t)read8(ptr, end));
      break;
    case opcode::Format::S2:
      insn->set_literal((int16_t)read16(ptr, end));
      break;
    case opcode::Format::CP1:
      insn->set_cp_index(read8(ptr, end));
      break;
    case opcode::Format::CP2:
      insn->set_cp_index(read16(ptr, end));
      break;
    case opcode::Format::LOCAL:
      insn->set_local(read8(ptr, end));
      break;
    case opcode::Format::IINC:
      insn->set_local(read8(ptr, end));
      insn->set_literal((int8_t)read8(ptr, end));
      break;
    case opcode::Format::NEWARRAY:
      insn->set_literal(read8(ptr, end));
      break;
    case opcode::Format::BRANCH2: {
      auto offset = (int16_t)read16(ptr, end);
      m_branches.push_back({insn.get(), branch_target(pc, offset), {}});
      break;
    }
    case opcode::Format::BRANCH4: {
      auto offset = (int32_t)read32(ptr, end);
      m_branches.push_back({insn.get(), branch_target(pc, offset), {}});
      break;
    }
    case opcode::Format::TABLESWITCH:
    case opcode::Format::LOOKUPSWITCH: {
      // Operands are aligned to four bytes from the start of the code.
      while ((ptr - code) % 4 != 0) {
        read8(ptr, end);
      }
      PendingBranch branch{insn.get(), 0, {}};
      branch.target = branch_target(pc, (int32_t)read32(ptr, end));
      if (op == OPCODE_TABLESWITCH) {
        auto low = (int32_t)read32(ptr, end);
        auto high = (int32_t)read32(ptr, end);
        always_assert_type_log(low <= high, AgentGuardError::INVALID_JAVA,
                               "tableswitch low %d > high %d", low, high);
        for (int64_t key = low; key <= high; key++) {
          auto offset = (int32_t)read32(ptr, end);
          branch.cases.emplace_back((int32_t)key, branch_target(pc, offset));
        }
      } else {
        auto npairs = (int32_t)read32(ptr, end);
        always_assert_type_log(npairs >= 0, AgentGuardError::INVALID_JAVA,
                               "Negative lookupswitch size");
        for (int32_t i = 0; i < npairs; i++) {
          auto key = (int32_t)read32(ptr, end);
          auto offset = (int32_t)read32(ptr, end);
          branch.cases.emplace_back(key, branch_target(pc, offset));
        }
      }
      m_branches.push_back(std::move(branch));
      break;
    }
    case opcode::Format::INVOKEINTERFACE:
      insn->set_cp_index(read16(ptr, end));
      // The count byte is derivable from the descriptor.
      read8(ptr, end);
      read8(ptr, end);
      break;
    case opcode::Format::INVOKEDYNAMIC: {
      uint16_t index = read16(ptr, end);
      read16(ptr, end);
      insn->set_cp_index(index);
      insn->set_call_site(make_call_site(m_cls, index));
      break;
    }
    case opcode::Format::MULTIANEWARRAY:
      insn->set_cp_index(read16(ptr, end));
      insn->set_literal(read8(ptr, end));
      break;
    case opcode::Format::WIDE: {
      uint8_t widened = read8(ptr, end);
      always_assert_type_log(opcode::is_valid(widened),
                             AgentGuardError::INVALID_JAVA,
                             "Invalid widened opcode 0x%x at %u", widened, pc);
      auto wop = (JvmOpcode)widened;
      auto wformat = opcode::format(wop);
      always_assert_type_log(wformat == opcode::Format::LOCAL ||
                                 wformat == opcode::Format::IINC,
                             AgentGuardError::INVALID_JAVA,
                             "%s cannot be widened", show(wop).c_str());
      insn = std::make_unique<JvmInstruction>(wop);
      insn->set_wide(true);
      insn->set_local(read16(ptr, end));
      if (wformat == opcode::Format::IINC) {
        insn->set_literal((int16_t)read16(ptr, end));
      }
      break;
    }
    }
    m_instructions.emplace_back(pc, std::move(insn));
  }
}

void CodeDecoder::decode_attribute(uint16_t name_index,
                                   const uint8_t* buffer,
                                   const uint8_t* buffer_end) {
  const auto& name = m_pool.utf8(name_index);
  if (name == "LineNumberTable") {
    uint16_t count = read16(buffer, buffer_end);
    for (uint16_t i = 0; i < count; i++) {
      uint32_t start = read16(buffer, buffer_end);
      uint16_t line = read16(buffer, buffer_end);
      m_label_offsets.insert(start);
      m_lines.emplace_back(start, line);
    }
  } else if (name == "LocalVariableTable" ||
             name == "LocalVariableTypeTable") {
    bool is_type_table = name == "LocalVariableTypeTable";
    uint16_t count = read16(buffer, buffer_end);
    for (uint16_t i = 0; i < count; i++) {
      PendingLocal local;
      local.start = read16(buffer, buffer_end);
      local.end = local.start + read16(buffer, buffer_end);
      local.name_index = read16(buffer, buffer_end);
      local.type_index = read16(buffer, buffer_end);
      local.index = read16(buffer, buffer_end);
      local.is_type_table = is_type_table;
      m_label_offsets.insert(local.start);
      m_label_offsets.insert(local.end);
      m_locals.push_back(local);
    }
  } else if (name == "StackMapTable") {
    m_method.set_stack_map(std::vector<uint8_t>(buffer, buffer_end));
  } else {
    m_method.get_code_attributes().push_back(
        RawAttribute{name_index, std::vector<uint8_t>(buffer, buffer_end)});
  }
}

InsnNode* CodeDecoder::label_at(uint32_t offset) const {
  auto it = m_labels.find(offset);
  always_assert_type_log(it != m_labels.end(), AgentGuardError::INVALID_JAVA,
                         "Offset %u is not an instruction boundary", offset);
  return it->second;
}

void CodeDecoder::build_list(uint32_t code_length) {
  auto& code = m_method.get_code();
  auto next_label = m_label_offsets.begin();
  auto emit_labels_upto = [&](uint32_t pc) {
    while (next_label != m_label_offsets.end() && *next_label <= pc) {
      always_assert_type_log(*next_label == pc, AgentGuardError::INVALID_JAVA,
                             "Offset %u is inside an instruction",
                             *next_label);
      m_labels.emplace(*next_label, code.push_back_label());
      ++next_label;
    }
  };
  for (auto& entry : m_instructions) {
    emit_labels_upto(entry.first);
    code.push_back(std::move(entry.second));
  }
  emit_labels_upto(code_length);
  always_assert_type_log(next_label == m_label_offsets.end(),
                         AgentGuardError::INVALID_JAVA,
                         "Offset %u is past the end of the code",
                         *next_label);

  for (auto& branch : m_branches) {
    branch.insn->set_target(label_at(branch.target));
    if (opcode::is_switch(branch.insn->opcode())) {
      std::vector<SwitchCase> cases;
      cases.reserve(branch.cases.size());
      for (const auto& c : branch.cases) {
        cases.push_back(SwitchCase{c.first, label_at(c.second)});
      }
      branch.insn->set_cases(std::move(cases));
    }
  }
  for (const auto& range : m_ranges) {
    m_method.get_try_catch_blocks().push_back(
        TryCatchBlock{label_at(range.start), label_at(range.end),
                      label_at(range.handler), range.catch_type});
  }
  for (const auto& local : m_locals) {
    LocalVariable var{label_at(local.start), label_at(local.end),
                      local.name_index, local.type_index, local.index};
    if (local.is_type_table) {
      m_method.get_local_variable_types().push_back(var);
    } else {
      m_method.get_local_variables().push_back(var);
    }
  }
  for (const auto& line : m_lines) {
    m_method.get_line_numbers().push_back(
        LineNumber{label_at(line.first), line.second});
  }
}

void CodeDecoder::decode(const uint8_t* buffer, const uint8_t* buffer_end) {
  m_method.set_max_stack(read16(buffer, buffer_end));
  m_method.set_max_locals(read16(buffer, buffer_end));
  uint32_t code_length = read32(buffer, buffer_end);
  always_assert_type_log(code_length > 0 && code_length <= kMaxCodeLength,
                         AgentGuardError::INVALID_JAVA,
                         "Bad code length %u in %s%s", code_length,
                         m_method.get_name().c_str(),
                         m_method.get_desc().c_str());
  const uint8_t* code = buffer;
  skip(buffer, buffer_end, code_length);
  decode_instructions(code, code_length);

  uint16_t handler_count = read16(buffer, buffer_end);
  for (uint16_t i = 0; i < handler_count; i++) {
    PendingRange range;
    range.start = read16(buffer, buffer_end);
    range.end = read16(buffer, buffer_end);
    range.handler = read16(buffer, buffer_end);
    range.catch_type = read16(buffer, buffer_end);
    m_label_offsets.insert(range.start);
    m_label_offsets.insert(range.end);
    m_label_offsets.insert(range.handler);
    m_ranges.push_back(range);
  }

  uint16_t attr_count = read16(buffer, buffer_end);
  for (uint16_t i = 0; i < attr_count; i++) {
    uint16_t name_index = read16(buffer, buffer_end);
    uint32_t length = read32(buffer, buffer_end);
    const uint8_t* start = buffer;
    skip(buffer, buffer_end, length);
    decode_attribute(name_index, start, start + length);
  }
  build_list(code_length);
}

std::vector<RawAttribute> read_raw_attributes(const uint8_t*& buffer,
                                              const uint8_t* buffer_end) {
  std::vector<RawAttribute> attributes;
  uint16_t count = read16(buffer, buffer_end);
  attributes.reserve(count);
  for (uint16_t i = 0; i < count; i++) {
    uint16_t name_index = read16(buffer, buffer_end);
    uint32_t length = read32(buffer, buffer_end);
    const uint8_t* start = buffer;
    skip(buffer, buffer_end, length);
    attributes.push_back(
        RawAttribute{name_index, std::vector<uint8_t>(start, buffer)});
  }
  return attributes;
}

void read_bootstrap_methods(JavaClass& cls, const RawAttribute& attr) {
  const uint8_t* buffer = attr.data.data();
  const uint8_t* buffer_end = buffer + attr.data.size();
  uint16_t count = read16(buffer, buffer_end);
  auto& bsms = cls.get_bootstrap_methods();
  for (uint16_t i = 0; i < count; i++) {
    BootstrapMethod bsm;
    bsm.method_handle = read16(buffer, buffer_end);
    uint16_t nargs = read16(buffer, buffer_end);
    for (uint16_t j = 0; j < nargs; j++) {
      bsm.arguments.push_back(read16(buffer, buffer_end));
    }
    // Duplicates are kept so that indices stay stable.
    bsms.push_back(std::move(bsm));
  }
}

} // namespace

MethodHandleConstant resolve_method_handle(const ConstantPool& pool,
                                           uint16_t index) {
  const auto& entry = pool.at(index, CpTag::MethodHandle);
  auto ref = pool.member_ref(entry.ref0);
  MethodHandleConstant handle;
  handle.kind = entry.handle_kind;
  handle.owner = std::move(ref.owner);
  handle.name = std::move(ref.name);
  handle.desc = std::move(ref.desc);
  handle.is_interface = ref.tag == CpTag::InterfaceMethodref;
  return handle;
}

BootstrapConstant resolve_bootstrap_constant(const ConstantPool& pool,
                                             uint16_t index) {
  const auto& entry = pool.at(index);
  switch (entry.tag) {
  case CpTag::Integer:
    return BootstrapConstant((int32_t)(uint32_t)entry.bits);
  case CpTag::Float: {
    auto bits = (uint32_t)entry.bits;
    float value;
    memcpy(&value, &bits, sizeof(value));
    return BootstrapConstant(value);
  }
  case CpTag::Long:
    return BootstrapConstant((int64_t)entry.bits);
  case CpTag::Double: {
    double value;
    memcpy(&value, &entry.bits, sizeof(value));
    return BootstrapConstant(value);
  }
  case CpTag::String:
    return BootstrapConstant(StringConstant{pool.string(index)});
  case CpTag::Class: {
    const auto& name = pool.class_name(index);
    return BootstrapConstant(TypeConstant{
        name[0] == '[' ? name : "L" + name + ";"});
  }
  case CpTag::MethodType:
    return BootstrapConstant(TypeConstant{pool.utf8(entry.ref0)});
  case CpTag::MethodHandle:
    return BootstrapConstant(resolve_method_handle(pool, index));
  default:
    return BootstrapConstant(PoolConstant{index});
  }
}

std::unique_ptr<JavaClass> read_class(const uint8_t* buffer, size_t size) {
  const auto* buffer_end = buffer + size;
  uint32_t magic = read32(buffer, buffer_end);
  always_assert_type_log(magic == kClassMagic, AgentGuardError::INVALID_JAVA,
                         "Bad class magic 0x%x", magic);
  uint16_t vminor = read16(buffer, buffer_end);
  uint16_t vmajor = read16(buffer, buffer_end);
  auto pool = ConstantPool::read(buffer, buffer_end);

  uint16_t aflags = read16(buffer, buffer_end);
  uint16_t clazz = read16(buffer, buffer_end);
  uint16_t super = read16(buffer, buffer_end);
  std::string name = pool.class_name(clazz);
  std::string super_name;
  if (super != 0) {
    super_name = pool.class_name(super);
  }

  auto cls = std::make_unique<JavaClass>(std::move(name), std::move(super_name));
  cls->set_version(vmajor, vminor);
  cls->set_access(aflags);

  uint16_t ifcount = read16(buffer, buffer_end);
  for (uint16_t i = 0; i < ifcount; i++) {
    cls->add_interface(pool.class_name(read16(buffer, buffer_end)));
  }

  uint16_t fcount = read16(buffer, buffer_end);
  for (uint16_t i = 0; i < fcount; i++) {
    FieldInfo field;
    field.access = read16(buffer, buffer_end);
    field.name_index = read16(buffer, buffer_end);
    field.desc_index = read16(buffer, buffer_end);
    pool.utf8(field.name_index);
    pool.utf8(field.desc_index);
    field.attributes = read_raw_attributes(buffer, buffer_end);
    cls->get_fields().push_back(std::move(field));
  }

  // Code is decoded once the BootstrapMethods attribute, which follows the
  // methods, is known.
  std::vector<std::pair<JavaMethod*, RawAttribute>> bodies;
  uint16_t mcount = read16(buffer, buffer_end);
  for (uint16_t i = 0; i < mcount; i++) {
    uint16_t maccess = read16(buffer, buffer_end);
    const auto& mname = pool.utf8(read16(buffer, buffer_end));
    const auto& mdesc = pool.utf8(read16(buffer, buffer_end));
    auto* method = cls->add_method(
        std::make_unique<JavaMethod>(cls.get(), maccess, mname, mdesc));
    for (auto& attr : read_raw_attributes(buffer, buffer_end)) {
      const auto& attr_name = pool.utf8(attr.name_index);
      if (attr_name == "Code") {
        bodies.emplace_back(method, std::move(attr));
      } else if (attr_name == "Exceptions") {
        const uint8_t* ptr = attr.data.data();
        const uint8_t* end = ptr + attr.data.size();
        uint16_t count = read16(ptr, end);
        for (uint16_t j = 0; j < count; j++) {
          method->get_exceptions().push_back(read16(ptr, end));
        }
      } else {
        method->get_attributes().push_back(std::move(attr));
      }
    }
  }

  for (auto& attr : read_raw_attributes(buffer, buffer_end)) {
    if (pool.utf8(attr.name_index) == "BootstrapMethods") {
      read_bootstrap_methods(*cls, attr);
    } else {
      cls->get_attributes().push_back(std::move(attr));
    }
  }
  always_assert_type_log(buffer == buffer_end, AgentGuardError::INVALID_JAVA,
                         "%zu trailing bytes after class %s",
                         (size_t)(buffer_end - buffer),
                         cls->get_name().c_str());

  cls->set_pool(std::move(pool));
  for (auto& body : bodies) {
    const auto& data = body.second.data;
    CodeDecoder(*cls, *body.first).decode(data.data(), data.data() + data.size());
  }
  for (const auto& method : cls->get_methods()) {
    method->mark_clean();
  }

  TRACE(CODEC, 4, "Read class %s (version %u.%u, %zu methods)",
        cls->get_name().c_str(), vmajor, vminor, cls->get_methods().size());
  return cls;
}
