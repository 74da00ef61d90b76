/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "ConstantPool.h"

#include <cstring>
#include <limits>

#include "ByteIO.h"
#include "Debug.h"
#include "Trace.h"

using namespace byte_io;

namespace {

std::string entry_key(const CpEntry& entry) {
  std::string key;
  key.push_back((char)entry.tag);
  if (entry.tag == CpTag::Utf8) {
    key.append(entry.utf8);
    return key;
  }
  key.append(reinterpret_cast<const char*>(&entry.ref0), sizeof(entry.ref0));
  key.append(reinterpret_cast<const char*>(&entry.ref1), sizeof(entry.ref1));
  key.push_back((char)entry.handle_kind);
  key.append(reinterpret_cast<const char*>(&entry.bits), sizeof(entry.bits));
  return key;
}

bool is_wide_tag(CpTag tag) {
  return tag == CpTag::Long || tag == CpTag::Double;
}

} // namespace

ConstantPool::ConstantPool() { m_entries.emplace_back(); }

ConstantPool ConstantPool::read(const uint8_t*& buffer,
                                const uint8_t* buffer_end) {
  ConstantPool pool;
  uint16_t count = read16(buffer, buffer_end);
  always_assert_type_log(count > 0, AgentGuardError::INVALID_JAVA,
                         "Empty constant pool count");
  pool.m_entries.reserve(count);
  for (uint32_t i = 1; i < count; i++) {
    CpEntry entry;
    uint8_t tag = read8(buffer, buffer_end);
    entry.tag = (CpTag)tag;
    switch (entry.tag) {
    case CpTag::Utf8: {
      uint16_t length = read16(buffer, buffer_end);
      const uint8_t* start = buffer;
      skip(buffer, buffer_end, length);
      entry.utf8.assign(reinterpret_cast<const char*>(start), length);
      break;
    }
    case CpTag::Integer:
    case CpTag::Float:
      entry.bits = read32(buffer, buffer_end);
      break;
    case CpTag::Long:
    case CpTag::Double: {
      uint64_t high = read32(buffer, buffer_end);
      uint64_t low = read32(buffer, buffer_end);
      entry.bits = (high << 32) | low;
      break;
    }
    case CpTag::Class:
    case CpTag::String:
    case CpTag::MethodType:
    case CpTag::Module:
    case CpTag::Package:
      entry.ref0 = read16(buffer, buffer_end);
      break;
    case CpTag::Fieldref:
    case CpTag::Methodref:
    case CpTag::InterfaceMethodref:
    case CpTag::NameAndType:
    case CpTag::Dynamic:
    case CpTag::InvokeDynamic:
      entry.ref0 = read16(buffer, buffer_end);
      entry.ref1 = read16(buffer, buffer_end);
      break;
    case CpTag::MethodHandle:
      entry.handle_kind = read8(buffer, buffer_end);
      entry.ref0 = read16(buffer, buffer_end);
      break;
    default:
      throw_typed(AgentGuardError::INVALID_JAVA,
                  format2string("Unrecognized constant pool tag %u at %u",
                                tag, i));
    }
    bool wide = is_wide_tag(entry.tag);
    pool.m_entries.push_back(std::move(entry));
    if (wide) {
      always_assert_type_log(i + 1 < count, AgentGuardError::INVALID_JAVA,
                             "Wide constant in the last pool slot");
      pool.m_entries.emplace_back();
      i++;
    }
  }
  for (uint16_t i = 1; i < pool.count(); i++) {
    pool.index_entry(i);
  }
  TRACE(CODEC, 5, "Read constant pool with %u entries", count);
  return pool;
}

void ConstantPool::write(std::vector<uint8_t>& out) const {
  write16(out, count());
  for (size_t i = 1; i < m_entries.size(); i++) {
    const auto& entry = m_entries[i];
    if (entry.tag == CpTag::Unusable) {
      continue;
    }
    write8(out, (uint8_t)entry.tag);
    switch (entry.tag) {
    case CpTag::Utf8:
      write16(out, (uint16_t)entry.utf8.size());
      write_bytes(out, reinterpret_cast<const uint8_t*>(entry.utf8.data()),
                  entry.utf8.size());
      break;
    case CpTag::Integer:
    case CpTag::Float:
      write32(out, (uint32_t)entry.bits);
      break;
    case CpTag::Long:
    case CpTag::Double:
      write32(out, (uint32_t)(entry.bits >> 32));
      write32(out, (uint32_t)entry.bits);
      break;
    case CpTag::Class:
    case CpTag::String:
    case CpTag::MethodType:
    case CpTag::Module:
    case CpTag::Package:
      write16(out, entry.ref0);
      break;
    case CpTag::MethodHandle:
      write8(out, entry.handle_kind);
      write16(out, entry.ref0);
      break;
    default:
      write16(out, entry.ref0);
      write16(out, entry.ref1);
      break;
    }
  }
}

const CpEntry& ConstantPool::at(uint16_t index) const {
  always_assert_type_log(index > 0 && index < m_entries.size() &&
                             m_entries[index].tag != CpTag::Unusable,
                         AgentGuardError::INVALID_JAVA,
                         "Bad constant pool index %u", index);
  return m_entries[index];
}

const CpEntry& ConstantPool::at(uint16_t index, CpTag expected) const {
  const auto& entry = at(index);
  always_assert_type_log(entry.tag == expected, AgentGuardError::INVALID_JAVA,
                         "Constant pool entry %u has tag %u, expected %u",
                         index, (unsigned)entry.tag, (unsigned)expected);
  return entry;
}

const std::string& ConstantPool::utf8(uint16_t index) const {
  return at(index, CpTag::Utf8).utf8;
}

const std::string& ConstantPool::class_name(uint16_t index) const {
  return utf8(at(index, CpTag::Class).ref0);
}

const std::string& ConstantPool::string(uint16_t index) const {
  return utf8(at(index, CpTag::String).ref0);
}

std::pair<std::string, std::string> ConstantPool::name_and_type(
    uint16_t index) const {
  const auto& nat = at(index, CpTag::NameAndType);
  return {utf8(nat.ref0), utf8(nat.ref1)};
}

MemberRef ConstantPool::member_ref(uint16_t index) const {
  const auto& entry = at(index);
  always_assert_type_log(entry.tag == CpTag::Fieldref ||
                             entry.tag == CpTag::Methodref ||
                             entry.tag == CpTag::InterfaceMethodref,
                         AgentGuardError::INVALID_JAVA,
                         "Constant pool entry %u is not a member ref", index);
  auto nat = name_and_type(entry.ref1);
  return MemberRef{entry.tag, class_name(entry.ref0), std::move(nat.first),
                   std::move(nat.second)};
}

bool ConstantPool::is_wide_constant(uint16_t index) const {
  const auto& entry = at(index);
  if (entry.tag == CpTag::Dynamic) {
    auto type = name_and_type(entry.ref1).second;
    return type == "J" || type == "D";
  }
  return is_wide_tag(entry.tag);
}

void ConstantPool::index_entry(uint16_t index) {
  const auto& entry = m_entries[index];
  if (entry.tag == CpTag::Unusable) {
    return;
  }
  // Keep the first of duplicate entries.
  m_index.emplace(entry_key(entry), index);
}

uint16_t ConstantPool::intern(CpEntry entry) {
  auto key = entry_key(entry);
  auto it = m_index.find(key);
  if (it != m_index.end()) {
    return it->second;
  }
  size_t needed = is_wide_tag(entry.tag) ? 2 : 1;
  always_assert_type_log(
      m_entries.size() + needed <= std::numeric_limits<uint16_t>::max(),
      AgentGuardError::UNSUPPORTED_CODE, "Constant pool is full");
  uint16_t index = (uint16_t)m_entries.size();
  bool wide = is_wide_tag(entry.tag);
  m_entries.push_back(std::move(entry));
  if (wide) {
    m_entries.emplace_back();
  }
  m_index.emplace(std::move(key), index);
  TRACE(CODEC, 5, "Appended constant pool entry %u", index);
  return index;
}

uint16_t ConstantPool::add_utf8(std::string_view value) {
  always_assert_type_log(value.size() <= std::numeric_limits<uint16_t>::max(),
                         AgentGuardError::UNSUPPORTED_CODE,
                         "Utf8 constant too long");
  CpEntry entry;
  entry.tag = CpTag::Utf8;
  entry.utf8 = std::string(value);
  return intern(std::move(entry));
}

uint16_t ConstantPool::add_class(std::string_view internal_name) {
  CpEntry entry;
  entry.tag = CpTag::Class;
  entry.ref0 = add_utf8(internal_name);
  return intern(std::move(entry));
}

uint16_t ConstantPool::add_string(std::string_view value) {
  CpEntry entry;
  entry.tag = CpTag::String;
  entry.ref0 = add_utf8(value);
  return intern(std::move(entry));
}

uint16_t ConstantPool::add_integer(int32_t value) {
  CpEntry entry;
  entry.tag = CpTag::Integer;
  entry.bits = (uint32_t)value;
  return intern(std::move(entry));
}

uint16_t ConstantPool::add_float(float value) {
  uint32_t bits;
  memcpy(&bits, &value, sizeof(bits));
  CpEntry entry;
  entry.tag = CpTag::Float;
  entry.bits = bits;
  return intern(std::move(entry));
}

uint16_t ConstantPool::add_long(int64_t value) {
  CpEntry entry;
  entry.tag = CpTag::Long;
  entry.bits = (uint64_t)value;
  return intern(std::move(entry));
}

uint16_t ConstantPool::add_double(double value) {
  uint64_t bits;
  memcpy(&bits, &value, sizeof(bits));
  CpEntry entry;
  entry.tag = CpTag::Double;
  entry.bits = bits;
  return intern(std::move(entry));
}

uint16_t ConstantPool::add_name_and_type(std::string_view name,
                                         std::string_view desc) {
  CpEntry entry;
  entry.tag = CpTag::NameAndType;
  entry.ref0 = add_utf8(name);
  entry.ref1 = add_utf8(desc);
  return intern(std::move(entry));
}

uint16_t ConstantPool::add_member_ref(CpTag tag,
                                      std::string_view owner,
                                      std::string_view name,
                                      std::string_view desc) {
  always_assert(tag == CpTag::Fieldref || tag == CpTag::Methodref ||
                tag == CpTag::InterfaceMethodref);
  CpEntry entry;
  entry.tag = tag;
  entry.ref0 = add_class(owner);
  entry.ref1 = add_name_and_type(name, desc);
  return intern(std::move(entry));
}

uint16_t ConstantPool::add_method_handle(uint8_t kind, uint16_t member_ref) {
  always_assert(kind >= REF_getField && kind <= REF_invokeInterface);
  at(member_ref);
  CpEntry entry;
  entry.tag = CpTag::MethodHandle;
  entry.handle_kind = kind;
  entry.ref0 = member_ref;
  return intern(std::move(entry));
}

uint16_t ConstantPool::add_method_type(std::string_view desc) {
  CpEntry entry;
  entry.tag = CpTag::MethodType;
  entry.ref0 = add_utf8(desc);
  return intern(std::move(entry));
}

uint16_t ConstantPool::add_invoke_dynamic(uint16_t bootstrap_index,
                                          std::string_view name,
                                          std::string_view desc) {
  CpEntry entry;
  entry.tag = CpTag::InvokeDynamic;
  entry.ref0 = bootstrap_index;
  entry.ref1 = add_name_and_type(name, desc);
  return intern(std::move(entry));
}
