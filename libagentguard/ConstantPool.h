/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

enum class CpTag : uint8_t {
  // Second slot of a Long or Double, and slot 0.
  Unusable = 0,
  Utf8 = 1,
  Integer = 3,
  Float = 4,
  Long = 5,
  Double = 6,
  Class = 7,
  String = 8,
  Fieldref = 9,
  Methodref = 10,
  InterfaceMethodref = 11,
  NameAndType = 12,
  MethodHandle = 15,
  MethodType = 16,
  Dynamic = 17,
  InvokeDynamic = 18,
  Module = 19,
  Package = 20,
};

/*
 * Method handle reference kinds, JVMS 4.4.8.
 */
enum MethodHandleKind : uint8_t {
  REF_getField = 1,
  REF_getStatic = 2,
  REF_putField = 3,
  REF_putStatic = 4,
  REF_invokeVirtual = 5,
  REF_invokeStatic = 6,
  REF_invokeSpecial = 7,
  REF_newInvokeSpecial = 8,
  REF_invokeInterface = 9,
};

struct CpEntry {
  CpTag tag{CpTag::Unusable};
  // Class/String/MethodType/Module/Package: ref0 only. Member refs:
  // class + name_and_type. NameAndType: name + descriptor. MethodHandle:
  // ref0 is the member ref. Dynamic/InvokeDynamic: bootstrap index +
  // name_and_type.
  uint16_t ref0{0};
  uint16_t ref1{0};
  uint8_t handle_kind{0};
  // Raw bits of Integer/Float/Long/Double.
  uint64_t bits{0};
  std::string utf8;
};

struct MemberRef {
  CpTag tag;
  std::string owner;
  std::string name;
  std::string desc;
};

/*
 * A class file constant pool. Existing entries are never renumbered, so
 * indices held by unparsed attributes stay valid; new entries are only
 * appended through the add_* functions, which return the index of an equal
 * entry when one exists.
 */
class ConstantPool {
 public:
  ConstantPool();

  /*
   * Parses `constant_pool_count` and the entries following it.
   */
  static ConstantPool read(const uint8_t*& buffer, const uint8_t* buffer_end);

  void write(std::vector<uint8_t>& out) const;

  // The constant_pool_count as stored in the class file.
  uint16_t count() const { return (uint16_t)m_entries.size(); }

  const CpEntry& at(uint16_t index) const;
  const CpEntry& at(uint16_t index, CpTag expected) const;

  const std::string& utf8(uint16_t index) const;
  const std::string& class_name(uint16_t index) const;
  const std::string& string(uint16_t index) const;
  std::pair<std::string, std::string> name_and_type(uint16_t index) const;
  MemberRef member_ref(uint16_t index) const;

  // True for Long and Double: they take two slots and two stack words.
  bool is_wide_constant(uint16_t index) const;

  uint16_t add_utf8(std::string_view value);
  uint16_t add_class(std::string_view internal_name);
  uint16_t add_string(std::string_view value);
  uint16_t add_integer(int32_t value);
  uint16_t add_float(float value);
  uint16_t add_long(int64_t value);
  uint16_t add_double(double value);
  uint16_t add_name_and_type(std::string_view name, std::string_view desc);
  uint16_t add_member_ref(CpTag tag,
                          std::string_view owner,
                          std::string_view name,
                          std::string_view desc);
  uint16_t add_method_handle(uint8_t kind, uint16_t member_ref);
  uint16_t add_method_type(std::string_view desc);
  uint16_t add_invoke_dynamic(uint16_t bootstrap_index,
                              std::string_view name,
                              std::string_view desc);

 private:
  uint16_t intern(CpEntry entry);
  void index_entry(uint16_t index);

  std::vector<CpEntry> m_entries;
  std::unordered_map<std::string, uint16_t> m_index;
};
