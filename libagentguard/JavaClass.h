/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <boost/optional.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "ConstantPool.h"
#include "InsnList.h"

enum AccessFlags : uint16_t {
  ACC_PUBLIC = 0x0001,
  ACC_PRIVATE = 0x0002,
  ACC_PROTECTED = 0x0004,
  ACC_STATIC = 0x0008,
  ACC_FINAL = 0x0010,
  ACC_SYNCHRONIZED = 0x0020,
  ACC_SUPER = 0x0020,
  ACC_BRIDGE = 0x0040,
  ACC_VARARGS = 0x0080,
  ACC_NATIVE = 0x0100,
  ACC_INTERFACE = 0x0200,
  ACC_ABSTRACT = 0x0400,
  ACC_STRICT = 0x0800,
  ACC_SYNTHETIC = 0x1000,
  ACC_ANNOTATION = 0x2000,
  ACC_ENUM = 0x4000,
};

// Class file major version from which the verifier requires StackMapTable.
constexpr uint16_t kFirstVersionWithFrames = 50;

/*
 * An attribute kept as its undecoded bytes. Its constant pool references
 * stay valid because existing pool entries are never renumbered.
 */
struct RawAttribute {
  uint16_t name_index;
  std::vector<uint8_t> data;
};

struct FieldInfo {
  uint16_t access;
  uint16_t name_index;
  uint16_t desc_index;
  std::vector<RawAttribute> attributes;
};

struct BootstrapMethod {
  uint16_t method_handle;
  std::vector<uint16_t> arguments;

  bool operator==(const BootstrapMethod& other) const {
    return method_handle == other.method_handle &&
           arguments == other.arguments;
  }
};

struct TryCatchBlock {
  InsnNode* start;
  InsnNode* end;
  InsnNode* handler;
  // CONSTANT_Class index of the caught type, 0 for a catch-all.
  uint16_t catch_type;
};

struct LocalVariable {
  InsnNode* start;
  InsnNode* end;
  uint16_t name_index;
  // Descriptor index in LocalVariableTable, signature index in
  // LocalVariableTypeTable.
  uint16_t type_index;
  uint16_t index;
};

struct LineNumber {
  InsnNode* start;
  uint16_t line;
};

class JavaClass;

class JavaMethod {
 public:
  JavaMethod(JavaClass* cls,
             uint16_t access,
             std::string name,
             std::string desc);

  JavaClass* get_class() const { return m_class; }
  uint16_t get_access() const { return m_access; }
  void set_access(uint16_t access) { m_access = access; }
  const std::string& get_name() const { return m_name; }
  const std::string& get_desc() const { return m_desc; }

  bool is_static() const { return (m_access & ACC_STATIC) != 0; }
  bool is_abstract() const { return (m_access & ACC_ABSTRACT) != 0; }
  bool is_native() const { return (m_access & ACC_NATIVE) != 0; }
  bool is_synthetic() const { return (m_access & ACC_SYNTHETIC) != 0; }
  // Abstract and native methods carry no Code attribute.
  bool has_code() const { return !is_abstract() && !is_native(); }

  InsnList& get_code() { return m_code; }
  const InsnList& get_code() const { return m_code; }

  std::vector<TryCatchBlock>& get_try_catch_blocks() { return m_try_catch; }
  const std::vector<TryCatchBlock>& get_try_catch_blocks() const {
    return m_try_catch;
  }
  std::vector<LocalVariable>& get_local_variables() { return m_locals; }
  const std::vector<LocalVariable>& get_local_variables() const {
    return m_locals;
  }
  std::vector<LocalVariable>& get_local_variable_types() {
    return m_local_types;
  }
  const std::vector<LocalVariable>& get_local_variable_types() const {
    return m_local_types;
  }
  std::vector<LineNumber>& get_line_numbers() { return m_lines; }
  const std::vector<LineNumber>& get_line_numbers() const { return m_lines; }

  // CONSTANT_Class indices of the declared `throws` clause.
  std::vector<uint16_t>& get_exceptions() { return m_exceptions; }
  const std::vector<uint16_t>& get_exceptions() const { return m_exceptions; }

  uint16_t get_max_stack() const { return m_max_stack; }
  uint16_t get_max_locals() const { return m_max_locals; }
  void set_max_stack(uint16_t max_stack) { m_max_stack = max_stack; }
  void set_max_locals(uint16_t max_locals) { m_max_locals = max_locals; }

  const boost::optional<std::vector<uint8_t>>& get_stack_map() const {
    return m_stack_map;
  }
  void set_stack_map(boost::optional<std::vector<uint8_t>> stack_map) {
    m_stack_map = std::move(stack_map);
  }

  // Method attributes other than Code and Exceptions.
  std::vector<RawAttribute>& get_attributes() { return m_attributes; }
  const std::vector<RawAttribute>& get_attributes() const {
    return m_attributes;
  }
  // Code attributes this library does not decode.
  std::vector<RawAttribute>& get_code_attributes() { return m_code_attributes; }
  const std::vector<RawAttribute>& get_code_attributes() const {
    return m_code_attributes;
  }

  /*
   * True if the body no longer matches what was read, so the writer must
   * recompute max_stack/max_locals and cannot reuse the StackMapTable.
   * Methods built in memory start out modified.
   */
  bool is_modified() const { return m_modified || m_code.is_modified(); }
  void set_modified() { m_modified = true; }
  void mark_clean() {
    m_modified = false;
    m_code.mark_clean();
  }

 private:
  JavaClass* m_class;
  uint16_t m_access;
  std::string m_name;
  std::string m_desc;
  InsnList m_code;
  std::vector<TryCatchBlock> m_try_catch;
  std::vector<LocalVariable> m_locals;
  std::vector<LocalVariable> m_local_types;
  std::vector<LineNumber> m_lines;
  std::vector<uint16_t> m_exceptions;
  uint16_t m_max_stack{0};
  uint16_t m_max_locals{0};
  boost::optional<std::vector<uint8_t>> m_stack_map;
  std::vector<RawAttribute> m_attributes;
  std::vector<RawAttribute> m_code_attributes;
  bool m_modified{true};
};

/*
 * The structured, mutable form of one class file.
 */
class JavaClass {
 public:
  JavaClass(std::string name, std::string super_name);

  uint16_t get_minor_version() const { return m_minor_version; }
  uint16_t get_major_version() const { return m_major_version; }
  void set_version(uint16_t major, uint16_t minor) {
    m_major_version = major;
    m_minor_version = minor;
  }

  uint16_t get_access() const { return m_access; }
  void set_access(uint16_t access) { m_access = access; }
  bool is_interface() const { return (m_access & ACC_INTERFACE) != 0; }

  // Internal names ("java/lang/Thread").
  const std::string& get_name() const { return m_name; }
  // Empty for java/lang/Object.
  const std::string& get_super_name() const { return m_super_name; }

  // Directly declared interfaces, in declaration order.
  const std::vector<std::string>& get_interfaces() const {
    return m_interfaces;
  }
  void add_interface(const std::string& name) { m_interfaces.push_back(name); }
  bool implements_directly(const std::string& iface) const;

  /*
   * Capability tags: the interface names this class is known to implement,
   * from its own declaration plus whatever the host reported for its runtime
   * identity.
   */
  void add_capability(const std::string& type) { m_capabilities.insert(type); }
  bool has_capability(const std::string& type) const {
    return m_capabilities.count(type) != 0;
  }
  const std::unordered_set<std::string>& get_capabilities() const {
    return m_capabilities;
  }

  ConstantPool& get_pool() { return m_pool; }
  const ConstantPool& get_pool() const { return m_pool; }
  void set_pool(ConstantPool pool) { m_pool = std::move(pool); }

  std::vector<FieldInfo>& get_fields() { return m_fields; }
  const std::vector<FieldInfo>& get_fields() const { return m_fields; }

  const std::vector<std::unique_ptr<JavaMethod>>& get_methods() const {
    return m_methods;
  }
  JavaMethod* add_method(std::unique_ptr<JavaMethod> method);
  JavaMethod* find_method(const std::string& name,
                          const std::string& desc) const;

  std::vector<BootstrapMethod>& get_bootstrap_methods() {
    return m_bootstrap_methods;
  }
  const std::vector<BootstrapMethod>& get_bootstrap_methods() const {
    return m_bootstrap_methods;
  }
  // Returns the index of an equal entry, appending one if there is none.
  uint16_t add_bootstrap_method(BootstrapMethod bsm);

  // Class attributes other than BootstrapMethods.
  std::vector<RawAttribute>& get_attributes() { return m_attributes; }
  const std::vector<RawAttribute>& get_attributes() const {
    return m_attributes;
  }

  bool is_modified() const;

 private:
  uint16_t m_minor_version{0};
  uint16_t m_major_version{52};
  uint16_t m_access{ACC_PUBLIC | ACC_SUPER};
  std::string m_name;
  std::string m_super_name;
  std::vector<std::string> m_interfaces;
  std::unordered_set<std::string> m_capabilities;
  ConstantPool m_pool;
  std::vector<FieldInfo> m_fields;
  std::vector<std::unique_ptr<JavaMethod>> m_methods;
  std::vector<BootstrapMethod> m_bootstrap_methods;
  std::vector<RawAttribute> m_attributes;
};
