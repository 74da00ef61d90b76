/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "JavaClass.h"

/**
 * Builds a JavaClass from scratch. The class exists from construction on so
 * that MethodCreators can intern into its constant pool.
 */
struct ClassCreator {
  explicit ClassCreator(const std::string& name,
                        const std::string& super_name = "java/lang/Object");

  /**
   * Return the JavaClass associated with this creator.
   */
  JavaClass* get_class() const { return m_cls.get(); }

  void set_access(uint16_t access) { m_cls->set_access(access); }

  void set_version(uint16_t major, uint16_t minor = 0) {
    m_cls->set_version(major, minor);
  }

  /**
   * Add an interface to the class to be created. Duplicates are ignored.
   */
  void add_interface(const std::string& iface);

  void add_field(uint16_t access,
                 const std::string& name,
                 const std::string& desc);

  /**
   * Hand over the class. The creator is unusable afterwards.
   */
  std::unique_ptr<JavaClass> create();

 private:
  std::unique_ptr<JavaClass> m_cls;
};

/**
 * Appends instructions to a new method of an existing class. Constant
 * operands are interned into the class's pool.
 */
struct MethodCreator {
  MethodCreator(JavaClass* cls,
                uint16_t access,
                const std::string& name,
                const std::string& desc);

  JavaMethod* get_method() const { return m_method.get(); }
  InsnList& get_code() { return m_method->get_code(); }

  InsnNode* insn(JvmOpcode op);

  /**
   * A load, store or ret of local `index`; uses the wide form when needed.
   */
  InsnNode* local(JvmOpcode op, uint16_t index);

  InsnNode* iinc(uint16_t index, int32_t increment);

  /**
   * Push an int constant with the shortest encoding.
   */
  InsnNode* push_int(int32_t value);

  InsnNode* ldc_string(const std::string& value);

  InsnNode* type_op(JvmOpcode op, const std::string& internal_name);

  InsnNode* field_op(JvmOpcode op,
                     const std::string& owner,
                     const std::string& name,
                     const std::string& desc);

  InsnNode* invoke(JvmOpcode op,
                   const std::string& owner,
                   const std::string& name,
                   const std::string& desc,
                   bool is_interface = false);

  InsnNode* invoke_dynamic(std::unique_ptr<DynamicCallSite> call_site);

  /**
   * Labels are made detached and placed with mark(), so jumps may target
   * code that is emitted later.
   */
  InsnNode* make_label();
  void mark(InsnNode* label);

  InsnNode* branch(JvmOpcode op, InsnNode* label);

  InsnNode* table_switch(InsnNode* default_label,
                         int32_t low,
                         const std::vector<InsnNode*>& labels);

  /**
   * Register a handler for [start, end). An empty `catch_type` catches
   * everything.
   */
  void add_try_catch(InsnNode* start,
                     InsnNode* end,
                     InsnNode* handler,
                     const std::string& catch_type = "");

  void add_line_number(InsnNode* label, uint16_t line);

  void add_exception(const std::string& internal_name);

  /**
   * Add the method to its class. Every label made by this creator must have
   * been marked.
   */
  JavaMethod* create();

 private:
  JavaClass* m_cls;
  std::unique_ptr<JavaMethod> m_method;
  std::vector<std::unique_ptr<InsnNode>> m_pending_labels;
};
