/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <boost/variant.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "JvmOpcode.h"

struct InsnNode;

/*
 * A resolved CONSTANT_MethodHandle: the kind plus the member it refers to.
 */
struct MethodHandleConstant {
  uint8_t kind{0};
  std::string owner;
  std::string name;
  std::string desc;
  bool is_interface{false};

  bool operator==(const MethodHandleConstant& other) const;
};

/*
 * A CONSTANT_Class (descriptor "Lfoo;" or "[I") or CONSTANT_MethodType
 * (descriptor "(I)V") bootstrap argument.
 */
struct TypeConstant {
  std::string desc;

  bool is_method_type() const { return !desc.empty() && desc[0] == '('; }
  bool operator==(const TypeConstant& other) const {
    return desc == other.desc;
  }
};

struct StringConstant {
  std::string value;

  bool operator==(const StringConstant& other) const {
    return value == other.value;
  }
};

/*
 * A bootstrap argument this library does not model (e.g. a dynamic
 * constant). It is only meaningful against the pool it came from.
 */
struct PoolConstant {
  uint16_t index{0};

  bool operator==(const PoolConstant& other) const {
    return index == other.index;
  }
};

using BootstrapConstant = boost::variant<int32_t,
                                         int64_t,
                                         float,
                                         double,
                                         StringConstant,
                                         TypeConstant,
                                         MethodHandleConstant,
                                         PoolConstant>;

/*
 * The metadata of an invokedynamic site: the name and descriptor the site is
 * linked under, the bootstrap method handle and its static arguments.
 */
class DynamicCallSite {
 public:
  DynamicCallSite(std::string name,
                  std::string desc,
                  MethodHandleConstant bootstrap,
                  std::vector<BootstrapConstant> bootstrap_args)
      : m_name(std::move(name)),
        m_desc(std::move(desc)),
        m_bootstrap(std::move(bootstrap)),
        m_bootstrap_args(std::move(bootstrap_args)) {}

  const std::string& name() const { return m_name; }
  const std::string& desc() const { return m_desc; }
  const MethodHandleConstant& bootstrap() const { return m_bootstrap; }
  const std::vector<BootstrapConstant>& bootstrap_args() const {
    return m_bootstrap_args;
  }

 private:
  std::string m_name;
  std::string m_desc;
  MethodHandleConstant m_bootstrap;
  std::vector<BootstrapConstant> m_bootstrap_args;
};

struct SwitchCase {
  int32_t key;
  InsnNode* target;
};

/*
 * One bytecode instruction. Constant operands stay constant pool indices of
 * the owning class, except for invokedynamic, which carries its resolved
 * DynamicCallSite. Branch and switch targets are label nodes of the same
 * InsnList.
 */
class JvmInstruction {
 public:
  explicit JvmInstruction(JvmOpcode op);
  JvmInstruction(const JvmInstruction&);
  ~JvmInstruction();

  JvmOpcode opcode() const { return m_opcode; }

  bool has_call_site() const { return m_call_site != nullptr; }
  const DynamicCallSite* get_call_site() const { return m_call_site.get(); }

  // bipush/sipush value, iinc increment, newarray type code,
  // multianewarray dimensions.
  int32_t get_literal() const { return m_literal; }
  // Local variable index of loads, stores, iinc and ret.
  uint16_t get_local() const { return m_local; }
  uint16_t get_cp_index() const { return m_cp_index; }
  // Whether a LOCAL or IINC instruction is encoded with a `wide` prefix.
  bool is_wide() const { return m_wide; }
  InsnNode* get_target() const { return m_target; }
  const std::vector<SwitchCase>& get_cases() const { return m_cases; }

  JvmInstruction* set_literal(int32_t literal) {
    m_literal = literal;
    return this;
  }
  JvmInstruction* set_local(uint16_t local) {
    m_local = local;
    return this;
  }
  JvmInstruction* set_cp_index(uint16_t index) {
    m_cp_index = index;
    return this;
  }
  JvmInstruction* set_wide(bool wide) {
    m_wide = wide;
    return this;
  }
  JvmInstruction* set_target(InsnNode* target);
  JvmInstruction* set_cases(std::vector<SwitchCase> cases);
  JvmInstruction* set_call_site(std::unique_ptr<DynamicCallSite> call_site);

  bool operator==(const JvmInstruction& other) const;

 private:
  JvmOpcode m_opcode;
  bool m_wide{false};
  uint16_t m_local{0};
  uint16_t m_cp_index{0};
  int32_t m_literal{0};
  // Branch target, or the default target of a switch.
  InsnNode* m_target{nullptr};
  std::vector<SwitchCase> m_cases;
  std::unique_ptr<DynamicCallSite> m_call_site;
};

std::string show(const BootstrapConstant& constant);
