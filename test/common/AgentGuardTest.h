/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <algorithm>
#include <gtest/gtest.h>
#include <map>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "AgentGuardException.h"
#include "ClassWriter.h"
#include "Creators.h"
#include "DetectionRules.h"
#include "Instrumentation.h"
#include "JarLoader.h"
#include "Transformer.h"

struct AgentGuardTest : public testing::Test {
  AgentGuardTest() { agentguard::set_throw_typed_exception(true); }
};

namespace agentguard_test {

constexpr const char* kMetafactoryOwner = "java/lang/invoke/LambdaMetafactory";
constexpr const char* kMetafactoryDesc =
    "(Ljava/lang/invoke/MethodHandles$Lookup;Ljava/lang/String;"
    "Ljava/lang/invoke/MethodType;Ljava/lang/invoke/MethodType;"
    "Ljava/lang/invoke/MethodHandle;Ljava/lang/invoke/MethodType;)"
    "Ljava/lang/invoke/CallSite;";

/*
 * A LambdaMetafactory call site creating an implementation of `target`
 * backed by `owner.impl_name`. `n_args` truncates the usual three bootstrap
 * arguments.
 */
inline std::unique_ptr<DynamicCallSite> make_lambda_call_site(
    const MethodTarget& target,
    const std::string& owner,
    const std::string& impl_name,
    size_t n_args = 3,
    uint8_t handle_kind = REF_invokeStatic) {
  MethodHandleConstant bootstrap;
  bootstrap.kind = REF_invokeStatic;
  bootstrap.owner = kMetafactoryOwner;
  bootstrap.name = "metafactory";
  bootstrap.desc = kMetafactoryDesc;

  MethodHandleConstant impl;
  impl.kind = handle_kind;
  impl.owner = owner;
  impl.name = impl_name;
  impl.desc = target.desc;

  std::vector<BootstrapConstant> args{TypeConstant{target.desc}, impl,
                                      TypeConstant{target.desc}};
  args.resize(std::min(n_args, args.size()));
  return std::make_unique<DynamicCallSite>(
      target.name, "()L" + target.owner + ";", bootstrap, std::move(args));
}

/*
 * Adds a method whose body is a default-value return, preceded by a few
 * instructions so that emptying it is observable.
 */
inline JavaMethod* add_busy_method(JavaClass* cls,
                                   uint16_t access,
                                   const std::string& name,
                                   const std::string& desc) {
  MethodCreator mc(cls, access, name, desc);
  mc.push_int(42);
  mc.insn(OPCODE_POP);
  mc.ldc_string("busy");
  mc.insn(OPCODE_POP);
  for (auto& insn : Transformer::generate_return(desc)) {
    mc.get_code().push_back(std::move(insn));
  }
  return mc.create();
}

/*
 * A class with a static factory method holding a lambda call site for
 * `target`, plus the static implementation method `lambda$impl$0`.
 */
inline std::unique_ptr<JavaClass> make_lambda_class(const std::string& name,
                                                    const MethodTarget& target,
                                                    size_t n_args = 3) {
  ClassCreator cc(name);
  auto* cls = cc.get_class();
  {
    MethodCreator mc(cls, ACC_PUBLIC | ACC_STATIC, "factory",
                     "()L" + target.owner + ";");
    mc.invoke_dynamic(make_lambda_call_site(target, name, "lambda$impl$0",
                                            n_args));
    mc.insn(OPCODE_ARETURN);
    mc.create();
  }
  add_busy_method(cls, ACC_PRIVATE | ACC_STATIC | ACC_SYNTHETIC,
                  "lambda$impl$0", target.desc);
  return cc.create();
}

inline std::vector<uint8_t> encode(JavaClass& cls) { return write_class(cls); }

/*
 * Records every lookup, so tests can check a class was never read.
 */
class CountingClassSource : public ClassSource {
 public:
  void add(const std::string& name, std::vector<uint8_t> bytes) {
    m_classes.add(name, std::move(bytes));
  }

  boost::optional<std::vector<uint8_t>> find(
      const std::string& internal_name) const override {
    m_lookups[internal_name]++;
    return m_classes.find(internal_name);
  }

  size_t lookups(const std::string& name) const {
    auto it = m_lookups.find(name);
    return it == m_lookups.end() ? 0 : it->second;
  }

 private:
  InMemoryClassSource m_classes;
  mutable std::map<std::string, size_t> m_lookups;
};

class FakeInstrumentation : public Instrumentation {
 public:
  RuntimeClass* add_loaded_class(
      const std::string& name,
      std::unordered_set<std::string> assignable_types = {},
      bool modifiable = true) {
    m_classes.push_back(std::make_unique<RuntimeClass>(
        name, std::move(assignable_types), "app", modifiable));
    return m_classes.back().get();
  }

  void add_transformer(ClassFileHook* hook) override { hooks.push_back(hook); }
  bool is_redefine_classes_supported() const override {
    return redefine_supported;
  }
  std::vector<const RuntimeClass*> get_all_loaded_classes() const override {
    std::vector<const RuntimeClass*> classes;
    for (const auto& cls : m_classes) {
      classes.push_back(cls.get());
    }
    return classes;
  }
  bool is_modifiable_class(const RuntimeClass& cls) const override {
    return cls.is_modifiable();
  }
  void redefine_classes(const std::vector<ClassDefinition>& batch) override {
    batches.push_back(batch);
  }

  bool redefine_supported{true};
  std::vector<ClassFileHook*> hooks;
  std::vector<std::vector<ClassDefinition>> batches;

 private:
  std::vector<std::unique_ptr<RuntimeClass>> m_classes;
};

} // namespace agentguard_test
