/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "BuiltinRules.h"

#include "Debug.h"
#include "RuleRegistry.h"
#include "Trace.h"
#include "TypeUtil.h"

namespace {

void check_target(const std::string& rule, const MethodTarget& target) {
  assert_or_throw(!target.owner.empty() && !target.name.empty(),
                  AgentGuardError::INVALID_CONFIG,
                  rule + " needs an owner and a method name");
  assert_or_throw(descriptor::is_valid_method_descriptor(target.desc),
                  AgentGuardError::INVALID_CONFIG,
                  rule + " has an invalid descriptor",
                  {{"descriptor", target.desc}});
}

/*
 * Empties ClassFileTransformer#transform in every class implementing it,
 * which disarms any other agent's load hook.
 */
class ClassFileTransformerCleaner : public Rule {
 public:
  ClassFileTransformerCleaner() : Rule(builtin::kClassFileTransformerCleaner) {}

  void bind_config(const JsonWrapper& config) override {
    config.get("exempt_classes", {}, m_exempt);
  }

  AnyTransformer build() const override {
    return rules::lambda_cleaner(builtin::class_file_transformer_target(),
                                 m_exempt);
  }

 private:
  std::unordered_set<std::string> m_exempt;
};

class ThreadDumpStackCleaner : public Rule {
 public:
  ThreadDumpStackCleaner() : Rule(builtin::kThreadDumpStackCleaner) {}

  AnyTransformer build() const override {
    return rules::method_cleaner(builtin::thread_dump_stack_target());
  }
};

class MethodCleaner : public Rule {
 public:
  MethodCleaner() : Rule(builtin::kMethodCleaner) {}

  void bind_config(const JsonWrapper& config) override {
    config.get("class", "", m_target.owner);
    config.get("method", "", m_target.name);
    config.get("descriptor", "", m_target.desc);
    check_target(name(), m_target);
  }

  AnyTransformer build() const override {
    check_target(name(), m_target);
    return rules::method_cleaner(m_target);
  }

 private:
  MethodTarget m_target;
};

class LambdaCleaner : public Rule {
 public:
  LambdaCleaner() : Rule(builtin::kLambdaCleaner) {}

  void bind_config(const JsonWrapper& config) override {
    config.get("interface", "", m_target.owner);
    config.get("method", "", m_target.name);
    config.get("descriptor", "", m_target.desc);
    config.get("exempt_classes", {}, m_exempt);
    check_target(name(), m_target);
  }

  AnyTransformer build() const override {
    check_target(name(), m_target);
    return rules::lambda_cleaner(m_target, m_exempt);
  }

 private:
  MethodTarget m_target;
  std::unordered_set<std::string> m_exempt;
};

template <typename RuleType>
void register_one(RuleRegistry& registry, const char* name) {
  registry.register_rule(name, []() -> std::unique_ptr<Rule> {
    return std::make_unique<RuleType>();
  });
}

} // namespace

namespace builtin {

const MethodTarget& class_file_transformer_target() {
  static const MethodTarget target{
      "java/lang/instrument/ClassFileTransformer", "transform",
      "(Ljava/lang/ClassLoader;Ljava/lang/String;Ljava/lang/Class;"
      "Ljava/security/ProtectionDomain;[B)[B"};
  return target;
}

const MethodTarget& thread_dump_stack_target() {
  static const MethodTarget target{"java/lang/Thread", "dumpStack", "()V"};
  return target;
}

} // namespace builtin

void register_builtin_rules(RuleRegistry& registry) {
  register_one<ClassFileTransformerCleaner>(
      registry, builtin::kClassFileTransformerCleaner);
  register_one<ThreadDumpStackCleaner>(registry,
                                       builtin::kThreadDumpStackCleaner);
  register_one<MethodCleaner>(registry, builtin::kMethodCleaner);
  register_one<LambdaCleaner>(registry, builtin::kLambdaCleaner);
  TRACE(CONFIG, 3, "Registered built-in rules");
}
