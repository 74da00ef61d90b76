/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "DetectionRules.h"

#include "Debug.h"
#include "Show.h"
#include "Trace.h"
#include "TypeUtil.h"

void add_capabilities(JavaClass* tree, const RuntimeClass* cls) {
  always_assert(tree != nullptr);
  for (const auto& iface : tree->get_interfaces()) {
    tree->add_capability(iface);
  }
  if (cls != nullptr) {
    for (const auto& type : cls->assignable_types()) {
      tree->add_capability(type);
    }
  }
}

bool is_lambda_factory(const DynamicCallSite& call_site,
                       const MethodTarget& target) {
  if (call_site.name() != target.name ||
      call_site.desc() != "()" + descriptor::object_descriptor(target.owner)) {
    return false;
  }
  const auto& args = call_site.bootstrap_args();
  if (args.size() < 2) {
    return false;
  }
  const auto* erased = boost::get<TypeConstant>(&args[0]);
  const auto* handle = boost::get<MethodHandleConstant>(&args[1]);
  if (erased == nullptr || handle == nullptr) {
    return false;
  }
  return handle->kind == REF_invokeStatic && handle->desc == target.desc &&
         erased->desc == target.desc;
}

std::unordered_set<std::string> find_lambda_implementations(
    const JavaClass& cls, const MethodTarget& target) {
  std::unordered_set<std::string> names;
  for (const auto& method : cls.get_methods()) {
    for (const auto& node : method->get_code()) {
      if (node.is_label() || !node.insn->has_call_site()) {
        continue;
      }
      const auto* call_site = node.insn->get_call_site();
      if (is_lambda_factory(*call_site, target)) {
        // The handle is resolved against this class only.
        const auto& args = call_site->bootstrap_args();
        names.insert(boost::get<MethodHandleConstant>(args[1]).name);
      }
    }
  }
  return names;
}

LambdaImplementationFilter::LambdaImplementationFilter(
    MethodTarget target, std::unordered_set<std::string> exempt)
    : m_target(std::move(target)), m_exempt(std::move(exempt)) {
  always_assert_type_log(
      descriptor::is_valid_method_descriptor(m_target.desc),
      AgentGuardError::INVALID_DESCRIPTOR, "Bad target descriptor %s",
      m_target.desc.c_str());
}

bool LambdaImplementationFilter::clean_lambda_implementations(
    JavaClass* tree) const {
  auto names = find_lambda_implementations(*tree, m_target);
  if (names.empty()) {
    return false;
  }
  bool cleaned = false;
  for (const auto& method : tree->get_methods()) {
    if (!method->has_code() || names.count(method->get_name()) == 0 ||
        method->get_desc() != m_target.desc) {
      continue;
    }
    try {
      Transformer::empty_method(method.get());
    } catch (const agentguard::InvalidDescriptorException& e) {
      TRACE(DETECT, 2, "Leaving %s: %s", SHOW(method.get()), e.what());
      continue;
    }
    TRACE(DETECT, 2, "Emptied lambda implementation %s", SHOW(method.get()));
    // The class needs rewriting even if nothing else about it matches.
    cleaned = true;
  }
  return cleaned;
}

bool LambdaImplementationFilter::implements_target(const RuntimeClass* cls,
                                                   JavaClass* tree) const {
  const auto& name = cls != nullptr ? cls->name() : tree->get_name();
  if (name == m_target.owner) {
    return false;
  }
  if (tree != nullptr) {
    return tree->implements_directly(m_target.owner) ||
           tree->has_capability(m_target.owner);
  }
  return cls->is_assignable_to(m_target.owner);
}

bool LambdaImplementationFilter::operator()(const RuntimeClass* cls,
                                            JavaClass* tree) const {
  if (cls == nullptr && tree == nullptr) {
    return false;
  }
  const auto& name = cls != nullptr ? cls->name() : tree->get_name();
  if (m_exempt.count(name)) {
    return false;
  }
  bool needs_update = false;
  if (tree != nullptr) {
    needs_update = clean_lambda_implementations(tree);
  }
  return needs_update || implements_target(cls, tree);
}

bool ExactMethodFilter::operator()(const RuntimeClass* cls,
                                   JavaClass* tree) const {
  if (cls != nullptr) {
    return cls->name() == m_target.owner;
  }
  return tree != nullptr && tree->get_name() == m_target.owner;
}

namespace rules {

AnyTransformer lambda_cleaner(const MethodTarget& target,
                              const std::unordered_set<std::string>& exempt) {
  return TransformerBuilder()
      .with_class_filter(LambdaImplementationFilter(target, exempt))
      .with_method_filter(
          [target](const JavaMethod& method) { return target.matches(method); })
      .transformer(Transformer::cleaner())
      .build();
}

AnyTransformer method_cleaner(const MethodTarget& target) {
  return TransformerBuilder()
      .with_class_filter(ExactMethodFilter(target))
      .with_method_filter(
          [target](const JavaMethod& method) { return target.matches(method); })
      .transformer(Transformer::cleaner())
      .build();
}

} // namespace rules
