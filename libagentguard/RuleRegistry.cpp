/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "RuleRegistry.h"

#include "BuiltinRules.h"
#include "Debug.h"

RuleRegistry::RuleRegistry() { register_builtin_rules(*this); }

RuleRegistry& RuleRegistry::get() {
  static RuleRegistry registry;
  return registry;
}

void RuleRegistry::register_rule(const std::string& name, Factory factory) {
  always_assert_log(!contains(name), "Rule %s registered twice", name.c_str());
  m_factories.emplace(name, std::move(factory));
}

std::unique_ptr<Rule> RuleRegistry::create(const std::string& name) const {
  auto it = m_factories.find(name);
  if (it == m_factories.end()) {
    throw_typed(AgentGuardError::INVALID_CONFIG, "Unknown rule " + name);
  }
  auto rule = it->second();
  always_assert(rule != nullptr && rule->name() == name);
  return rule;
}

std::vector<std::string> RuleRegistry::get_names() const {
  std::vector<std::string> names;
  names.reserve(m_factories.size());
  for (const auto& entry : m_factories) {
    names.push_back(entry.first);
  }
  return names;
}
