/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "AgentConfig.h"

#include <fstream>
#include <json/reader.h>
#include <json/value.h>

#include "AgentEngine.h"
#include "BuiltinRules.h"
#include "Debug.h"
#include "RuleRegistry.h"
#include "Trace.h"

namespace {

constexpr const char* kPreload = "preload";
constexpr const char* kRedefine = "redefine";

AnyTransformer build_rule(const std::string& name, const JsonWrapper& config) {
  auto rule = RuleRegistry::get().create(name);
  rule->bind_config(config);
  TRACE(CONFIG, 2, "Built rule %s", name.c_str());
  return rule->build();
}

} // namespace

AgentConfig::AgentConfig()
    : m_preload{builtin::kClassFileTransformerCleaner},
      m_redefine{builtin::kClassFileTransformerCleaner,
                 builtin::kThreadDumpStackCleaner} {}

AgentConfig::AgentConfig(const Json::Value& json) : m_json(json) {
  AgentConfig defaults;
  m_json.get(kPreload, defaults.m_preload, m_preload);
  m_json.get(kRedefine, defaults.m_redefine, m_redefine);

  const auto& registry = RuleRegistry::get();
  for (const auto& list : {m_preload, m_redefine}) {
    for (const auto& name : list) {
      assert_or_throw(registry.contains(name), AgentGuardError::INVALID_CONFIG,
                      "Unknown rule " + name);
    }
  }
  if (json.isObject()) {
    for (const auto& key : json.getMemberNames()) {
      if (key == kPreload || key == kRedefine) {
        continue;
      }
      assert_or_throw(registry.contains(key), AgentGuardError::INVALID_CONFIG,
                      "Options given for unknown rule " + key);
      // Type-checks the section.
      get_rule_config(key);
    }
  }
}

AgentConfig AgentConfig::load(const std::string& path) {
  std::ifstream input(path);
  assert_or_throw(input.good(), AgentGuardError::INVALID_CONFIG,
                  "Cannot open config file " + path);
  Json::Reader reader;
  Json::Value root;
  bool parsing_succeeded = reader.parse(input, root);
  assert_or_throw(parsing_succeeded, AgentGuardError::INVALID_CONFIG,
                  "Failed to parse config json from file " + path + "\n" +
                      reader.getFormattedErrorMessages());
  TRACE(CONFIG, 1, "Loaded config from %s", path.c_str());
  return AgentConfig(root);
}

JsonWrapper AgentConfig::get_rule_config(const std::string& rule) const {
  return m_json.get_object(rule.c_str());
}

void AgentConfig::apply(AgentEngine& engine) const {
  for (const auto& name : m_preload) {
    engine.add_preload_transformer(build_rule(name, get_rule_config(name)));
  }
  for (const auto& name : m_redefine) {
    engine.add_redefine_transformer(build_rule(name, get_rule_config(name)));
  }
}
