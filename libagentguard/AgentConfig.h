/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <vector>

#include "JsonWrapper.h"

class AgentEngine;

namespace Json {
class Value;
} // namespace Json

/*
 * Which rules an embedding program registers on each path, and their
 * options. The document looks like
 *
 *   {
 *     "preload": ["ClassFileTransformerCleaner"],
 *     "redefine": ["ClassFileTransformerCleaner", "ThreadDumpStackCleaner"],
 *     "ClassFileTransformerCleaner": {"exempt_classes": ["com/acme/Agent"]}
 *   }
 *
 * Every other top-level key must name a known rule.
 */
class AgentConfig {
 public:
  // The defaults: the transformer cleaner before loading, plus the
  // dump-stack cleaner on the sweep.
  AgentConfig();

  explicit AgentConfig(const Json::Value& json);

  // Raises INVALID_CONFIG if the file cannot be read or parsed.
  static AgentConfig load(const std::string& path);

  const std::vector<std::string>& get_preload_rules() const {
    return m_preload;
  }
  const std::vector<std::string>& get_redefine_rules() const {
    return m_redefine;
  }

  // The options section of `rule`; empty when there is none.
  JsonWrapper get_rule_config(const std::string& rule) const;

  /*
   * Builds every listed rule and registers it on the matching path of
   * `engine`, in order.
   */
  void apply(AgentEngine& engine) const;

 private:
  JsonWrapper m_json;
  std::vector<std::string> m_preload;
  std::vector<std::string> m_redefine;
};
