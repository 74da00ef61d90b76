/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "FilteredTransformer.h"
#include "JsonWrapper.h"

/*
 * A named, configurable recipe for one registered transformer.
 */
class Rule {
 public:
  explicit Rule(std::string name) : m_name(std::move(name)) {}
  virtual ~Rule() = default;

  const std::string& name() const { return m_name; }

  /*
   * Reads the rule's options from its own section of the configuration,
   * which is empty when the document has none.
   */
  virtual void bind_config(const JsonWrapper& /* config */) {}

  virtual AnyTransformer build() const = 0;

 private:
  std::string m_name;
};

/**
 * Global registry of rules, by name. The built-in rules are registered when
 * the registry is first used.
 */
struct RuleRegistry {
  using Factory = std::function<std::unique_ptr<Rule>()>;

  /**
   * Get the global registry object.
   */
  static RuleRegistry& get();

  void register_rule(const std::string& name, Factory factory);

  bool contains(const std::string& name) const {
    return m_factories.count(name) != 0;
  }

  /**
   * A fresh, unconfigured instance of the named rule. Unknown names raise
   * INVALID_CONFIG.
   */
  std::unique_ptr<Rule> create(const std::string& name) const;

  std::vector<std::string> get_names() const;

 private:
  RuleRegistry();
  RuleRegistry(const RuleRegistry&) = delete;

  std::map<std::string, Factory> m_factories;
};
