/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "Instrumentation.h"
#include "JarLoader.h"

/*
 * Every type `internal_name` is assignable to, found by walking superclasses
 * and interfaces through `source`. Types missing from `source` end the walk
 * along their branch.
 */
std::unordered_set<std::string> collect_assignable_types(
    const std::string& internal_name, const ClassSource& source);

/*
 * A host that has "loaded" a fixed set of classes and records the
 * redefinition batch instead of applying it.
 */
class OfflineInstrumentation : public Instrumentation {
 public:
  const RuntimeClass* add_loaded_class(std::unique_ptr<RuntimeClass> cls);

  void add_transformer(ClassFileHook* hook) override { m_hooks.push_back(hook); }
  bool is_redefine_classes_supported() const override { return true; }
  std::vector<const RuntimeClass*> get_all_loaded_classes() const override;
  bool is_modifiable_class(const RuntimeClass& cls) const override {
    return cls.is_modifiable();
  }
  void redefine_classes(const std::vector<ClassDefinition>& batch) override;

  const std::vector<ClassFileHook*>& get_hooks() const { return m_hooks; }
  const std::vector<ClassDefinition>& get_redefined() const {
    return m_redefined;
  }

 private:
  std::vector<std::unique_ptr<RuntimeClass>> m_classes;
  std::vector<ClassFileHook*> m_hooks;
  std::vector<ClassDefinition> m_redefined;
};
