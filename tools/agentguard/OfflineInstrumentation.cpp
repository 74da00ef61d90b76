/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "OfflineInstrumentation.h"

#include "ClassReader.h"
#include "Debug.h"
#include "Trace.h"

std::unordered_set<std::string> collect_assignable_types(
    const std::string& internal_name, const ClassSource& source) {
  std::unordered_set<std::string> types;
  std::vector<std::string> pending{internal_name};
  while (!pending.empty()) {
    auto name = pending.back();
    pending.pop_back();
    auto bytes = source.find(name);
    if (!bytes) {
      continue;
    }
    std::unique_ptr<JavaClass> cls;
    try {
      cls = read_class(*bytes);
    } catch (const AgentGuardException& e) {
      if (!is_unreadable_class_error(e.type)) {
        throw;
      }
      TRACE(MAIN, 2, "Cannot read supertype %s: %s", name.c_str(), e.what());
      continue;
    }
    auto visit = [&](const std::string& type) {
      if (!type.empty() && types.insert(type).second) {
        pending.push_back(type);
      }
    };
    visit(cls->get_super_name());
    for (const auto& iface : cls->get_interfaces()) {
      visit(iface);
    }
  }
  return types;
}

const RuntimeClass* OfflineInstrumentation::add_loaded_class(
    std::unique_ptr<RuntimeClass> cls) {
  m_classes.push_back(std::move(cls));
  return m_classes.back().get();
}

std::vector<const RuntimeClass*>
OfflineInstrumentation::get_all_loaded_classes() const {
  std::vector<const RuntimeClass*> classes;
  classes.reserve(m_classes.size());
  for (const auto& cls : m_classes) {
    classes.push_back(cls.get());
  }
  return classes;
}

void OfflineInstrumentation::redefine_classes(
    const std::vector<ClassDefinition>& batch) {
  always_assert_log(!batch.empty(), "Empty redefinition batch");
  m_redefined.insert(m_redefined.end(), batch.begin(), batch.end());
}
