/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "AgentEngine.h"

#include "ClassReader.h"
#include "ClassWriter.h"
#include "Debug.h"
#include "DetectionRules.h"
#include "Show.h"
#include "Timer.h"
#include "Trace.h"

AgentEngine::AgentEngine(std::shared_ptr<const ClassSource> source)
    : m_source(std::move(source)) {}

void AgentEngine::add_preload_transformer(AnyTransformer transformer) {
  always_assert_log(!m_armed, "Cannot register %s on an armed engine",
                    transformers::delegate(transformer).name().c_str());
  m_preload.push_back(std::move(transformer));
}

void AgentEngine::add_redefine_transformer(AnyTransformer transformer) {
  always_assert_log(!m_armed, "Cannot register %s on an armed engine",
                    transformers::delegate(transformer).name().c_str());
  m_redefine.push_back(std::move(transformer));
}

void AgentEngine::arm() {
  m_armed = true;
  TRACE(ENGINE, 1, "Armed with %zu pre-load and %zu redefinition transformers",
        m_preload.size(), m_redefine.size());
}

void AgentEngine::start(Instrumentation& inst) {
  arm();
  inst.add_transformer(this);
  if (inst.is_redefine_classes_supported()) {
    redefine_loaded_classes(inst);
  } else {
    TRACE(ENGINE, 1, "Class redefinition unsupported, skipping the sweep");
  }
}

std::unique_ptr<JavaClass> AgentEngine::read(const std::string& name,
                                             const RuntimeClass* cls,
                                             const uint8_t* class_bytes,
                                             size_t size) const {
  std::unique_ptr<JavaClass> tree;
  if (class_bytes != nullptr && size > 0) {
    tree = read_class(class_bytes, size);
  } else if (cls != nullptr && cls->class_bytes()) {
    tree = read_class(*cls->class_bytes());
  } else {
    if (m_source == nullptr) {
      throw_typed(AgentGuardError::UNREADABLE_CLASS,
                  "No byte source for " + name);
    }
    tree = read_class(m_source->load(name));
  }
  add_capabilities(tree.get(), cls);
  return tree;
}

LoadHookResult AgentEngine::transform(const std::string& loader,
                                      const char* class_name,
                                      const RuntimeClass* class_being_redefined,
                                      const uint8_t* class_bytes,
                                      size_t size) {
  if (class_name == nullptr) {
    return LoadHookResult::no_change();
  }
  m_seen++;
  TRACE(ENGINE, 4, "Loading %s from '%s'", class_name, loader.c_str());

  std::unique_ptr<JavaClass> tree;
  try {
    tree = read(class_name, class_being_redefined, class_bytes, size);
  } catch (const AgentGuardException& e) {
    if (!is_unreadable_class_error(e.type)) {
      m_failed++;
      return LoadHookResult::failed(e.what());
    }
    TRACE(ENGINE, 2, "Cannot read %s: %s", class_name, e.what());
    m_unreadable++;
    return LoadHookResult::no_change();
  } catch (const std::exception& e) {
    m_failed++;
    return LoadHookResult::failed(e.what());
  }

  try {
    std::vector<const AnyTransformer*> accepted;
    for (const auto& transformer : m_preload) {
      if (transformers::validate_class(transformer, class_being_redefined,
                                       tree.get())) {
        accepted.push_back(&transformer);
      }
    }
    if (accepted.empty()) {
      return LoadHookResult::no_change();
    }
    auto bytes = rewrite(*tree, accepted);
    m_rewritten++;
    return LoadHookResult::replaced(std::move(bytes));
  } catch (const std::exception& e) {
    TRACE(ENGINE, 1, "Failed to rewrite %s: %s", class_name, e.what());
    m_failed++;
    return LoadHookResult::failed(e.what());
  }
}

size_t AgentEngine::redefine_loaded_classes(Instrumentation& inst) {
  if (!inst.is_redefine_classes_supported()) {
    return 0;
  }
  Timer t("Redefine loaded classes");
  std::vector<ClassDefinition> batch;
  for (const auto* cls : inst.get_all_loaded_classes()) {
    if (!inst.is_modifiable_class(*cls)) {
      TRACE(SWEEP, 5, "Skipping unmodifiable %s", cls->name().c_str());
      continue;
    }
    m_seen++;
    std::unique_ptr<JavaClass> tree;
    auto ensure_read = [&]() {
      if (tree == nullptr) {
        tree = read(cls->name(), cls, nullptr, 0);
      }
    };
    try {
      std::vector<const AnyTransformer*> accepted;
      for (const auto& transformer : m_redefine) {
        if (transformers::is_filtered(transformer)) {
          // Transient classes have no byte source: only read what might
          // match.
          if (!transformers::validate_class(transformer, cls, nullptr)) {
            continue;
          }
          ensure_read();
          if (!transformers::validate_class(transformer, cls, tree.get())) {
            continue;
          }
        }
        ensure_read();
        accepted.push_back(&transformer);
      }
      if (accepted.empty()) {
        continue;
      }
      batch.push_back(ClassDefinition{cls, rewrite(*tree, accepted)});
      m_rewritten++;
    } catch (const AgentGuardException& e) {
      if (is_unreadable_class_error(e.type)) {
        TRACE(SWEEP, 2, "Cannot read %s: %s", cls->name().c_str(), e.what());
        m_unreadable++;
      } else {
        TRACE(SWEEP, 1, "Failed to rewrite %s: %s", cls->name().c_str(),
              e.what());
        m_failed++;
      }
    } catch (const std::exception& e) {
      TRACE(SWEEP, 1, "Failed to rewrite %s: %s", cls->name().c_str(),
            e.what());
      m_failed++;
    }
  }

  if (batch.empty()) {
    TRACE(SWEEP, 1, "No loaded class needs redefinition");
    return 0;
  }
  TRACE(SWEEP, 1, "Redefining %zu loaded classes", batch.size());
  inst.redefine_classes(batch);
  m_redefined += batch.size();
  return batch.size();
}

std::vector<uint8_t> AgentEngine::rewrite(
    JavaClass& tree, const std::vector<const AnyTransformer*>& accepted) {
  for (const auto& method : tree.get_methods()) {
    if (!method->has_code()) {
      continue;
    }
    for (const auto* transformer : accepted) {
      if (!transformers::validate_method(*transformer, *method)) {
        continue;
      }
      try {
        transformers::process(*transformer, method.get());
      } catch (const agentguard::InvalidDescriptorException& e) {
        TRACE(XFORM, 2, "Skipping %s: %s", SHOW(method.get()), e.what());
      }
      method->get_code().purge_removed();
    }
  }
  auto bytes = write_class(tree);
  m_processed.insert(tree.get_name());
  TRACE(ENGINE, 3, "Rewrote %s with %zu transformers",
        tree.get_name().c_str(), accepted.size());
  return bytes;
}

EngineStats AgentEngine::get_stats() const {
  EngineStats stats;
  stats.classes_seen = m_seen;
  stats.classes_rewritten = m_rewritten;
  stats.classes_unreadable = m_unreadable;
  stats.classes_failed = m_failed;
  stats.classes_redefined = m_redefined;
  return stats;
}
