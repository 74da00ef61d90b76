/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "ConcurrentContainers.h"
#include "FilteredTransformer.h"
#include "Instrumentation.h"
#include "JarLoader.h"

struct EngineStats {
  size_t classes_seen{0};
  size_t classes_rewritten{0};
  size_t classes_unreadable{0};
  size_t classes_failed{0};
  size_t classes_redefined{0};
};

/*
 * Drives registered transformers over classes, both as the host's pre-load
 * hook and as a one-time sweep over the classes already loaded.
 *
 * The two registries are filled before arm() and are read-only afterwards,
 * so concurrent hook invocations iterate them without locking. Each hook
 * invocation works on its own class tree.
 */
class AgentEngine : public ClassFileHook {
 public:
  // `source` resolves class bytes by name when the host does not supply
  // them. It may be null.
  explicit AgentEngine(std::shared_ptr<const ClassSource> source = nullptr);

  void add_preload_transformer(AnyTransformer transformer);
  void add_redefine_transformer(AnyTransformer transformer);

  const std::vector<AnyTransformer>& get_preload_transformers() const {
    return m_preload;
  }
  const std::vector<AnyTransformer>& get_redefine_transformers() const {
    return m_redefine;
  }

  // Freezes the registries.
  void arm();
  bool is_armed() const { return m_armed; }

  /*
   * Arms the engine, installs it as the host's load hook and, if the host
   * can redefine classes, sweeps the classes already loaded.
   */
  void start(Instrumentation& inst);

  /*
   * Pre-load entry point. Classes without a name, unreadable classes and
   * classes no transformer accepts are left unchanged. Any other failure is
   * reported as FAILED; nothing is thrown.
   */
  LoadHookResult transform(const std::string& loader,
                           const char* class_name,
                           const RuntimeClass* class_being_redefined,
                           const uint8_t* class_bytes,
                           size_t size) override;

  /*
   * Rewrites every modifiable loaded class accepted by at least one
   * redefinition transformer and submits them as one batch. Unreadable or
   * unencodable classes are left out. Returns the size of the batch, which
   * is never submitted when empty.
   */
  size_t redefine_loaded_classes(Instrumentation& inst);

  /*
   * Applies `accepted` in order to every method of `tree` their method
   * predicates accept, then encodes the class.
   */
  std::vector<uint8_t> rewrite(
      JavaClass& tree, const std::vector<const AnyTransformer*>& accepted);

  /*
   * Names of the classes rewritten so far. Only recorded: a class may be
   * rewritten again, since different classes can share a name.
   */
  const ConcurrentSet<std::string>& get_processed_classes() const {
    return m_processed;
  }

  EngineStats get_stats() const;

 private:
  std::unique_ptr<JavaClass> read(const std::string& name,
                                  const RuntimeClass* cls,
                                  const uint8_t* class_bytes,
                                  size_t size) const;

  std::shared_ptr<const ClassSource> m_source;
  std::vector<AnyTransformer> m_preload;
  std::vector<AnyTransformer> m_redefine;
  bool m_armed{false};

  ConcurrentSet<std::string> m_processed;

  std::atomic<size_t> m_seen{0};
  std::atomic<size_t> m_rewritten{0};
  std::atomic<size_t> m_unreadable{0};
  std::atomic<size_t> m_failed{0};
  std::atomic<size_t> m_redefined{0};
};
