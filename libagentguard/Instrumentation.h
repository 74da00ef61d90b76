/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <boost/optional.hpp>
#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

/*
 * The host runtime's view of a class: its nominal identity, not its bytes.
 */
class RuntimeClass {
 public:
  explicit RuntimeClass(std::string name,
                        std::unordered_set<std::string> assignable_types = {},
                        std::string loader = "",
                        bool modifiable = true)
      : m_name(std::move(name)),
        m_assignable_types(std::move(assignable_types)),
        m_loader(std::move(loader)),
        m_modifiable(modifiable) {}

  // Internal name, e.g. "java/lang/Thread".
  const std::string& name() const { return m_name; }
  const std::string& loader() const { return m_loader; }
  bool is_modifiable() const { return m_modifiable; }

  // Every supertype and interface, direct or inherited.
  const std::unordered_set<std::string>& assignable_types() const {
    return m_assignable_types;
  }
  bool is_assignable_to(const std::string& type) const {
    return type == m_name || m_assignable_types.count(type) != 0;
  }

  // Bytes the host can hand over directly; otherwise they are looked up by
  // name.
  const boost::optional<std::vector<uint8_t>>& class_bytes() const {
    return m_class_bytes;
  }
  void set_class_bytes(std::vector<uint8_t> bytes) {
    m_class_bytes = std::move(bytes);
  }

 private:
  std::string m_name;
  std::unordered_set<std::string> m_assignable_types;
  std::string m_loader;
  bool m_modifiable;
  boost::optional<std::vector<uint8_t>> m_class_bytes;
};

struct LoadHookResult {
  enum Status {
    // Define the class from the original bytes.
    NO_CHANGE,
    // Define the class from `bytes`.
    REPLACED,
    // Rewriting failed; the class is defined from the original bytes and
    // `error` says why.
    FAILED,
  };

  Status status{NO_CHANGE};
  std::vector<uint8_t> bytes;
  std::string error;

  static LoadHookResult no_change() { return LoadHookResult(); }
  static LoadHookResult replaced(std::vector<uint8_t> bytes) {
    LoadHookResult result;
    result.status = REPLACED;
    result.bytes = std::move(bytes);
    return result;
  }
  static LoadHookResult failed(std::string error) {
    LoadHookResult result;
    result.status = FAILED;
    result.error = std::move(error);
    return result;
  }
};

struct ClassDefinition {
  const RuntimeClass* cls;
  std::vector<uint8_t> bytes;
};

/*
 * Called by the host before a class is defined, or while it is being
 * redefined. `class_name` is null for classes without a name;
 * `class_being_redefined` is null on first definition.
 */
class ClassFileHook {
 public:
  virtual ~ClassFileHook() = default;

  virtual LoadHookResult transform(const std::string& loader,
                                   const char* class_name,
                                   const RuntimeClass* class_being_redefined,
                                   const uint8_t* class_bytes,
                                   size_t size) = 0;
};

/*
 * The host's load hook and redefinition facility.
 */
class Instrumentation {
 public:
  virtual ~Instrumentation() = default;

  virtual void add_transformer(ClassFileHook* hook) = 0;
  virtual bool is_redefine_classes_supported() const = 0;
  virtual std::vector<const RuntimeClass*> get_all_loaded_classes() const = 0;
  virtual bool is_modifiable_class(const RuntimeClass& cls) const = 0;
  // Never called with an empty batch.
  virtual void redefine_classes(const std::vector<ClassDefinition>& batch) = 0;
};
