/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "JavaClass.h"

#include <algorithm>
#include <limits>

#include "Debug.h"

JavaMethod::JavaMethod(JavaClass* cls,
                       uint16_t access,
                       std::string name,
                       std::string desc)
    : m_class(cls),
      m_access(access),
      m_name(std::move(name)),
      m_desc(std::move(desc)) {
  always_assert(cls != nullptr);
}

JavaClass::JavaClass(std::string name, std::string super_name)
    : m_name(std::move(name)), m_super_name(std::move(super_name)) {}

bool JavaClass::implements_directly(const std::string& iface) const {
  return std::find(m_interfaces.begin(), m_interfaces.end(), iface) !=
         m_interfaces.end();
}

JavaMethod* JavaClass::add_method(std::unique_ptr<JavaMethod> method) {
  always_assert(method != nullptr && method->get_class() == this);
  always_assert_log(
      find_method(method->get_name(), method->get_desc()) == nullptr,
      "Duplicate method %s%s in %s", method->get_name().c_str(),
      method->get_desc().c_str(), m_name.c_str());
  m_methods.push_back(std::move(method));
  return m_methods.back().get();
}

JavaMethod* JavaClass::find_method(const std::string& name,
                                   const std::string& desc) const {
  for (const auto& method : m_methods) {
    if (method->get_name() == name && method->get_desc() == desc) {
      return method.get();
    }
  }
  return nullptr;
}

uint16_t JavaClass::add_bootstrap_method(BootstrapMethod bsm) {
  auto it = std::find(m_bootstrap_methods.begin(), m_bootstrap_methods.end(),
                      bsm);
  if (it != m_bootstrap_methods.end()) {
    return (uint16_t)(it - m_bootstrap_methods.begin());
  }
  always_assert_type_log(
      m_bootstrap_methods.size() < std::numeric_limits<uint16_t>::max(),
      AgentGuardError::UNSUPPORTED_CODE, "Too many bootstrap methods");
  m_bootstrap_methods.push_back(std::move(bsm));
  return (uint16_t)(m_bootstrap_methods.size() - 1);
}

bool JavaClass::is_modified() const {
  return std::any_of(m_methods.begin(), m_methods.end(),
                     [](const auto& m) { return m->is_modified(); });
}
