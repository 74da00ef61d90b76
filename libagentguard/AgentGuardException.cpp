/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "AgentGuardException.h"

#include <atomic>

#include "Debug.h"

namespace {

std::atomic<bool> s_throw_typed_exception{true};

} // namespace

AgentGuardException::AgentGuardException(
    AgentGuardError type_of_error,
    const std::string& message,
    const std::map<std::string, std::string>& extra_info)
    : type(type_of_error), message(message), extra_info(extra_info) {

  std::ostringstream oss;
  if (type_of_error != AgentGuardError::GENERIC_ASSERTION_ERROR) {
    oss << "AgentGuardError: " << type << " with message: ";
  }
  oss << message;
  if (!extra_info.empty()) {
    oss << " with extra info:";
    for (auto it = extra_info.begin(); it != extra_info.end(); it++) {
      oss << " (\"" << it->first << "\", \"" << it->second << "\")";
    }
  }
  m_msg = oss.str();
}

const char* AgentGuardException::what() const noexcept {
  return m_msg.c_str();
}

namespace agentguard {

bool throw_typed_exception() { return s_throw_typed_exception.load(); }

void set_throw_typed_exception(bool value) {
  s_throw_typed_exception.store(value);
}

} // namespace agentguard

bool is_unreadable_class_error(AgentGuardError type) {
  switch (type) {
  case AgentGuardError::UNREADABLE_CLASS:
  case AgentGuardError::INVALID_JAVA:
  case AgentGuardError::BUFFER_END_EXCEEDED:
    return true;
  default:
    return false;
  }
}

void throw_typed(AgentGuardError type,
                 const std::string& message,
                 const std::map<std::string, std::string>& extra_info) {
  if (agentguard::throw_typed_exception()) {
    switch (type) {
    case AgentGuardError::BUFFER_END_EXCEEDED:
      throw agentguard::BufferEndExceededException(message, extra_info);
    case AgentGuardError::INVALID_JAVA:
      throw agentguard::InvalidJavaException(message, extra_info);
    case AgentGuardError::INVALID_DESCRIPTOR:
      throw agentguard::InvalidDescriptorException(message, extra_info);
    case AgentGuardError::UNREADABLE_CLASS:
      throw agentguard::UnreadableClassException(message, extra_info);
    case AgentGuardError::UNSUPPORTED_CODE:
      throw agentguard::UnsupportedCodeException(message, extra_info);
    case AgentGuardError::INVALID_CONFIG:
      throw agentguard::InvalidConfigException(message, extra_info);
    default:
      break;
    }
  }
  throw AgentGuardException(type, message, extra_info);
}

void assert_or_throw(bool cond,
                     AgentGuardError type,
                     const std::string& message,
                     const std::map<std::string, std::string>& extra_info) {
  if (!cond) {
    throw_typed(type, message, extra_info);
  }
}
