/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <map>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

enum AgentGuardError {
  INTERNAL_ERROR = 1,
  GENERIC_ASSERTION_ERROR = 2,
  BUFFER_END_EXCEEDED = 3,
  INVALID_JAVA = 4,
  // Malformed return-type encoding in a method descriptor.
  INVALID_DESCRIPTOR = 5,
  // Class bytes are unavailable or cannot be parsed.
  UNREADABLE_CLASS = 6,
  // Rewritten code the writer cannot encode (e.g. it would need frames).
  UNSUPPORTED_CODE = 7,
  INVALID_CONFIG = 8,
  MAX = 8,
};

class AgentGuardException : public std::exception {
 public:
  const AgentGuardError type;
  const std::string message;
  const std::map<std::string, std::string> extra_info;

  explicit AgentGuardException(
      AgentGuardError type_of_error,
      const std::string& message = "",
      const std::map<std::string, std::string>& extra_info = {});

  const char* what() const noexcept override;

 private:
  std::string m_msg;
};

namespace agentguard {

class BufferEndExceededException : public AgentGuardException {
 public:
  explicit BufferEndExceededException(
      const std::string& message,
      const std::map<std::string, std::string>& extra_info = {})
      : AgentGuardException(AgentGuardError::BUFFER_END_EXCEEDED,
                            message,
                            extra_info) {}
};

class InvalidJavaException : public AgentGuardException {
 public:
  explicit InvalidJavaException(
      const std::string& message,
      const std::map<std::string, std::string>& extra_info = {})
      : AgentGuardException(AgentGuardError::INVALID_JAVA, message, extra_info) {
  }
};

class InvalidDescriptorException : public AgentGuardException {
 public:
  explicit InvalidDescriptorException(
      const std::string& message,
      const std::map<std::string, std::string>& extra_info = {})
      : AgentGuardException(AgentGuardError::INVALID_DESCRIPTOR,
                            message,
                            extra_info) {}
};

class UnreadableClassException : public AgentGuardException {
 public:
  explicit UnreadableClassException(
      const std::string& message,
      const std::map<std::string, std::string>& extra_info = {})
      : AgentGuardException(AgentGuardError::UNREADABLE_CLASS,
                            message,
                            extra_info) {}
};

class UnsupportedCodeException : public AgentGuardException {
 public:
  explicit UnsupportedCodeException(
      const std::string& message,
      const std::map<std::string, std::string>& extra_info = {})
      : AgentGuardException(AgentGuardError::UNSUPPORTED_CODE,
                            message,
                            extra_info) {}
};

class InvalidConfigException : public AgentGuardException {
 public:
  explicit InvalidConfigException(
      const std::string& message,
      const std::map<std::string, std::string>& extra_info = {})
      : AgentGuardException(AgentGuardError::INVALID_CONFIG,
                            message,
                            extra_info) {}
};

/*
 * Whether failed assertions throw the typed subclasses above instead of a
 * plain AgentGuardException. On by default: callers catch the typed ones to
 * tell an unreadable class from an invalid descriptor.
 */
bool throw_typed_exception();
void set_throw_typed_exception(bool value);

} // namespace agentguard

// True if the error means the class bytes could not be turned into a tree.
bool is_unreadable_class_error(AgentGuardError type);

void assert_or_throw(
    bool cond,
    AgentGuardError type = AgentGuardError::GENERIC_ASSERTION_ERROR,
    const std::string& message = "",
    const std::map<std::string, std::string>& extra_info = {});

[[noreturn]] void throw_typed(
    AgentGuardError type,
    const std::string& message,
    const std::map<std::string, std::string>& extra_info = {});
