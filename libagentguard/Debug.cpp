/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "Debug.h"

#include <cstring>
#include <iostream>
#include <memory>
#include <stdarg.h>
#include <stdio.h>
#include <string>
#include <utility>

#include <boost/exception/all.hpp>
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wshadow"
#include <boost/stacktrace.hpp>
#pragma GCC diagnostic pop

#include "Trace.h"

namespace {

using StType = boost::stacktrace::stacktrace;

using traced = boost::error_info<struct tag_stacktrace, StType>;

std::string v_format2string(const char* fmt, va_list ap) {
  va_list backup;
  va_copy(backup, ap);
  size_t size = vsnprintf(nullptr, 0, fmt, ap);
  // size is the number of chars would had been written

  std::unique_ptr<char[]> buffer = std::make_unique<char[]>(size + 1);
  vsnprintf(buffer.get(), size + 1, fmt, backup);
  va_end(backup);
  std::string ret(buffer.get());
  return ret;
}

template <typename E>
[[noreturn]] void throw_traced(E&& e) {
  throw boost::enable_error_info(std::forward<E>(e)) << traced(StType());
}

} // namespace

std::string format2string(const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);

  auto ret = v_format2string(fmt, ap);
  va_end(ap);

  return ret;
}

void assert_fail(const char* expr,
                 const char* file,
                 unsigned line,
                 const char* func,
                 AgentGuardError type,
                 const char* fmt,
                 ...) {
  va_list ap;
  va_start(ap, fmt);
  std::string msg = format2string("%s:%u: %s: assertion `%s' failed.\n", file,
                                  line, func, expr);

  if (strcmp(fmt, " ") != 0) {
    msg += v_format2string(fmt, ap);
  }

  va_end(ap);

  TRACE(MAIN, 3, "%s", msg.c_str());

  if (agentguard::throw_typed_exception()) {
    switch (type) {
    case AgentGuardError::BUFFER_END_EXCEEDED:
      throw_traced(agentguard::BufferEndExceededException(msg));
    case AgentGuardError::INVALID_JAVA:
      throw_traced(agentguard::InvalidJavaException(msg));
    case AgentGuardError::INVALID_DESCRIPTOR:
      throw_traced(agentguard::InvalidDescriptorException(msg));
    case AgentGuardError::UNREADABLE_CLASS:
      throw_traced(agentguard::UnreadableClassException(msg));
    case AgentGuardError::UNSUPPORTED_CODE:
      throw_traced(agentguard::UnsupportedCodeException(msg));
    case AgentGuardError::INVALID_CONFIG:
      throw_traced(agentguard::InvalidConfigException(msg));
    default:
      break;
    }
  }
  throw_traced(AgentGuardException(type, msg));
}

void print_stack_trace(std::ostream& os, const std::exception& e) {
  const StType* st = boost::get_error_info<traced>(e);
  if (st) {
    os << *st << std::endl;
  }
}
