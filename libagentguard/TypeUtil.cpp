/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "TypeUtil.h"

#include <algorithm>

#include "Debug.h"

namespace descriptor {

DataType data_type(std::string_view desc) {
  always_assert_type_log(!desc.empty(), AgentGuardError::INVALID_DESCRIPTOR,
                         "Empty type descriptor");
  switch (desc[0]) {
  case 'V':
    return DataType::Void;
  case 'Z':
    return DataType::Boolean;
  case 'B':
    return DataType::Byte;
  case 'S':
    return DataType::Short;
  case 'C':
    return DataType::Char;
  case 'I':
    return DataType::Int;
  case 'J':
    return DataType::Long;
  case 'F':
    return DataType::Float;
  case 'D':
    return DataType::Double;
  case 'L':
    return DataType::Object;
  case '[':
    return DataType::Array;
  case '(':
    return DataType::Method;
  default:
    always_assert_type_log(false, AgentGuardError::INVALID_DESCRIPTOR,
                           "Invalid type descriptor '%.*s'", (int)desc.size(),
                           desc.data());
    UNREACHABLE();
  }
}

std::string_view parse_type(std::string_view& desc) {
  always_assert_type_log(!desc.empty(), AgentGuardError::INVALID_DESCRIPTOR,
                         "Invalid empty parse-type");
  size_t depth = 0;
  while (depth < desc.size() && desc[depth] == '[') {
    ++depth;
  }
  always_assert_type_log(depth < desc.size(),
                         AgentGuardError::INVALID_DESCRIPTOR,
                         "Could not parse array type, no element type");
  size_t end;
  switch (desc[depth]) {
  case 'Z':
  case 'B':
  case 'S':
  case 'C':
  case 'I':
  case 'J':
  case 'F':
  case 'D':
    end = depth + 1;
    break;
  case 'L': {
    auto semi = desc.find(';', depth);
    always_assert_type_log(
        semi != std::string_view::npos && semi > depth + 1,
        AgentGuardError::INVALID_DESCRIPTOR,
        "Could not parse reference type, no suffix semicolon");
    end = semi + 1;
    break;
  }
  default:
    always_assert_type_log(false, AgentGuardError::INVALID_DESCRIPTOR,
                           "Invalid parse-type '%c'", desc[depth]);
    UNREACHABLE();
  }
  auto ret = desc.substr(0, end);
  desc = desc.substr(end);
  return ret;
}

std::string_view return_type(std::string_view method_desc) {
  auto close = method_desc.find(')');
  always_assert_type_log(!method_desc.empty() && method_desc[0] == '(' &&
                             close != std::string_view::npos,
                         AgentGuardError::INVALID_DESCRIPTOR,
                         "Invalid method descriptor '%.*s'",
                         (int)method_desc.size(), method_desc.data());
  return method_desc.substr(close + 1);
}

DataType return_data_type(std::string_view method_desc) {
  return data_type(return_type(method_desc));
}

std::vector<std::string> argument_types(std::string_view method_desc) {
  always_assert_type_log(!method_desc.empty() && method_desc[0] == '(',
                         AgentGuardError::INVALID_DESCRIPTOR,
                         "Invalid argument list without open-close-parens");
  std::vector<std::string> args;
  auto buf = method_desc.substr(1);
  while (!buf.empty() && buf[0] != ')') {
    args.emplace_back(parse_type(buf));
  }
  always_assert_type_log(!buf.empty(), AgentGuardError::INVALID_DESCRIPTOR,
                         "Missing close parens");
  return args;
}

uint16_t argument_slots(std::string_view method_desc) {
  uint16_t slots = 0;
  for (const auto& arg : argument_types(method_desc)) {
    slots += slot_size(data_type(arg));
  }
  return slots;
}

uint16_t slot_size(DataType type) {
  switch (type) {
  case DataType::Void:
    return 0;
  case DataType::Long:
  case DataType::Double:
    return 2;
  case DataType::Method:
    always_assert_type_log(false, AgentGuardError::INVALID_DESCRIPTOR,
                           "A method type has no slot size");
    UNREACHABLE();
  default:
    return 1;
  }
}

bool is_wide(DataType type) {
  return type == DataType::Long || type == DataType::Double;
}

bool is_valid_method_descriptor(std::string_view method_desc) {
  try {
    argument_types(method_desc);
    auto ret = return_type(method_desc);
    if (ret == "V") {
      return true;
    }
    auto rest = ret;
    parse_type(rest);
    return rest.empty();
  } catch (const agentguard::InvalidDescriptorException&) {
    return false;
  } catch (const AgentGuardException& e) {
    if (e.type == AgentGuardError::INVALID_DESCRIPTOR) {
      return false;
    }
    throw;
  }
}

std::string object_descriptor(std::string_view internal_name) {
  std::string desc;
  desc.reserve(internal_name.size() + 2);
  desc += 'L';
  desc += internal_name;
  desc += ';';
  return desc;
}

std::string method_descriptor(const std::string& return_type,
                              const std::vector<std::string>& argument_types) {
  std::string desc = "(";
  for (const auto& arg : argument_types) {
    desc += arg;
  }
  desc += ')';
  desc += return_type;
  return desc;
}

std::string internal_name(std::string_view name) {
  std::string ret(name);
  std::replace(ret.begin(), ret.end(), '.', '/');
  return ret;
}

} // namespace descriptor
