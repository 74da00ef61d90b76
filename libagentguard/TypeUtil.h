/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

/**
 * Basic datatypes of a JVM type descriptor. `Method` is what a nested
 * method descriptor classifies as; it is never a valid value type.
 */
enum class DataType : uint8_t {
  Void,
  Boolean,
  Byte,
  Short,
  Char,
  Int,
  Long,
  Float,
  Double,
  Object,
  Array,
  Method
};

namespace descriptor {

/**
 * Classify the type that starts at the beginning of `desc`. Throws
 * INVALID_DESCRIPTOR on anything that is not a type descriptor.
 */
DataType data_type(std::string_view desc);

/**
 * Consume one field type from the front of `desc` and return it.
 */
std::string_view parse_type(std::string_view& desc);

/**
 * The return type part of a method descriptor, e.g. "[B" for
 * "(Ljava/lang/String;)[B".
 */
std::string_view return_type(std::string_view method_desc);

DataType return_data_type(std::string_view method_desc);

std::vector<std::string> argument_types(std::string_view method_desc);

/**
 * Number of local variable slots taken by the arguments (long and double
 * take two).
 */
uint16_t argument_slots(std::string_view method_desc);

/**
 * Operand stack / local slots a value of this type occupies.
 */
uint16_t slot_size(DataType type);

bool is_wide(DataType type);

bool is_valid_method_descriptor(std::string_view method_desc);

// "java/lang/Thread" -> "Ljava/lang/Thread;"
std::string object_descriptor(std::string_view internal_name);

std::string method_descriptor(const std::string& return_type,
                              const std::vector<std::string>& argument_types);

// "java.lang.Thread" -> "java/lang/Thread"
std::string internal_name(std::string_view name);

} // namespace descriptor
