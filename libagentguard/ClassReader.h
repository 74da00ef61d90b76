/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "JavaClass.h"

constexpr uint32_t kClassMagic = 0xcafebabe;

/*
 * Parses a class file into a JavaClass. Method bodies are decoded into
 * InsnLists with label nodes at every branch target and table boundary.
 * Malformed input raises INVALID_JAVA or BUFFER_END_EXCEEDED, which
 * is_unreadable_class_error() classifies as unreadable.
 */
std::unique_ptr<JavaClass> read_class(const uint8_t* buffer, size_t size);

inline std::unique_ptr<JavaClass> read_class(
    const std::vector<uint8_t>& bytes) {
  return read_class(bytes.data(), bytes.size());
}

/*
 * Resolves a pool constant into a bootstrap argument. Exposed for the writer
 * and tests.
 */
BootstrapConstant resolve_bootstrap_constant(const ConstantPool& pool,
                                             uint16_t index);
MethodHandleConstant resolve_method_handle(const ConstantPool& pool,
                                           uint16_t index);
