/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include "DetectionRules.h"

struct RuleRegistry;

namespace builtin {

constexpr const char* kClassFileTransformerCleaner =
    "ClassFileTransformerCleaner";
constexpr const char* kThreadDumpStackCleaner = "ThreadDumpStackCleaner";
constexpr const char* kMethodCleaner = "MethodCleaner";
constexpr const char* kLambdaCleaner = "LambdaCleaner";

// java.lang.instrument.ClassFileTransformer#transform
const MethodTarget& class_file_transformer_target();

// java.lang.Thread#dumpStack
const MethodTarget& thread_dump_stack_target();

} // namespace builtin

void register_builtin_rules(RuleRegistry& registry);
