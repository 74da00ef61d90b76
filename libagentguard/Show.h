/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <string>

/*
 * Stringification functions for the class model, used in traces and test
 * failure messages.
 */
class ConstantPool;
class DynamicCallSite;
class InsnList;
class JavaClass;
class JavaMethod;
class JvmInstruction;
struct InsnNode;

// Resolves constant pool operands when `pool` is given.
std::string show(const JvmInstruction* insn,
                 const ConstantPool* pool = nullptr);
std::string show(const DynamicCallSite* call_site);
std::string show(const InsnList& code, const ConstantPool* pool = nullptr);
// "owner.name:desc"
std::string show(const JavaMethod* method);
std::string show(const JavaClass* cls);

// Access flags in source order, e.g. "public static final".
std::string vshow(uint16_t access, bool is_method = true);
// Header line plus the full instruction listing.
std::string vshow(const JavaMethod* method);

// SHOW(x) is syntax sugar for show(x).c_str()
#define SHOW(...) show(__VA_ARGS__).c_str()
