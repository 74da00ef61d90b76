/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "JavaClass.h"

/*
 * A unit of rewrite logic applied to one method body, instruction by
 * instruction.
 *
 * Transformers are shared across classes and across the loader threads
 * calling the pre-load hook, so transform() must not keep per-class state.
 */
class Transformer {
 public:
  explicit Transformer(std::string name) : m_name(std::move(name)) {}
  virtual ~Transformer() = default;

  /*
   * Inspect `insn`, a node of `code` (the body of `method`), and optionally
   * mutate `code` around it. Return true to stop processing `method`.
   */
  virtual bool transform(JavaMethod* method,
                         InsnList& code,
                         InsnNode* insn) const = 0;

  /*
   * Calls transform() on each node of a snapshot of the method's body, in
   * order, until one call asks to stop. Nodes removed by earlier calls are
   * still visited. Returns true if processing was stopped.
   */
  bool process(JavaMethod* method) const;

  const std::string& name() const { return m_name; }

  /*
   * Replaces the body of `method` with a default-value return for its
   * descriptor and drops its handler ranges, local variable tables, line
   * numbers and declared exceptions. Throws INVALID_DESCRIPTOR, leaving the
   * method untouched, if the return type cannot be classified.
   */
  static void empty_method(JavaMethod* method);

  /*
   * The instructions returning a default value of the return type of
   * `method_desc`: nothing pushed for void, zero for primitives, null for
   * references.
   */
  static std::vector<std::unique_ptr<JvmInstruction>> generate_return(
      const std::string& method_desc);

  /*
   * Empties the whole method on the first instruction it sees, then stops.
   */
  static std::shared_ptr<const Transformer> cleaner();

 private:
  std::string m_name;
};

/*
 * A Transformer backed by a function, for rules that need no state.
 */
class FunctionTransformer : public Transformer {
 public:
  using Fn = std::function<bool(JavaMethod*, InsnList&, InsnNode*)>;

  FunctionTransformer(std::string name, Fn fn)
      : Transformer(std::move(name)), m_fn(std::move(fn)) {}

  bool transform(JavaMethod* method,
                 InsnList& code,
                 InsnNode* insn) const override {
    return m_fn(method, code, insn);
  }

 private:
  Fn m_fn;
};
