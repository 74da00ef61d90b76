/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <unordered_set>

#include "FilteredTransformer.h"

/*
 * A method named by owner, name and descriptor. For interface targets the
 * owner is the interface.
 */
struct MethodTarget {
  std::string owner;
  std::string name;
  std::string desc;

  bool matches(const JavaMethod& method) const {
    return method.get_name() == name && method.get_desc() == desc;
  }
};

/*
 * Tags `tree` with every interface it is known to implement: its declared
 * interfaces and, when the host supplied `cls`, every type `cls` is
 * assignable to.
 */
void add_capabilities(JavaClass* tree, const RuntimeClass* cls);

/*
 * Whether `call_site` is a lambda factory producing an implementation of
 * `target`: typed `()L<owner>;`, named like the target method, with a
 * static method handle of the target's descriptor as its second bootstrap
 * constant. Call sites with missing or mistyped constants never match.
 */
bool is_lambda_factory(const DynamicCallSite& call_site,
                       const MethodTarget& target);

/*
 * Names of the methods of `cls` that some lambda factory in `cls` binds as
 * an implementation of `target`.
 */
std::unordered_set<std::string> find_lambda_implementations(
    const JavaClass& cls, const MethodTarget& target);

/*
 * Class predicate for classes that implement the target interface, either
 * as declared or as known to the host, or that carry lambda implementations
 * of its method. The lambda bodies are emptied as soon as they are found.
 *
 * Classes named in `exempt` are neither scanned nor accepted. The interface
 * itself is never accepted.
 */
class LambdaImplementationFilter {
 public:
  LambdaImplementationFilter(MethodTarget target,
                             std::unordered_set<std::string> exempt = {});

  bool operator()(const RuntimeClass* cls, JavaClass* tree) const;

  const MethodTarget& target() const { return m_target; }

 private:
  bool clean_lambda_implementations(JavaClass* tree) const;
  bool implements_target(const RuntimeClass* cls, JavaClass* tree) const;

  MethodTarget m_target;
  std::unordered_set<std::string> m_exempt;
};

/*
 * Class predicate accepting the one class owning `target`. The runtime name
 * wins over the tree's when both are known.
 */
class ExactMethodFilter {
 public:
  explicit ExactMethodFilter(MethodTarget target)
      : m_target(std::move(target)) {}

  bool operator()(const RuntimeClass* cls, JavaClass* tree) const;

  const MethodTarget& target() const { return m_target; }

 private:
  MethodTarget m_target;
};

namespace rules {

// Empties `target` wherever it is implemented, lambdas included.
AnyTransformer lambda_cleaner(const MethodTarget& target,
                              const std::unordered_set<std::string>& exempt);

// Empties exactly `target`.
AnyTransformer method_cleaner(const MethodTarget& target);

} // namespace rules
