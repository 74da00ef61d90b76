/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <boost/variant.hpp>
#include <functional>
#include <memory>
#include <string>

#include "Instrumentation.h"
#include "Transformer.h"

/*
 * Class admissibility. `cls` is null on the pre-load path of a class that
 * is not being redefined; `tree` is null during the cheap first pass of the
 * already-loaded sweep. Either may be absent and predicates must cope.
 */
using ClassPredicate =
    std::function<bool(const RuntimeClass* cls, JavaClass* tree)>;

using MethodPredicate = std::function<bool(const JavaMethod& method)>;

/*
 * A registered transformer that applies to every class and method.
 */
class UnfilteredTransformer {
 public:
  explicit UnfilteredTransformer(std::shared_ptr<const Transformer> delegate);

  const Transformer& delegate() const { return *m_delegate; }

 private:
  std::shared_ptr<const Transformer> m_delegate;
};

/*
 * A registered transformer gated by class and method predicates, evaluated
 * by the caller before the delegate is run. A missing predicate accepts
 * everything.
 */
class FilteredTransformer {
 public:
  FilteredTransformer(std::shared_ptr<const Transformer> delegate,
                      ClassPredicate class_filter,
                      MethodPredicate method_filter);

  const Transformer& delegate() const { return *m_delegate; }

  bool validate_class(const RuntimeClass* cls, JavaClass* tree) const;
  bool validate_method(const JavaMethod& method) const;

 private:
  std::shared_ptr<const Transformer> m_delegate;
  ClassPredicate m_class_filter;
  MethodPredicate m_method_filter;
};

using AnyTransformer = boost::variant<UnfilteredTransformer, FilteredTransformer>;

namespace transformers {

bool is_filtered(const AnyTransformer& t);

const Transformer& delegate(const AnyTransformer& t);

// True for unfiltered transformers.
bool validate_class(const AnyTransformer& t,
                    const RuntimeClass* cls,
                    JavaClass* tree);
bool validate_method(const AnyTransformer& t, const JavaMethod& method);

bool process(const AnyTransformer& t, JavaMethod* method);

} // namespace transformers

/*
 * Composes a delegate with optional predicates. build() yields a
 * FilteredTransformer if any predicate was set, otherwise an
 * UnfilteredTransformer that forwards straight to the delegate.
 */
class TransformerBuilder {
 public:
  TransformerBuilder& with_class_filter(ClassPredicate filter);
  TransformerBuilder& with_method_filter(MethodPredicate filter);
  TransformerBuilder& transformer(std::shared_ptr<const Transformer> delegate);

  AnyTransformer build() const;

 private:
  bool m_filtered{false};
  ClassPredicate m_class_filter;
  MethodPredicate m_method_filter;
  std::shared_ptr<const Transformer> m_delegate;
};
