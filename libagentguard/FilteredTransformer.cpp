/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "FilteredTransformer.h"

#include "Debug.h"

UnfilteredTransformer::UnfilteredTransformer(
    std::shared_ptr<const Transformer> delegate)
    : m_delegate(std::move(delegate)) {
  always_assert(m_delegate != nullptr);
}

FilteredTransformer::FilteredTransformer(
    std::shared_ptr<const Transformer> delegate,
    ClassPredicate class_filter,
    MethodPredicate method_filter)
    : m_delegate(std::move(delegate)),
      m_class_filter(std::move(class_filter)),
      m_method_filter(std::move(method_filter)) {
  always_assert(m_delegate != nullptr);
}

bool FilteredTransformer::validate_class(const RuntimeClass* cls,
                                         JavaClass* tree) const {
  if (!m_class_filter) {
    return true;
  }
  return m_class_filter(cls, tree);
}

bool FilteredTransformer::validate_method(const JavaMethod& method) const {
  if (!m_method_filter) {
    return true;
  }
  return m_method_filter(method);
}

namespace transformers {

namespace {

struct DelegateOf : public boost::static_visitor<const Transformer&> {
  template <typename T>
  const Transformer& operator()(const T& t) const {
    return t.delegate();
  }
};

} // namespace

bool is_filtered(const AnyTransformer& t) {
  return boost::get<FilteredTransformer>(&t) != nullptr;
}

const Transformer& delegate(const AnyTransformer& t) {
  return boost::apply_visitor(DelegateOf(), t);
}

bool validate_class(const AnyTransformer& t,
                    const RuntimeClass* cls,
                    JavaClass* tree) {
  const auto* filtered = boost::get<FilteredTransformer>(&t);
  return filtered == nullptr || filtered->validate_class(cls, tree);
}

bool validate_method(const AnyTransformer& t, const JavaMethod& method) {
  const auto* filtered = boost::get<FilteredTransformer>(&t);
  return filtered == nullptr || filtered->validate_method(method);
}

bool process(const AnyTransformer& t, JavaMethod* method) {
  return delegate(t).process(method);
}

} // namespace transformers

TransformerBuilder& TransformerBuilder::with_class_filter(
    ClassPredicate filter) {
  m_class_filter = std::move(filter);
  m_filtered = true;
  return *this;
}

TransformerBuilder& TransformerBuilder::with_method_filter(
    MethodPredicate filter) {
  m_method_filter = std::move(filter);
  m_filtered = true;
  return *this;
}

TransformerBuilder& TransformerBuilder::transformer(
    std::shared_ptr<const Transformer> delegate) {
  m_delegate = std::move(delegate);
  return *this;
}

AnyTransformer TransformerBuilder::build() const {
  always_assert_log(m_delegate != nullptr,
                    "A transformer needs a delegate to build");
  if (m_filtered) {
    return FilteredTransformer(m_delegate, m_class_filter, m_method_filter);
  }
  return UnfilteredTransformer(m_delegate);
}
