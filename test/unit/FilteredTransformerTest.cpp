/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "FilteredTransformer.h"

#include <gtest/gtest.h>

#include "AgentGuardTest.h"
#include "Show.h"

using namespace agentguard_test;

class FilteredTransformerTest : public AgentGuardTest {};

TEST_F(FilteredTransformerTest, builderWithoutPredicatesIsUnfiltered) {
  auto t = TransformerBuilder().transformer(Transformer::cleaner()).build();
  EXPECT_FALSE(transformers::is_filtered(t));
  EXPECT_EQ(&transformers::delegate(t), Transformer::cleaner().get());

  ClassCreator cc("com/acme/Foo");
  auto* method = add_busy_method(cc.get_class(), ACC_PUBLIC, "get", "()I");
  RuntimeClass rt("com/acme/Foo");
  EXPECT_TRUE(transformers::validate_class(t, nullptr, nullptr));
  EXPECT_TRUE(transformers::validate_class(t, &rt, cc.get_class()));
  EXPECT_TRUE(transformers::validate_method(t, *method));
}

TEST_F(FilteredTransformerTest, unfilteredHasSameEffectAsDelegate) {
  ClassCreator cc("com/acme/Foo");
  auto* a = add_busy_method(cc.get_class(), ACC_PUBLIC, "a", "()F");
  auto* b = add_busy_method(cc.get_class(), ACC_PUBLIC, "b", "()F");

  auto t = TransformerBuilder().transformer(Transformer::cleaner()).build();
  EXPECT_EQ(transformers::process(t, a), Transformer::cleaner()->process(b));
  a->get_code().purge_removed();
  b->get_code().purge_removed();
  EXPECT_EQ(show(a->get_code()), show(b->get_code()));
}

TEST_F(FilteredTransformerTest, missingPredicateAcceptsEverything) {
  auto class_only = TransformerBuilder()
                        .with_class_filter([](const RuntimeClass*, JavaClass*) {
                          return false;
                        })
                        .transformer(Transformer::cleaner())
                        .build();
  auto method_only = TransformerBuilder()
                         .with_method_filter(
                             [](const JavaMethod&) { return false; })
                         .transformer(Transformer::cleaner())
                         .build();
  EXPECT_TRUE(transformers::is_filtered(class_only));
  EXPECT_TRUE(transformers::is_filtered(method_only));

  ClassCreator cc("com/acme/Foo");
  auto* method = add_busy_method(cc.get_class(), ACC_PUBLIC, "run", "()V");
  EXPECT_FALSE(transformers::validate_class(class_only, nullptr, nullptr));
  EXPECT_TRUE(transformers::validate_method(class_only, *method));
  EXPECT_TRUE(transformers::validate_class(method_only, nullptr, nullptr));
  EXPECT_FALSE(transformers::validate_method(method_only, *method));
}

TEST_F(FilteredTransformerTest, predicatesSeeTheirArguments) {
  const RuntimeClass* seen_cls = nullptr;
  JavaClass* seen_tree = nullptr;
  auto t = TransformerBuilder()
               .with_class_filter([&](const RuntimeClass* cls, JavaClass* tree) {
                 seen_cls = cls;
                 seen_tree = tree;
                 return tree != nullptr;
               })
               .with_method_filter([](const JavaMethod& m) {
                 return m.get_name() == "keep";
               })
               .transformer(Transformer::cleaner())
               .build();

  ClassCreator cc("com/acme/Foo");
  auto* keep = add_busy_method(cc.get_class(), ACC_PUBLIC, "keep", "()V");
  auto* other = add_busy_method(cc.get_class(), ACC_PUBLIC, "other", "()V");
  RuntimeClass rt("com/acme/Foo");

  EXPECT_FALSE(transformers::validate_class(t, &rt, nullptr));
  EXPECT_EQ(seen_cls, &rt);
  EXPECT_EQ(seen_tree, nullptr);
  EXPECT_TRUE(transformers::validate_class(t, nullptr, cc.get_class()));
  EXPECT_EQ(seen_cls, nullptr);
  EXPECT_EQ(seen_tree, cc.get_class());

  EXPECT_TRUE(transformers::validate_method(t, *keep));
  EXPECT_FALSE(transformers::validate_method(t, *other));
}

TEST_F(FilteredTransformerTest, buildWithoutDelegateFails) {
  EXPECT_THROW(TransformerBuilder().build(), AgentGuardException);
}
