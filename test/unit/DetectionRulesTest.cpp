/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "DetectionRules.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "AgentGuardTest.h"
#include "BuiltinRules.h"
#include "ClassReader.h"

using namespace agentguard_test;
using ::testing::UnorderedElementsAre;

namespace {

const MethodTarget& transformer_target() {
  return builtin::class_file_transformer_target();
}

bool is_emptied(const JavaMethod& method) {
  std::vector<JvmOpcode> ops;
  for (const auto& node : method.get_code()) {
    if (!node.is_label()) {
      ops.push_back(node.insn->opcode());
    }
  }
  return ops == std::vector<JvmOpcode>({OPCODE_ACONST_NULL, OPCODE_ARETURN});
}

} // namespace

class DetectionRulesTest : public AgentGuardTest {};

TEST_F(DetectionRulesTest, lambdaFactoryShape) {
  const auto& target = transformer_target();
  auto good = make_lambda_call_site(target, "com/acme/A", "lambda$impl$0");
  EXPECT_TRUE(is_lambda_factory(*good, target));

  auto short_args =
      make_lambda_call_site(target, "com/acme/A", "lambda$impl$0", 1);
  EXPECT_FALSE(is_lambda_factory(*short_args, target));

  auto no_args = make_lambda_call_site(target, "com/acme/A", "lambda$impl$0", 0);
  EXPECT_FALSE(is_lambda_factory(*no_args, target));

  auto virtual_handle = make_lambda_call_site(
      target, "com/acme/A", "lambda$impl$0", 3, REF_invokeVirtual);
  EXPECT_FALSE(is_lambda_factory(*virtual_handle, target));

  MethodTarget other_name = target;
  other_name.name = "apply";
  EXPECT_FALSE(is_lambda_factory(*good, other_name));
}

TEST_F(DetectionRulesTest, lambdaFactoryRejectsMistypedConstants) {
  const auto& target = transformer_target();
  auto site = make_lambda_call_site(target, "com/acme/A", "lambda$impl$0");
  auto args = site->bootstrap_args();
  std::swap(args[0], args[1]);
  DynamicCallSite swapped(site->name(), site->desc(), site->bootstrap(), args);
  EXPECT_FALSE(is_lambda_factory(swapped, target));

  args = site->bootstrap_args();
  args[0] = TypeConstant{"()V"};
  DynamicCallSite bridge(site->name(), site->desc(), site->bootstrap(), args);
  EXPECT_FALSE(is_lambda_factory(bridge, target));
}

TEST_F(DetectionRulesTest, findLambdaImplementations) {
  auto cls = make_lambda_class("com/acme/A", transformer_target());
  EXPECT_THAT(find_lambda_implementations(*cls, transformer_target()),
              UnorderedElementsAre("lambda$impl$0"));

  auto other = make_lambda_class("com/acme/B", builtin::thread_dump_stack_target());
  EXPECT_TRUE(find_lambda_implementations(*other, transformer_target()).empty());
}

TEST_F(DetectionRulesTest, lambdaClassIsAcceptedAndImplementationEmptied) {
  auto cls = make_lambda_class("com/acme/A", transformer_target());
  LambdaImplementationFilter filter(transformer_target());

  EXPECT_TRUE(filter(nullptr, cls.get()));
  auto* impl = cls->find_method("lambda$impl$0", transformer_target().desc);
  ASSERT_NE(impl, nullptr);
  EXPECT_TRUE(is_emptied(*impl));
  auto* factory = cls->find_method("factory", "()Ljava/lang/instrument/ClassFileTransformer;");
  ASSERT_NE(factory, nullptr);
  EXPECT_FALSE(factory->get_code().empty());
  EXPECT_TRUE(factory->get_code().get(0)->insn->has_call_site());
}

TEST_F(DetectionRulesTest, shortBootstrapListIsIgnored) {
  auto cls = make_lambda_class("com/acme/A", transformer_target(), 1);
  LambdaImplementationFilter filter(transformer_target());

  EXPECT_FALSE(filter(nullptr, cls.get()));
  auto* impl = cls->find_method("lambda$impl$0", transformer_target().desc);
  EXPECT_FALSE(is_emptied(*impl));
}

TEST_F(DetectionRulesTest, lambdaImplementationSurvivesRoundTrip) {
  auto cls = make_lambda_class("com/acme/A", transformer_target());
  auto reread = read_class(encode(*cls));
  LambdaImplementationFilter filter(transformer_target());
  EXPECT_TRUE(filter(nullptr, reread.get()));
  EXPECT_TRUE(is_emptied(
      *reread->find_method("lambda$impl$0", transformer_target().desc)));
}

TEST_F(DetectionRulesTest, declaredInterfaceIsAccepted) {
  ClassCreator cc("com/acme/Spy");
  cc.add_interface(transformer_target().owner);
  auto cls = cc.create();
  LambdaImplementationFilter filter(transformer_target());
  EXPECT_TRUE(filter(nullptr, cls.get()));
}

TEST_F(DetectionRulesTest, inheritedInterfaceNeedsCapability) {
  ClassCreator cc("com/acme/SubSpy", "com/acme/Spy");
  auto cls = cc.create();
  LambdaImplementationFilter filter(transformer_target());
  EXPECT_FALSE(filter(nullptr, cls.get()));

  RuntimeClass rt("com/acme/SubSpy",
                  {"com/acme/Spy", transformer_target().owner,
                   "java/lang/Object"});
  add_capabilities(cls.get(), &rt);
  EXPECT_TRUE(cls->has_capability(transformer_target().owner));
  EXPECT_TRUE(filter(&rt, cls.get()));
}

TEST_F(DetectionRulesTest, runtimeIdentityWithoutTree) {
  LambdaImplementationFilter filter(transformer_target(), {"com/acme/Agent"});
  RuntimeClass spy("com/acme/Spy", {transformer_target().owner});
  RuntimeClass agent("com/acme/Agent", {transformer_target().owner});
  RuntimeClass iface(transformer_target().owner);
  RuntimeClass plain("com/acme/Plain", {"java/lang/Object"});

  EXPECT_TRUE(filter(&spy, nullptr));
  EXPECT_FALSE(filter(&agent, nullptr));
  EXPECT_FALSE(filter(&iface, nullptr));
  EXPECT_FALSE(filter(&plain, nullptr));
  EXPECT_FALSE(filter(nullptr, nullptr));
}

TEST_F(DetectionRulesTest, exemptClassIsNeverAccepted) {
  ClassCreator cc("com/acme/Agent");
  cc.add_interface(transformer_target().owner);
  auto cls = cc.create();
  LambdaImplementationFilter filter(transformer_target(), {"com/acme/Agent"});
  EXPECT_FALSE(filter(nullptr, cls.get()));

  auto lambdas = make_lambda_class("com/acme/Agent", transformer_target());
  EXPECT_FALSE(filter(nullptr, lambdas.get()));
  EXPECT_FALSE(is_emptied(
      *lambdas->find_method("lambda$impl$0", transformer_target().desc)));
}

TEST_F(DetectionRulesTest, unrelatedClassIsRejected) {
  ClassCreator cc("com/acme/Plain");
  add_busy_method(cc.get_class(), ACC_PUBLIC, "transform",
                  transformer_target().desc);
  auto cls = cc.create();
  LambdaImplementationFilter filter(transformer_target());
  EXPECT_FALSE(filter(nullptr, cls.get()));
  EXPECT_FALSE(is_emptied(
      *cls->find_method("transform", transformer_target().desc)));
}

TEST_F(DetectionRulesTest, exactMethodFilter) {
  ExactMethodFilter filter(builtin::thread_dump_stack_target());
  RuntimeClass thread("java/lang/Thread");
  RuntimeClass other("java/lang/Object");
  ClassCreator thread_cc("java/lang/Thread");
  auto thread_tree = thread_cc.create();

  EXPECT_TRUE(filter(&thread, nullptr));
  EXPECT_FALSE(filter(&other, nullptr));
  EXPECT_TRUE(filter(nullptr, thread_tree.get()));
  EXPECT_FALSE(filter(&other, thread_tree.get()));
  EXPECT_FALSE(filter(nullptr, nullptr));
}

TEST_F(DetectionRulesTest, methodCleanerMatchesNameAndDescriptor) {
  auto t = rules::method_cleaner(builtin::thread_dump_stack_target());
  ClassCreator cc("java/lang/Thread");
  auto* dump = add_busy_method(cc.get_class(), ACC_PUBLIC | ACC_STATIC,
                               "dumpStack", "()V");
  auto* overload = add_busy_method(cc.get_class(), ACC_PUBLIC | ACC_STATIC,
                                   "dumpStack", "(I)V");
  EXPECT_TRUE(transformers::validate_method(t, *dump));
  EXPECT_FALSE(transformers::validate_method(t, *overload));
}

TEST_F(DetectionRulesTest, badTargetDescriptorIsRejected) {
  MethodTarget target{"com/acme/I", "run", "run()"};
  EXPECT_THROW(LambdaImplementationFilter filter(target),
               agentguard::InvalidDescriptorException);
}
