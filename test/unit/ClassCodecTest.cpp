/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include "AgentGuardTest.h"
#include "ClassReader.h"
#include "ClassWriter.h"
#include "ConstantPool.h"
#include "Creators.h"

using namespace agentguard_test;

namespace {

std::vector<JvmOpcode> opcodes(const JavaMethod& method) {
  std::vector<JvmOpcode> ops;
  for (const auto& node : method.get_code()) {
    if (!node.is_label()) {
      ops.push_back(node.insn->opcode());
    }
  }
  return ops;
}

/*
 * static int pick(int x) {
 *   try {
 *     switch (x) { case 0: return 10; case 1: return 20; default: ... }
 *   } catch (RuntimeException e) { return -1; }
 * }
 */
void add_pick(JavaClass* cls) {
  MethodCreator mc(cls, ACC_STATIC, "pick", "(I)I");
  auto* start = mc.make_label();
  auto* case0 = mc.make_label();
  auto* case1 = mc.make_label();
  auto* dflt = mc.make_label();
  auto* end = mc.make_label();
  auto* handler = mc.make_label();
  mc.mark(start);
  mc.add_line_number(start, 3);
  mc.local(OPCODE_ILOAD, 0);
  mc.table_switch(dflt, 0, {case0, case1});
  mc.mark(case0);
  mc.push_int(10);
  mc.insn(OPCODE_IRETURN);
  mc.mark(case1);
  mc.push_int(20);
  mc.insn(OPCODE_IRETURN);
  mc.mark(dflt);
  mc.local(OPCODE_ILOAD, 0);
  auto* positive = mc.make_label();
  mc.branch(OPCODE_IFGT, positive);
  mc.push_int(0);
  mc.insn(OPCODE_IRETURN);
  mc.mark(positive);
  mc.push_int(100000);
  mc.mark(end);
  mc.insn(OPCODE_IRETURN);
  mc.mark(handler);
  mc.local(OPCODE_ASTORE, 1);
  mc.push_int(-1);
  mc.insn(OPCODE_IRETURN);
  mc.add_try_catch(start, end, handler, "java/lang/RuntimeException");
  mc.add_exception("java/io/IOException");
  mc.create();
}

std::unique_ptr<JavaClass> make_sample(uint16_t major) {
  ClassCreator cc("com/acme/Sample");
  cc.set_version(major);
  cc.add_interface("java/lang/Runnable");
  cc.add_field(ACC_PRIVATE | ACC_STATIC, "count", "J");
  add_pick(cc.get_class());
  {
    MethodCreator mc(cc.get_class(), ACC_PUBLIC, "run", "()V");
    mc.field_op(OPCODE_GETSTATIC, "com/acme/Sample", "count", "J");
    mc.insn(OPCODE_LCONST_1);
    mc.insn(OPCODE_LADD);
    mc.field_op(OPCODE_PUTSTATIC, "com/acme/Sample", "count", "J");
    mc.insn(OPCODE_RETURN);
    mc.create();
  }
  {
    MethodCreator mc(cc.get_class(), ACC_PUBLIC | ACC_ABSTRACT, "size", "()I");
    mc.create();
  }
  return cc.create();
}

} // namespace

class ClassCodecTest : public AgentGuardTest {};

TEST_F(ClassCodecTest, readBackWhatWasWritten) {
  auto sample = make_sample(49);
  auto cls = read_class(write_class(*sample));

  EXPECT_EQ(cls->get_name(), "com/acme/Sample");
  EXPECT_EQ(cls->get_super_name(), "java/lang/Object");
  EXPECT_EQ(cls->get_major_version(), 49);
  EXPECT_EQ(cls->get_interfaces(), std::vector<std::string>{"java/lang/Runnable"});
  ASSERT_EQ(cls->get_fields().size(), 1u);
  EXPECT_EQ(cls->get_pool().utf8(cls->get_fields()[0].name_index), "count");
  ASSERT_EQ(cls->get_methods().size(), 3u);
  EXPECT_FALSE(cls->is_modified());

  auto* pick = cls->find_method("pick", "(I)I");
  ASSERT_NE(pick, nullptr);
  EXPECT_EQ(opcodes(*pick), opcodes(*sample->find_method("pick", "(I)I")));
  ASSERT_EQ(pick->get_try_catch_blocks().size(), 1u);
  EXPECT_EQ(cls->get_pool().class_name(
                pick->get_try_catch_blocks()[0].catch_type),
            "java/lang/RuntimeException");
  ASSERT_EQ(pick->get_line_numbers().size(), 1u);
  EXPECT_EQ(pick->get_line_numbers()[0].line, 3);
  ASSERT_EQ(pick->get_exceptions().size(), 1u);
  EXPECT_EQ(cls->get_pool().class_name(pick->get_exceptions()[0]),
            "java/io/IOException");

  for (const auto& node : pick->get_code()) {
    if (node.is_label()) {
      continue;
    }
    if (node.insn->get_target() != nullptr) {
      EXPECT_TRUE(node.insn->get_target()->is_label());
      EXPECT_TRUE(node.insn->get_target()->is_linked());
    }
    for (const auto& c : node.insn->get_cases()) {
      EXPECT_TRUE(c.target->is_label());
    }
  }

  auto* size = cls->find_method("size", "()I");
  ASSERT_NE(size, nullptr);
  EXPECT_TRUE(size->get_code().empty());
  EXPECT_FALSE(size->has_code());
}

TEST_F(ClassCodecTest, computedLimits) {
  auto sample = make_sample(49);
  auto* run = sample->find_method("run", "()V");
  EXPECT_EQ(compute_max_stack(*run), 4);
  EXPECT_EQ(compute_max_locals(*run), 1);

  auto* pick = sample->find_method("pick", "(I)I");
  EXPECT_EQ(compute_max_stack(*pick), 1);
  EXPECT_EQ(compute_max_locals(*pick), 2);

  auto cls = read_class(write_class(*sample));
  EXPECT_EQ(cls->find_method("run", "()V")->get_max_stack(), 4);
  EXPECT_EQ(cls->find_method("pick", "(I)I")->get_max_locals(), 2);
}

TEST_F(ClassCodecTest, unmodifiedClassEncodesIdentically) {
  auto lambda = make_lambda_class(
      "com/acme/Installer",
      MethodTarget{"java/util/function/Supplier", "get",
                   "()Ljava/lang/Object;"});
  auto bytes = write_class(*lambda);
  auto cls = read_class(bytes);
  EXPECT_EQ(write_class(*cls), bytes);
}

TEST_F(ClassCodecTest, callSiteIsResolved) {
  MethodTarget target{"java/util/function/Supplier", "get",
                      "()Ljava/lang/Object;"};
  auto lambda = make_lambda_class("com/acme/Installer", target);
  auto cls = read_class(write_class(*lambda));
  auto* factory =
      cls->find_method("factory", "()Ljava/util/function/Supplier;");
  ASSERT_NE(factory, nullptr);
  const auto* insn = factory->get_code().get(0)->insn.get();
  ASSERT_TRUE(insn->has_call_site());
  const auto* site = insn->get_call_site();
  EXPECT_EQ(site->name(), "get");
  EXPECT_EQ(site->desc(), "()Ljava/util/function/Supplier;");
  EXPECT_EQ(site->bootstrap().name, "metafactory");
  EXPECT_EQ(site->bootstrap().kind, REF_invokeStatic);
  ASSERT_EQ(site->bootstrap_args().size(), 3u);
  const auto* handle =
      boost::get<MethodHandleConstant>(&site->bootstrap_args()[1]);
  ASSERT_NE(handle, nullptr);
  EXPECT_EQ(handle->owner, "com/acme/Installer");
  EXPECT_EQ(handle->name, "lambda$impl$0");
  EXPECT_EQ(handle->desc, target.desc);
  EXPECT_EQ(boost::get<TypeConstant>(site->bootstrap_args()[0]).desc,
            target.desc);
}

TEST_F(ClassCodecTest, rewrittenBranchesNeedFramesFromVersion50) {
  auto old_sample = make_sample(49);
  EXPECT_NO_THROW(write_class(*old_sample));

  auto sample = make_sample(52);
  EXPECT_THROW(write_class(*sample), agentguard::UnsupportedCodeException);

  // Straight-line code needs no frames.
  auto cls = read_class(write_class(*make_sample(49)));
  cls->set_version(52, 0);
  Transformer::empty_method(cls->find_method("pick", "(I)I"));
  auto bytes = write_class(*cls);
  auto reread = read_class(bytes);
  EXPECT_EQ(opcodes(*reread->find_method("pick", "(I)I")),
            std::vector<JvmOpcode>({OPCODE_ICONST_0, OPCODE_IRETURN}));
  EXPECT_TRUE(reread->find_method("pick", "(I)I")
                  ->get_try_catch_blocks()
                  .empty());
}

TEST_F(ClassCodecTest, malformedClassesAreRejected) {
  auto bytes = write_class(*make_sample(49));

  auto bad_magic = bytes;
  bad_magic[0] = 0x00;
  EXPECT_THROW(read_class(bad_magic), agentguard::InvalidJavaException);

  std::vector<uint8_t> truncated(bytes.begin(), bytes.begin() + bytes.size() / 2);
  try {
    read_class(truncated);
    ADD_FAILURE() << "Truncated class was accepted";
  } catch (const AgentGuardException& e) {
    EXPECT_TRUE(is_unreadable_class_error(e.type)) << e.what();
  }

  auto trailing = bytes;
  trailing.push_back(0);
  EXPECT_THROW(read_class(trailing), agentguard::InvalidJavaException);
}

TEST_F(ClassCodecTest, wideConstantsTakeTwoSlots) {
  ConstantPool pool;
  uint16_t first = pool.add_long(1);
  uint16_t next = pool.add_integer(2);
  EXPECT_EQ(next, first + 2);
  EXPECT_EQ(pool.add_long(1), first);
  EXPECT_TRUE(pool.is_wide_constant(first));
  EXPECT_FALSE(pool.is_wide_constant(next));
}
