/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "AgentEngine.h"

#include <atomic>
#include <boost/thread/thread.hpp>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <stdexcept>

#include "AgentConfig.h"
#include "AgentGuardTest.h"
#include "BuiltinRules.h"
#include "ClassReader.h"

using namespace agentguard_test;
using ::testing::UnorderedElementsAre;

namespace {

const MethodTarget& transformer_target() {
  return builtin::class_file_transformer_target();
}

std::vector<JvmOpcode> opcodes(const JavaMethod& method) {
  std::vector<JvmOpcode> ops;
  for (const auto& node : method.get_code()) {
    if (!node.is_label()) {
      ops.push_back(node.insn->opcode());
    }
  }
  return ops;
}

const std::vector<JvmOpcode> kEmptiedTransform = {OPCODE_ACONST_NULL,
                                                  OPCODE_ARETURN};

/*
 * A class implementing ClassFileTransformer directly, with one more method
 * that must survive.
 */
std::vector<uint8_t> make_spy(const std::string& name) {
  ClassCreator cc(name);
  cc.add_interface(transformer_target().owner);
  add_busy_method(cc.get_class(), ACC_PUBLIC, "transform",
                  transformer_target().desc);
  add_busy_method(cc.get_class(), ACC_PUBLIC, "toString",
                  "()Ljava/lang/String;");
  auto cls = cc.create();
  return encode(*cls);
}

std::vector<uint8_t> make_plain(const std::string& name) {
  ClassCreator cc(name);
  add_busy_method(cc.get_class(), ACC_PUBLIC, "transform",
                  transformer_target().desc);
  auto cls = cc.create();
  return encode(*cls);
}

std::vector<uint8_t> make_thread() {
  ClassCreator cc("java/lang/Thread");
  add_busy_method(cc.get_class(), ACC_PUBLIC | ACC_STATIC, "dumpStack", "()V");
  add_busy_method(cc.get_class(), ACC_PUBLIC, "getId", "()J");
  auto cls = cc.create();
  return encode(*cls);
}

LoadHookResult load(AgentEngine& engine,
                    const std::string& name,
                    const std::vector<uint8_t>& bytes) {
  return engine.transform("app", name.c_str(), nullptr, bytes.data(),
                          bytes.size());
}

} // namespace

class AgentEngineTest : public AgentGuardTest {
 protected:
  AgentEngineTest() : source(std::make_shared<CountingClassSource>()) {}

  std::unique_ptr<AgentEngine> make_engine() {
    auto engine = std::make_unique<AgentEngine>(source);
    engine->add_preload_transformer(
        rules::lambda_cleaner(transformer_target(), {}));
    engine->add_redefine_transformer(
        rules::lambda_cleaner(transformer_target(), {}));
    engine->add_redefine_transformer(
        rules::method_cleaner(builtin::thread_dump_stack_target()));
    engine->arm();
    return engine;
  }

  std::shared_ptr<CountingClassSource> source;
};

TEST_F(AgentEngineTest, preloadIgnoresNamelessClasses) {
  auto engine = make_engine();
  auto bytes = make_spy("com/acme/Spy");
  auto result =
      engine->transform("app", nullptr, nullptr, bytes.data(), bytes.size());
  EXPECT_EQ(result.status, LoadHookResult::NO_CHANGE);
  EXPECT_EQ(engine->get_stats().classes_seen, 0u);
}

TEST_F(AgentEngineTest, preloadEmptiesDirectImplementation) {
  auto engine = make_engine();
  auto result = load(*engine, "com/acme/Spy", make_spy("com/acme/Spy"));
  ASSERT_EQ(result.status, LoadHookResult::REPLACED);
  ASSERT_FALSE(result.bytes.empty());

  auto cls = read_class(result.bytes);
  EXPECT_EQ(opcodes(*cls->find_method("transform", transformer_target().desc)),
            kEmptiedTransform);
  EXPECT_EQ(
      opcodes(*cls->find_method("toString", "()Ljava/lang/String;")),
      std::vector<JvmOpcode>({OPCODE_BIPUSH, OPCODE_POP, OPCODE_LDC,
                              OPCODE_POP, OPCODE_ACONST_NULL, OPCODE_ARETURN}));
  EXPECT_EQ(engine->get_processed_classes().count("com/acme/Spy"), 1u);
  EXPECT_EQ(engine->get_stats().classes_rewritten, 1u);
}

TEST_F(AgentEngineTest, preloadEmptiesLambdaImplementation) {
  auto engine = make_engine();
  auto lambda = make_lambda_class("com/acme/Installer", transformer_target());
  auto result = load(*engine, "com/acme/Installer", encode(*lambda));
  ASSERT_EQ(result.status, LoadHookResult::REPLACED);

  auto cls = read_class(result.bytes);
  EXPECT_EQ(
      opcodes(*cls->find_method("lambda$impl$0", transformer_target().desc)),
      kEmptiedTransform);
  auto* factory = cls->find_method(
      "factory", "()Ljava/lang/instrument/ClassFileTransformer;");
  EXPECT_EQ(opcodes(*factory),
            std::vector<JvmOpcode>({OPCODE_INVOKEDYNAMIC, OPCODE_ARETURN}));
}

TEST_F(AgentEngineTest, preloadLeavesUnrelatedClass) {
  auto engine = make_engine();
  auto result = load(*engine, "com/acme/Plain", make_plain("com/acme/Plain"));
  EXPECT_EQ(result.status, LoadHookResult::NO_CHANGE);
  EXPECT_TRUE(result.bytes.empty());
  EXPECT_EQ(source->lookups("com/acme/Plain"), 0u);
  EXPECT_TRUE(engine->get_processed_classes().empty());
}

TEST_F(AgentEngineTest, preloadUnreadableIsNoChange) {
  auto engine = make_engine();
  std::vector<uint8_t> garbage = {0xca, 0xfe, 0xba, 0xbe, 0x00};
  EXPECT_EQ(load(*engine, "com/acme/Broken", garbage).status,
            LoadHookResult::NO_CHANGE);

  // No bytes from the host and none in the source.
  auto result = engine->transform("app", "com/acme/Missing", nullptr, nullptr, 0);
  EXPECT_EQ(result.status, LoadHookResult::NO_CHANGE);
  EXPECT_EQ(source->lookups("com/acme/Missing"), 1u);
  EXPECT_EQ(engine->get_stats().classes_unreadable, 2u);
}

TEST_F(AgentEngineTest, preloadReadsFromSourceWithoutBytes) {
  source->add("com/acme/Spy", make_spy("com/acme/Spy"));
  auto engine = make_engine();
  auto result = engine->transform("app", "com/acme/Spy", nullptr, nullptr, 0);
  EXPECT_EQ(result.status, LoadHookResult::REPLACED);
  EXPECT_EQ(source->lookups("com/acme/Spy"), 1u);
}

TEST_F(AgentEngineTest, preloadReportsEncodingFailure) {
  AgentEngine engine(source);
  // Leaves a loop behind, which a version 52 class cannot encode without
  // stack map frames.
  engine.add_preload_transformer(
      TransformerBuilder()
          .transformer(std::make_shared<FunctionTransformer>(
              "Looping",
              [](JavaMethod*, InsnList& code, InsnNode*) {
                code.clear();
                auto* head = code.push_back_label();
                code.push_back(OPCODE_GOTO)->insn->set_target(head);
                return true;
              }))
          .build());
  engine.arm();
  auto result = load(engine, "com/acme/Plain", make_plain("com/acme/Plain"));
  EXPECT_EQ(result.status, LoadHookResult::FAILED);
  EXPECT_FALSE(result.error.empty());
  EXPECT_EQ(engine.get_stats().classes_failed, 1u);
}

TEST_F(AgentEngineTest, invalidDescriptorSkipsOnlyThatMethod) {
  AgentEngine engine(source);
  ClassCreator cc("com/acme/Odd");
  add_busy_method(cc.get_class(), ACC_PUBLIC, "fine", "()I");
  auto* odd = cc.get_class()->add_method(
      std::make_unique<JavaMethod>(cc.get_class(), ACC_PUBLIC, "odd", "()(I)V"));
  odd->get_code().push_back(OPCODE_NOP);
  odd->get_code().push_back(OPCODE_RETURN);
  auto cls = cc.create();

  auto cleaner = TransformerBuilder().transformer(Transformer::cleaner()).build();
  auto bytes = engine.rewrite(*cls, {&cleaner});
  EXPECT_FALSE(bytes.empty());
  EXPECT_EQ(opcodes(*cls->find_method("fine", "()I")),
            std::vector<JvmOpcode>({OPCODE_ICONST_0, OPCODE_IRETURN}));
  EXPECT_EQ(opcodes(*cls->find_method("odd", "()(I)V")),
            std::vector<JvmOpcode>({OPCODE_NOP, OPCODE_RETURN}));
}

TEST_F(AgentEngineTest, registriesAreFrozenOnceArmed) {
  auto engine = make_engine();
  EXPECT_TRUE(engine->is_armed());
  EXPECT_THROW(engine->add_preload_transformer(
                   rules::method_cleaner(builtin::thread_dump_stack_target())),
               AgentGuardException);
  EXPECT_EQ(engine->get_preload_transformers().size(), 1u);
  EXPECT_EQ(engine->get_redefine_transformers().size(), 2u);
}

TEST_F(AgentEngineTest, startWithoutRedefinitionOnlyInstallsHook) {
  AgentEngine engine(source);
  engine.add_redefine_transformer(
      rules::method_cleaner(builtin::thread_dump_stack_target()));
  FakeInstrumentation inst;
  inst.redefine_supported = false;
  inst.add_loaded_class("java/lang/Thread");
  source->add("java/lang/Thread", make_thread());

  engine.start(inst);
  EXPECT_TRUE(engine.is_armed());
  ASSERT_EQ(inst.hooks.size(), 1u);
  EXPECT_EQ(inst.hooks[0], &engine);
  EXPECT_TRUE(inst.batches.empty());
  EXPECT_EQ(source->lookups("java/lang/Thread"), 0u);
}

TEST_F(AgentEngineTest, sweepRedefinesMatchingClassesInOneBatch) {
  source->add("com/acme/Spy", make_spy("com/acme/Spy"));
  source->add("com/acme/Plain", make_plain("com/acme/Plain"));
  source->add("java/lang/Thread", make_thread());
  source->add("com/acme/Locked", make_spy("com/acme/Locked"));

  FakeInstrumentation inst;
  const auto* spy =
      inst.add_loaded_class("com/acme/Spy", {transformer_target().owner});
  inst.add_loaded_class("com/acme/Plain", {"java/lang/Object"});
  const auto* thread = inst.add_loaded_class("java/lang/Thread");
  // Transient: assignable, but nothing to read it from.
  inst.add_loaded_class("com/acme/Spy$$Lambda$1",
                        {transformer_target().owner});
  inst.add_loaded_class("com/acme/Locked", {transformer_target().owner},
                        /* modifiable */ false);

  AgentEngine engine(source);
  engine.add_redefine_transformer(rules::lambda_cleaner(transformer_target(), {}));
  engine.add_redefine_transformer(
      rules::method_cleaner(builtin::thread_dump_stack_target()));
  engine.start(inst);

  ASSERT_EQ(inst.batches.size(), 1u);
  const auto& batch = inst.batches[0];
  std::vector<const RuntimeClass*> redefined;
  for (const auto& def : batch) {
    redefined.push_back(def.cls);
    EXPECT_FALSE(def.bytes.empty());
  }
  EXPECT_THAT(redefined, UnorderedElementsAre(spy, thread));

  // Rejected with no tree: never read.
  EXPECT_EQ(source->lookups("com/acme/Plain"), 0u);
  EXPECT_EQ(source->lookups("com/acme/Locked"), 0u);
  EXPECT_EQ(source->lookups("com/acme/Spy"), 1u);

  for (const auto& def : batch) {
    auto cls = read_class(def.bytes);
    if (def.cls == thread) {
      EXPECT_EQ(opcodes(*cls->find_method("dumpStack", "()V")),
                std::vector<JvmOpcode>({OPCODE_RETURN}));
      EXPECT_EQ(opcodes(*cls->find_method("getId", "()J")).size(), 6u);
    } else {
      EXPECT_EQ(
          opcodes(*cls->find_method("transform", transformer_target().desc)),
          kEmptiedTransform);
    }
  }
  auto stats = engine.get_stats();
  EXPECT_EQ(stats.classes_redefined, 2u);
  EXPECT_EQ(stats.classes_unreadable, 1u);
  EXPECT_THAT(engine.get_processed_classes().elements(),
              UnorderedElementsAre("com/acme/Spy", "java/lang/Thread"));
}

TEST_F(AgentEngineTest, sweepUsesBytesHandedOverByHost) {
  FakeInstrumentation inst;
  auto* spy =
      inst.add_loaded_class("com/acme/Spy", {transformer_target().owner});
  spy->set_class_bytes(make_spy("com/acme/Spy"));

  AgentEngine engine(source);
  engine.add_redefine_transformer(rules::lambda_cleaner(transformer_target(), {}));
  EXPECT_EQ(engine.redefine_loaded_classes(inst), 1u);
  EXPECT_EQ(source->lookups("com/acme/Spy"), 0u);
}

TEST_F(AgentEngineTest, sweepNeverSubmitsEmptyBatch) {
  source->add("com/acme/Plain", make_plain("com/acme/Plain"));
  FakeInstrumentation inst;
  inst.add_loaded_class("com/acme/Plain");

  AgentEngine engine(source);
  engine.add_redefine_transformer(rules::lambda_cleaner(transformer_target(), {}));
  engine.start(inst);
  EXPECT_TRUE(inst.batches.empty());
  EXPECT_EQ(engine.get_stats().classes_redefined, 0u);
}

TEST_F(AgentEngineTest, sweepReadsUnfilteredTransformersClasses) {
  source->add("com/acme/Plain", make_plain("com/acme/Plain"));
  FakeInstrumentation inst;
  inst.add_loaded_class("com/acme/Plain");
  inst.add_loaded_class("com/acme/Gone");

  AgentEngine engine(source);
  engine.add_redefine_transformer(
      TransformerBuilder().transformer(Transformer::cleaner()).build());
  EXPECT_EQ(engine.redefine_loaded_classes(inst), 1u);
  ASSERT_EQ(inst.batches.size(), 1u);
  EXPECT_EQ(inst.batches[0][0].cls->name(), "com/acme/Plain");
}

TEST_F(AgentEngineTest, sweepSurvivesThrowingTransformer) {
  source->add("com/acme/A", make_plain("com/acme/A"));
  source->add("com/acme/B", make_plain("com/acme/B"));
  FakeInstrumentation inst;
  inst.add_loaded_class("com/acme/A");
  inst.add_loaded_class("com/acme/B");

  AgentEngine engine(source);
  engine.add_redefine_transformer(
      TransformerBuilder()
          .transformer(std::make_shared<FunctionTransformer>(
              "Throwing",
              [](JavaMethod* method, InsnList&, InsnNode*) -> bool {
                if (method->get_class()->get_name() == "com/acme/A") {
                  throw std::runtime_error("boom");
                }
                return true;
              }))
          .build());
  size_t n = 0;
  EXPECT_NO_THROW(n = engine.redefine_loaded_classes(inst));
  EXPECT_EQ(n, 1u);
  ASSERT_EQ(inst.batches.size(), 1u);
  ASSERT_EQ(inst.batches[0].size(), 1u);
  EXPECT_EQ(inst.batches[0][0].cls->name(), "com/acme/B");
  EXPECT_EQ(engine.get_stats().classes_failed, 1u);
}

TEST_F(AgentEngineTest, sweepSurvivesThrowingClassFilter) {
  source->add("com/acme/A", make_plain("com/acme/A"));
  source->add("com/acme/B", make_plain("com/acme/B"));
  FakeInstrumentation inst;
  inst.add_loaded_class("com/acme/A");
  inst.add_loaded_class("com/acme/B");

  AgentEngine engine(source);
  engine.add_redefine_transformer(
      TransformerBuilder()
          .with_class_filter([](const RuntimeClass* cls, JavaClass*) -> bool {
            if (cls != nullptr && cls->name() == "com/acme/A") {
              throw std::runtime_error("boom");
            }
            return true;
          })
          .transformer(Transformer::cleaner())
          .build());
  EXPECT_EQ(engine.redefine_loaded_classes(inst), 1u);
  ASSERT_EQ(inst.batches.size(), 1u);
  EXPECT_EQ(inst.batches[0][0].cls->name(), "com/acme/B");
  EXPECT_EQ(engine.get_stats().classes_failed, 1u);
}

TEST_F(AgentEngineTest, defaultConfigDisarmsSpies) {
  source->add("com/acme/Spy", make_spy("com/acme/Spy"));
  source->add("java/lang/Thread", make_thread());
  AgentEngine engine(source);
  AgentConfig().apply(engine);

  FakeInstrumentation inst;
  inst.add_loaded_class("java/lang/Thread");
  engine.start(inst);
  ASSERT_EQ(inst.batches.size(), 1u);

  auto result = load(engine, "com/acme/Spy", make_spy("com/acme/Spy"));
  EXPECT_EQ(result.status, LoadHookResult::REPLACED);
}

TEST_F(AgentEngineTest, concurrentPreloadCalls) {
  auto engine = make_engine();
  const size_t n_threads = 8;
  const size_t n_classes = 50;
  std::vector<std::vector<uint8_t>> classes;
  for (size_t i = 0; i < n_classes; ++i) {
    classes.push_back(make_spy("com/acme/Spy" + std::to_string(i)));
  }
  std::atomic<size_t> replaced{0};
  std::vector<boost::thread> threads;
  for (size_t t = 0; t < n_threads; ++t) {
    threads.emplace_back([&]() {
      for (size_t i = 0; i < n_classes; ++i) {
        auto name = "com/acme/Spy" + std::to_string(i);
        if (load(*engine, name, classes[i]).status ==
            LoadHookResult::REPLACED) {
          replaced++;
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(replaced.load(), n_threads * n_classes);
  EXPECT_EQ(engine->get_processed_classes().size(), n_classes);
  EXPECT_EQ(engine->get_stats().classes_rewritten, n_threads * n_classes);
}
