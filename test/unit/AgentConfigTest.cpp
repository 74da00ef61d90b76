/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "AgentConfig.h"

#include <fstream>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <json/reader.h>
#include <json/value.h>

#include "AgentEngine.h"
#include "AgentGuardTest.h"
#include "AgentGuardTestUtils.h"
#include "BuiltinRules.h"
#include "Debug.h"
#include "RuleRegistry.h"

using namespace agentguard_test;
using ::testing::ElementsAre;

namespace {

Json::Value parse(const std::string& text) {
  Json::Reader reader;
  Json::Value root;
  bool ok = reader.parse(text, root);
  always_assert_log(ok, "Bad test json: %s", text.c_str());
  return root;
}

void expect_invalid_config(const std::string& text) {
  try {
    AgentConfig config(parse(text));
    ADD_FAILURE() << "Accepted " << text;
  } catch (const agentguard::InvalidConfigException&) {
  }
}

} // namespace

class AgentConfigTest : public AgentGuardTest {};

TEST_F(AgentConfigTest, defaults) {
  AgentConfig config;
  EXPECT_THAT(config.get_preload_rules(),
              ElementsAre(builtin::kClassFileTransformerCleaner));
  EXPECT_THAT(config.get_redefine_rules(),
              ElementsAre(builtin::kClassFileTransformerCleaner,
                          builtin::kThreadDumpStackCleaner));

  AgentEngine engine;
  config.apply(engine);
  EXPECT_EQ(engine.get_preload_transformers().size(), 1u);
  EXPECT_EQ(engine.get_redefine_transformers().size(), 2u);
  for (const auto& t : engine.get_redefine_transformers()) {
    EXPECT_TRUE(transformers::is_filtered(t));
    EXPECT_EQ(transformers::delegate(t).name(), "CLEANER");
  }
}

TEST_F(AgentConfigTest, emptyDocumentKeepsDefaults) {
  AgentConfig config(parse("{}"));
  EXPECT_EQ(config.get_preload_rules().size(), 1u);
  EXPECT_EQ(config.get_redefine_rules().size(), 2u);
}

TEST_F(AgentConfigTest, customRules) {
  AgentConfig config(parse(R"({
    "preload": ["LambdaCleaner", "MethodCleaner"],
    "redefine": [],
    "LambdaCleaner": {
      "interface": "java/util/function/Supplier",
      "method": "get",
      "descriptor": "()Ljava/lang/Object;",
      "exempt_classes": ["com/acme/Trusted"]
    },
    "MethodCleaner": {
      "class": "java/lang/Runtime",
      "method": "halt",
      "descriptor": "(I)V"
    }
  })"));
  EXPECT_THAT(config.get_preload_rules(),
              ElementsAre("LambdaCleaner", "MethodCleaner"));
  EXPECT_TRUE(config.get_redefine_rules().empty());

  AgentEngine engine;
  config.apply(engine);
  ASSERT_EQ(engine.get_preload_transformers().size(), 2u);

  const auto& method_cleaner = engine.get_preload_transformers()[1];
  RuntimeClass runtime("java/lang/Runtime");
  RuntimeClass other("java/lang/System");
  EXPECT_TRUE(transformers::validate_class(method_cleaner, &runtime, nullptr));
  EXPECT_FALSE(transformers::validate_class(method_cleaner, &other, nullptr));

  const auto& lambda_cleaner = engine.get_preload_transformers()[0];
  RuntimeClass trusted("com/acme/Trusted", {"java/util/function/Supplier"});
  RuntimeClass supplier("com/acme/Supplier", {"java/util/function/Supplier"});
  EXPECT_FALSE(transformers::validate_class(lambda_cleaner, &trusted, nullptr));
  EXPECT_TRUE(transformers::validate_class(lambda_cleaner, &supplier, nullptr));
}

TEST_F(AgentConfigTest, exemptClassesOfTheTransformerCleaner) {
  AgentConfig config(parse(R"({
    "ClassFileTransformerCleaner": {"exempt_classes": ["com/acme/Agent"]}
  })"));
  AgentEngine engine;
  config.apply(engine);
  const auto& t = engine.get_preload_transformers()[0];
  RuntimeClass agent("com/acme/Agent",
                     {builtin::class_file_transformer_target().owner});
  EXPECT_FALSE(transformers::validate_class(t, &agent, nullptr));
}

TEST_F(AgentConfigTest, invalidDocuments) {
  expect_invalid_config(R"({"preload": ["NoSuchRule"]})");
  expect_invalid_config(R"({"redefine": "ThreadDumpStackCleaner"})");
  expect_invalid_config(R"({"NoSuchRule": {}})");
  expect_invalid_config(R"({"ClassFileTransformerCleaner": []})");
  expect_invalid_config(R"([1, 2])");
}

TEST_F(AgentConfigTest, incompleteRuleOptionsFailOnApply) {
  AgentConfig missing(parse(R"({"preload": ["MethodCleaner"]})"));
  AgentEngine engine;
  EXPECT_THROW(missing.apply(engine), agentguard::InvalidConfigException);

  AgentConfig bad_desc(parse(R"({
    "preload": ["MethodCleaner"],
    "MethodCleaner": {"class": "a/B", "method": "c", "descriptor": "V"}
  })"));
  AgentEngine other;
  EXPECT_THROW(bad_desc.apply(other), agentguard::InvalidConfigException);

  AgentConfig bad_exempt(parse(
      R"({"ClassFileTransformerCleaner": {"exempt_classes": [1]}})"));
  AgentEngine third;
  EXPECT_THROW(bad_exempt.apply(third), agentguard::InvalidConfigException);
}

TEST_F(AgentConfigTest, loadFromFile) {
  auto tmp = agentguard_test::make_tmp_dir("agentguard_config_%%%%%%%%");
  auto path = tmp.path + "/config.json";
  {
    std::ofstream out(path);
    out << R"({"redefine": ["ThreadDumpStackCleaner"]})";
  }
  auto config = AgentConfig::load(path);
  EXPECT_THAT(config.get_redefine_rules(),
              ElementsAre(builtin::kThreadDumpStackCleaner));

  EXPECT_THROW(AgentConfig::load(tmp.path + "/missing.json"),
               agentguard::InvalidConfigException);
  {
    std::ofstream out(path);
    out << "{ not json";
  }
  EXPECT_THROW(AgentConfig::load(path), agentguard::InvalidConfigException);
}

TEST_F(AgentConfigTest, registry) {
  auto& registry = RuleRegistry::get();
  EXPECT_THAT(registry.get_names(),
              ElementsAre("ClassFileTransformerCleaner", "LambdaCleaner",
                          "MethodCleaner", "ThreadDumpStackCleaner"));
  auto rule = registry.create(builtin::kThreadDumpStackCleaner);
  EXPECT_EQ(rule->name(), builtin::kThreadDumpStackCleaner);
  EXPECT_THROW(registry.create("Missing"), agentguard::InvalidConfigException);
  EXPECT_THROW(registry.register_rule(builtin::kMethodCleaner, nullptr),
               AgentGuardException);
}
