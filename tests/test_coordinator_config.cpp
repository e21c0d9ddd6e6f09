// Repository: Stagehand
// Component: CoordinatorConfig unit tests

#include <gtest/gtest.h>
#include <fstream>
#include <unistd.h>

#include "stagehand/runtime/CoordinatorConfig.h"

namespace stagehand::runtime {
namespace {

TEST(CoordinatorConfigTest, DefaultsAreValid) {
  CoordinatorConfig config;
  EXPECT_TRUE(config.IsValid());
  EXPECT_EQ(config.overlay_presentation, "Validator");
  EXPECT_EQ(config.primary_context, "MainScene");
  EXPECT_EQ(config.main_output_node, "MainCamera");
  EXPECT_EQ(config.arbitration_interval_ms, 1000);
  EXPECT_TRUE(config.create_fallback_sink);
  EXPECT_TRUE(config.verbose_logging);
}

TEST(CoordinatorConfigTest, MissingFieldsKeepDefaults) {
  auto config = CoordinatorConfig::FromJson(
      R"({ "overlay_presentation": "Inspector", "arbitration_interval_ms": 250 })");
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->overlay_presentation, "Inspector");
  EXPECT_EQ(config->arbitration_interval_ms, 250);
  EXPECT_EQ(config->primary_context, "MainScene");
  EXPECT_EQ(config->fallback_sink_name, "StagehandFallbackAudioSink");

  auto empty = CoordinatorConfig::FromJson("{}");
  ASSERT_TRUE(empty.has_value());
  EXPECT_EQ(empty->ToJson(), CoordinatorConfig{}.ToJson());
}

TEST(CoordinatorConfigTest, MalformedFieldsFailTheParse) {
  EXPECT_FALSE(CoordinatorConfig::FromJson(R"({"arbitration_interval_ms": "fast"})"));
  EXPECT_FALSE(CoordinatorConfig::FromJson(R"({"verbose_logging": 1})"));
  EXPECT_FALSE(CoordinatorConfig::FromJson(R"({"primary_context": 7})"));
  EXPECT_FALSE(CoordinatorConfig::FromJson(R"({"primary_context": "unterminated})"));
}

TEST(CoordinatorConfigTest, NonObjectInputIsRejected) {
  EXPECT_FALSE(CoordinatorConfig::FromJson(""));
  EXPECT_FALSE(CoordinatorConfig::FromJson("   "));
  EXPECT_FALSE(CoordinatorConfig::FromJson("[1, 2]"));
  EXPECT_FALSE(CoordinatorConfig::FromJson(R"("overlay_presentation": "Validator")"));
}

TEST(CoordinatorConfigTest, InvalidCombinationsAreRejected) {
  EXPECT_FALSE(CoordinatorConfig::FromJson(
      R"({"overlay_presentation": "MainScene", "primary_context": "MainScene"})"));
  EXPECT_FALSE(CoordinatorConfig::FromJson(R"({"arbitration_interval_ms": 0})"));
  EXPECT_FALSE(CoordinatorConfig::FromJson(R"({"arbitration_interval_ms": -5})"));
  EXPECT_FALSE(CoordinatorConfig::FromJson(R"({"fallback_sink_name": ""})"));
  EXPECT_TRUE(CoordinatorConfig::FromJson(
      R"({"fallback_sink_name": "", "create_fallback_sink": false})"));

  CoordinatorConfig config;
  config.fallback_sink_name.clear();
  EXPECT_FALSE(config.IsValid());
  config.create_fallback_sink = false;
  EXPECT_TRUE(config.IsValid());
}

TEST(CoordinatorConfigTest, ToJsonParsesBack) {
  CoordinatorConfig config;
  config.overlay_presentation = "Inspector";
  config.main_output_node = "OperatorCamera";
  config.arbitration_interval_ms = 40;
  config.create_fallback_sink = false;
  config.verbose_logging = false;

  auto parsed = CoordinatorConfig::FromJson(config.ToJson());
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->overlay_presentation, "Inspector");
  EXPECT_EQ(parsed->main_output_node, "OperatorCamera");
  EXPECT_EQ(parsed->arbitration_interval_ms, 40);
  EXPECT_FALSE(parsed->create_fallback_sink);
  EXPECT_FALSE(parsed->verbose_logging);
}

TEST(CoordinatorConfigTest, EmptyMainOutputNodeParsesBack) {
  // Empty main output node disables the main-output arbitration rule.
  CoordinatorConfig config;
  config.main_output_node.clear();
  ASSERT_TRUE(config.IsValid());

  auto parsed = CoordinatorConfig::FromJson(config.ToJson());
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->main_output_node, "");
  EXPECT_EQ(parsed->ToArbiterConfig().main_output_node, "");
}

TEST(CoordinatorConfigTest, QuotesAndBackslashesInNamesParseBack) {
  CoordinatorConfig config;
  config.overlay_presentation = "Val\"idator";
  config.primary_context = "Main\\Scene";
  config.fallback_sink_name = "Fallback \"B\"";

  const std::string json = config.ToJson();
  auto parsed = CoordinatorConfig::FromJson(json);
  ASSERT_TRUE(parsed.has_value()) << json;
  EXPECT_EQ(parsed->overlay_presentation, "Val\"idator");
  EXPECT_EQ(parsed->primary_context, "Main\\Scene");
  EXPECT_EQ(parsed->fallback_sink_name, "Fallback \"B\"");
  EXPECT_EQ(parsed->ToJson(), json);

  auto hand_written = CoordinatorConfig::FromJson(R"({"main_output_node": "Cam\"1\"\nB"})");
  ASSERT_TRUE(hand_written.has_value());
  EXPECT_EQ(hand_written->main_output_node, "Cam\"1\"\nB");
}

TEST(CoordinatorConfigTest, FromFileReadsJsonAndReportsMissingFiles) {
  const std::string path =
      "/tmp/stagehand_config_test_" + std::to_string(getpid()) + ".json";
  {
    std::ofstream out(path);
    out << "{\n  \"primary_context\": \"Lobby\",\n  \"verbose_logging\": false\n}\n";
  }
  auto config = CoordinatorConfig::FromFile(path);
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->primary_context, "Lobby");
  EXPECT_FALSE(config->verbose_logging);
  unlink(path.c_str());

  EXPECT_FALSE(CoordinatorConfig::FromFile(path));
}

TEST(CoordinatorConfigTest, ArbiterConfigCarriesAudioFields) {
  CoordinatorConfig config;
  config.main_output_node = "OperatorCamera";
  config.fallback_sink_name = "Backup";
  config.create_fallback_sink = false;

  auto arbiter = config.ToArbiterConfig();
  EXPECT_EQ(arbiter.main_output_node, "OperatorCamera");
  EXPECT_EQ(arbiter.fallback_sink_name, "Backup");
  EXPECT_FALSE(arbiter.create_fallback_sink);
}

}  // namespace
}  // namespace stagehand::runtime
