// Repository: Stagehand
// Component: Harness script parser unit tests

#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

#include "HarnessScript.h"
#include "stagehand/util/Logger.hpp"

namespace stagehand::standalone {
namespace {

class HarnessScriptTest : public ::testing::Test {
 protected:
  void SetUp() override {
    util::Logger::SetWarnSink([this](const std::string& line) { warnings_.push_back(line); });
  }

  void TearDown() override { util::Logger::SetWarnSink(nullptr); }

  std::vector<ScriptStep> Parse(const std::string& text) {
    std::istringstream in(text);
    return ParseScript(in);
  }

  std::vector<std::string> warnings_;
};

TEST_F(HarnessScriptTest, OneStepPerTickLine) {
  auto steps = Parse("# comment\nv\nf2, tab\n.\n\n!idle 2\nescape\n");
  ASSERT_EQ(steps.size(), 6u);
  EXPECT_EQ(steps[0].keys, std::vector<std::string>{"v"});
  EXPECT_EQ(steps[1].keys, (std::vector<std::string>{"f2", "tab"}));
  EXPECT_TRUE(steps[2].keys.empty());
  EXPECT_TRUE(steps[3].keys.empty());
  EXPECT_TRUE(steps[4].keys.empty());
  EXPECT_EQ(steps[5].keys, std::vector<std::string>{"escape"});
  EXPECT_TRUE(warnings_.empty());
}

TEST_F(HarnessScriptTest, FailureDirectiveAttachesToNextTick) {
  auto steps = Parse("!fail-load asset missing\n!fail-unload\nv\nescape\n");
  ASSERT_EQ(steps.size(), 2u);
  EXPECT_EQ(steps[0].fail_load, "asset missing");
  EXPECT_EQ(steps[0].fail_unload, "injected failure");
  EXPECT_TRUE(steps[1].fail_load.empty());
  EXPECT_TRUE(steps[1].fail_unload.empty());
}

TEST_F(HarnessScriptTest, TrailingFailureDirectiveWarns) {
  auto steps = Parse("v\n!fail-load too late\n");
  ASSERT_EQ(steps.size(), 1u);
  EXPECT_TRUE(steps[0].fail_load.empty());
  ASSERT_EQ(warnings_.size(), 1u);
  EXPECT_NE(warnings_[0].find("too late"), std::string::npos);

  Parse("!fail-unload stuck\n");
  EXPECT_EQ(warnings_.size(), 2u);
}

TEST_F(HarnessScriptTest, IdleCountIsValidatedAndCapped) {
  EXPECT_TRUE(Parse("!idle\n").empty());
  EXPECT_TRUE(Parse("!idle 0\n").empty());
  EXPECT_TRUE(Parse("!idle -3\n").empty());
  EXPECT_TRUE(Parse("!idle lots\n").empty());
  EXPECT_EQ(warnings_.size(), 4u);

  auto steps = Parse("!idle 99999999\n");
  EXPECT_EQ(steps.size(), static_cast<std::size_t>(kMaxIdleTicks));
  EXPECT_EQ(warnings_.size(), 5u);
}

}  // namespace
}  // namespace stagehand::standalone
