// Contract tests for anchoring the simulation process.

#include "../../BaseContractTest.h"
#include "../ContractRegistryEnvironment.h"

#include <string>
#include <vector>

#include "stagehand/runtime/PersistentProcessAnchor.h"
#include "stagehand/util/Logger.hpp"
#include "../../fixtures/FakeViewCollaborators.h"

using namespace stagehand;
using namespace stagehand::tests;

namespace {

using fixtures::FakeProcessHost;
using runtime::PersistentProcessAnchor;
using stagehand::tests::RegisterExpectedDomainCoverage;

const bool kRegisterCoverage = []() {
  RegisterExpectedDomainCoverage("ProcessAnchor", {"PA-001", "PA-002", "PA-003", "PA-004"});
  return true;
}();

class PersistentProcessAnchorContractTest : public BaseContractTest {
 protected:
  [[nodiscard]] std::string DomainName() const override { return "ProcessAnchor"; }

  [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override {
    return {"PA-001", "PA-002", "PA-003", "PA-004"};
  }

  void SetUp() override {
    BaseContractTest::SetUp();
    util::Logger::SetWarnSink([this](const std::string& line) { warnings_.push_back(line); });
  }

  void TearDown() override { util::Logger::SetWarnSink(nullptr); }

  FakeProcessHost host_;
  std::vector<std::string> warnings_;
};

TEST_F(PersistentProcessAnchorContractTest, PA_001_CoLocatedProcessInheritsPersistence) {
  host_.PlaceCoLocated();
  host_.PlaceInContext("MainScene", "SimulationHost");
  PersistentProcessAnchor anchor(&host_, "MainScene");

  const auto& handle = anchor.Establish();
  ASSERT_TRUE(handle.has_value());
  EXPECT_TRUE(handle->inherited);
  EXPECT_TRUE(handle->location.co_located);
  EXPECT_TRUE(host_.mark_calls().empty());
  EXPECT_EQ(host_.context_lookups(), 0);
}

TEST_F(PersistentProcessAnchorContractTest, PA_002_ProcessInPrimaryContextIsMarkedPersistent) {
  host_.PlaceInContext("MainScene", "SimulationHost");
  PersistentProcessAnchor anchor(&host_, "MainScene");

  const auto& handle = anchor.Establish();
  ASSERT_TRUE(handle.has_value());
  EXPECT_FALSE(handle->inherited);
  EXPECT_EQ(handle->location.container_name, "SimulationHost");
  EXPECT_TRUE(host_.IsPersistent("SimulationHost"));
  EXPECT_TRUE(anchor.IsAnchored());
}

TEST_F(PersistentProcessAnchorContractTest, PA_003_MissingProcessOrHostWarnsButDoesNotFail) {
  PersistentProcessAnchor anchor(&host_, "MainScene");
  EXPECT_FALSE(anchor.Establish().has_value());
  EXPECT_TRUE(anchor.attempted());
  EXPECT_EQ(warnings_.size(), 1u);

  PersistentProcessAnchor hostless(nullptr, "MainScene");
  EXPECT_FALSE(hostless.Establish().has_value());
  EXPECT_EQ(warnings_.size(), 2u);

  host_.PlaceInContext("MainScene", "SimulationHost");
  host_.mark_succeeds = false;
  PersistentProcessAnchor unmarkable(&host_, "MainScene");
  EXPECT_FALSE(unmarkable.Establish().has_value());
  EXPECT_EQ(warnings_.size(), 3u);
}

TEST_F(PersistentProcessAnchorContractTest, PA_004_EstablishRunsOnce) {
  PersistentProcessAnchor anchor(&host_, "MainScene");
  EXPECT_FALSE(anchor.Establish().has_value());

  // The process appearing later does not change the first outcome.
  host_.PlaceInContext("MainScene", "SimulationHost");
  EXPECT_FALSE(anchor.Establish().has_value());
  EXPECT_EQ(host_.context_lookups(), 1);
  EXPECT_EQ(host_.co_located_lookups(), 1);
}

}  // namespace
