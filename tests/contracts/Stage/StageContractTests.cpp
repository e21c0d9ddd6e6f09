// Contract tests for the in-memory stage and the coordinator running on it.

#include "../../BaseContractTest.h"
#include "../ContractRegistryEnvironment.h"

#include <memory>
#include <string>
#include <vector>

#include "stagehand/runtime/ViewCoordinator.h"
#include "stagehand/stage/Stage.h"
#include "../../fixtures/FakeViewCollaborators.h"
#include "../../support/DeterministicTimeSource.hpp"

using namespace stagehand;
using namespace stagehand::tests;

namespace {

using runtime::ViewCommand;
using runtime::ViewCoordinator;
using runtime::ViewState;
using stage::ContextBuilder;
using stage::Stage;
using stagehand::tests::RegisterExpectedDomainCoverage;

const bool kRegisterCoverage = []() {
  RegisterExpectedDomainCoverage("Stage", {"ST-001", "ST-002", "ST-003", "ST-004"});
  return true;
}();

std::vector<std::string> SinkNames(const Stage& stage) {
  std::vector<std::string> names;
  for (const auto& sink : stage.EnumerateSinks()) {
    names.push_back(sink->GetName());
  }
  return names;
}

std::size_t EnabledReachable(const Stage& stage) {
  std::size_t count = 0;
  for (const auto& sink : stage.EnumerateSinks()) {
    if (sink->IsActiveInHierarchy() && sink->IsEnabled()) ++count;
  }
  return count;
}

class StageContractTest : public BaseContractTest {
 protected:
  [[nodiscard]] std::string DomainName() const override { return "Stage"; }

  [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override {
    return {"ST-001", "ST-002", "ST-003", "ST-004"};
  }

  void SetUp() override {
    BaseContractTest::SetUp();
    stage_ = std::make_shared<Stage>("Stagehand", 2);
    surface_ = std::make_shared<fixtures::RecordingControlSurface>();

    stage_->RegisterPresentation("MainScene", [](ContextBuilder& b) {
      b.AddNode("OperatorScreensCanvas")
          .AddAudioSink("MainListener", "MainCamera")
          .AddSimulationProcess("AgentSimulation", "SimulationHost")
          .AddAudioSink("AmbienceListener", "Ambience");
    });
    auto surface = surface_;
    stage_->RegisterPresentation("Validator", [surface](ContextBuilder& b) {
      b.AddAudioSink("ValidatorListener", "ValidatorCamera")
          .AddNode("ValidatorUI")
          .SetControlSurface(surface);
    });
  }

  void TearDown() override { coordinator_.reset(); }

  ViewCoordinator& MakeCoordinator() {
    EXPECT_TRUE(stage_->LoadNow("MainScene"));
    runtime::CoordinatorCollaborators c;
    c.loader = stage_;
    c.sink_source = stage_;
    c.process_host = stage_;
    c.primary_container = stage_->ContainerFor("OperatorScreensCanvas");
    c.time_source = std::make_shared<DeterministicTimeSource>(0);

    runtime::CoordinatorConfig config;
    config.verbose_logging = false;
    coordinator_ = ViewCoordinator::Create(config, c);
    EXPECT_NE(coordinator_, nullptr);

    auto* coordinator = coordinator_.get();
    stage_->SetControlSurfaceListener(
        [coordinator](std::weak_ptr<presentation::IOverlayControlSurface> s) {
          coordinator->RegisterOverlayControlSurface(std::move(s));
        });
    coordinator_->Start();
    return *coordinator_;
  }

  // Ticks the stage and coordinator together until the transition settles.
  void RunUntilSettled(int max_ticks = 10) {
    for (int i = 0; i < max_ticks && coordinator_->IsTransitionLocked(); ++i) {
      stage_->Advance();
      coordinator_->Tick();
    }
    ASSERT_FALSE(coordinator_->IsTransitionLocked());
  }

  std::shared_ptr<Stage> stage_;
  std::shared_ptr<fixtures::RecordingControlSurface> surface_;
  std::unique_ptr<ViewCoordinator> coordinator_;
};

// =============================================================================
// ST-001: Asynchronous load/unload
// =============================================================================

TEST_F(StageContractTest, ST_001_OperationsCompleteAfterConfiguredTicks) {
  std::vector<presentation::OperationResult> results;
  auto record = [&results](const presentation::OperationResult& r) { results.push_back(r); };

  auto load = stage_->LoadOverlay("Validator", record);
  ASSERT_TRUE(load.has_value());
  EXPECT_EQ(load->kind, presentation::OperationKind::kLoad);

  EXPECT_EQ(stage_->Advance(), 0u);
  EXPECT_FALSE(stage_->IsLoaded("Validator"));
  EXPECT_EQ(stage_->Advance(), 1u);
  EXPECT_TRUE(stage_->IsLoaded("Validator"));
  ASSERT_EQ(results.size(), 1u);
  EXPECT_TRUE(results[0].success);
  EXPECT_EQ(results[0].handle.id, load->id);

  auto unload = stage_->UnloadOverlay("Validator", record);
  ASSERT_TRUE(unload.has_value());
  EXPECT_NE(unload->id, load->id);
  stage_->Advance();
  stage_->Advance();
  EXPECT_FALSE(stage_->IsLoaded("Validator"));
  ASSERT_EQ(results.size(), 2u);
  EXPECT_TRUE(results[1].success);
}

TEST_F(StageContractTest, ST_001_UnknownOrAbsentContextsAreRejected) {
  EXPECT_FALSE(stage_->LoadOverlay("Nowhere", nullptr).has_value());
  EXPECT_FALSE(stage_->UnloadOverlay("Validator", nullptr).has_value());
  EXPECT_FALSE(stage_->UnloadOverlay(stage::kPersistentContextName, nullptr).has_value());
  EXPECT_FALSE(stage_->RegisterPresentation(stage::kPersistentContextName,
                                            [](ContextBuilder&) {}));
  EXPECT_FALSE(stage_->RegisterPresentation("Validator", [](ContextBuilder&) {}));
  EXPECT_EQ(stage_->PendingOperations(), 0u);
}

TEST_F(StageContractTest, ST_001_InjectedFailuresAreReported) {
  std::vector<presentation::OperationResult> results;
  auto record = [&results](const presentation::OperationResult& r) { results.push_back(r); };

  stage_->FailNextLoad("asset missing");
  ASSERT_TRUE(stage_->LoadOverlay("Validator", record).has_value());
  stage_->Advance();
  stage_->Advance();
  ASSERT_EQ(results.size(), 1u);
  EXPECT_FALSE(results[0].success);
  EXPECT_EQ(results[0].message, "asset missing");
  EXPECT_FALSE(stage_->IsLoaded("Validator"));
}

// =============================================================================
// ST-002: Sink enumeration and reachability
// =============================================================================

TEST_F(StageContractTest, ST_002_SinksEnumerateInLoadThenInsertionOrder) {
  ASSERT_TRUE(stage_->LoadNow("MainScene"));
  ASSERT_TRUE(stage_->LoadNow("Validator"));
  const std::vector<std::string> expected = {"MainListener", "AmbienceListener",
                                             "ValidatorListener"};
  EXPECT_EQ(SinkNames(*stage_), expected);
  EXPECT_EQ(SinkNames(*stage_), expected);

  auto fallback = stage_->CreateFallbackSink("StagehandFallbackAudioSink");
  ASSERT_NE(fallback, nullptr);
  EXPECT_EQ(fallback->GetContextName(), stage::kPersistentContextName);
  EXPECT_EQ(SinkNames(*stage_).front(), "StagehandFallbackAudioSink");
}

TEST_F(StageContractTest, ST_002_HiddenContainerMakesItsSinksUnreachable) {
  stage_->RegisterPresentation("Console", [](ContextBuilder& b) {
    b.AddAudioSink("ConsoleListener", "ConsoleCanvas");
  });
  ASSERT_TRUE(stage_->LoadNow("Console"));
  auto container = stage_->ContainerFor("ConsoleCanvas");
  ASSERT_NE(container, nullptr);

  auto sink = stage_->FindSink("ConsoleListener");
  ASSERT_NE(sink, nullptr);
  EXPECT_TRUE(sink->IsActiveInHierarchy());
  container->SetVisible(false);
  EXPECT_FALSE(sink->IsActiveInHierarchy());
  EXPECT_EQ(stage_->ContainerFor("NoSuchNode"), nullptr);
}

TEST_F(StageContractTest, ST_002_InactiveSinkIsSkippedByArbitration) {
  auto& coordinator = MakeCoordinator();
  auto main_sink = stage_->FindSink("MainListener");
  auto ambience = stage_->FindSink("AmbienceListener");
  ASSERT_NE(main_sink, nullptr);
  ASSERT_NE(ambience, nullptr);
  ASSERT_TRUE(main_sink->IsEnabled());
  ASSERT_FALSE(ambience->IsEnabled());

  // The sink component goes inactive while its node stays up.
  main_sink->SetActive(false);
  EXPECT_FALSE(main_sink->IsActiveInHierarchy());
  EXPECT_TRUE(stage_->FindNode("MainCamera")->active);

  // Nothing reachable is enabled any more, so the fallback takes over.
  auto result = coordinator.ArbitrateAudio();
  ASSERT_NE(result.winner, nullptr);
  EXPECT_EQ(result.winner->GetName(), "StagehandFallbackAudioSink");
  EXPECT_EQ(result.winner->GetContextName(), stage::kPersistentContextName);
  EXPECT_TRUE(main_sink->IsEnabled());  // Unreachable sinks are left as they are
  EXPECT_FALSE(ambience->IsEnabled());
  EXPECT_EQ(EnabledReachable(*stage_), 1u);

  // Back in the hierarchy, the main output wins again and the fallback yields.
  main_sink->SetActive(true);
  result = coordinator.ArbitrateAudio();
  EXPECT_EQ(result.winner, main_sink);
  EXPECT_FALSE(stage_->FindSink("StagehandFallbackAudioSink")->IsEnabled());
  EXPECT_EQ(EnabledReachable(*stage_), 1u);
}

// =============================================================================
// ST-003: Process location and persistence
// =============================================================================

TEST_F(StageContractTest, ST_003_PersistentNodeSurvivesUnloadOfItsContext) {
  ASSERT_TRUE(stage_->LoadNow("MainScene"));
  auto location = stage_->FindProcessInContext("MainScene");
  ASSERT_TRUE(location.has_value());
  EXPECT_EQ(location->container_name, "SimulationHost");
  EXPECT_FALSE(stage_->FindCoLocatedProcess().has_value());

  ASSERT_TRUE(stage_->MarkPersistent("SimulationHost"));
  EXPECT_FALSE(stage_->MarkPersistent("NoSuchNode"));

  ASSERT_TRUE(stage_->UnloadOverlay("MainScene", nullptr).has_value());
  stage_->Advance();
  stage_->Advance();
  EXPECT_FALSE(stage_->IsLoaded("MainScene"));

  auto node = stage_->FindNode("SimulationHost");
  ASSERT_NE(node, nullptr);
  EXPECT_TRUE(node->persistent);
  EXPECT_EQ(node->context_name, stage::kPersistentContextName);
  EXPECT_EQ(stage_->FindNode("OperatorScreensCanvas"), nullptr);
}

// =============================================================================
// ST-004: Coordinator end to end on the stage
// =============================================================================

TEST_F(StageContractTest, ST_004_SelectorFromPrimaryEndToEnd) {
  auto& coordinator = MakeCoordinator();
  EXPECT_TRUE(coordinator.anchor().IsAnchored());
  EXPECT_EQ(EnabledReachable(*stage_), 1u);
  EXPECT_TRUE(stage_->FindSink("MainListener")->IsEnabled());

  coordinator.Tick(ViewCommand::kToggleSelector);
  EXPECT_EQ(stage_->PendingOperations(), 1u);
  EXPECT_FALSE(stage_->FindNode("OperatorScreensCanvas")->active);
  RunUntilSettled();

  EXPECT_EQ(coordinator.state(), ViewState::kOverlay);
  EXPECT_TRUE(stage_->IsLoaded("Validator"));
  EXPECT_EQ(surface_->toggle_count(), 1);
  EXPECT_EQ(EnabledReachable(*stage_), 1u);
  EXPECT_TRUE(stage_->FindSink("MainListener")->IsEnabled());
  EXPECT_FALSE(stage_->FindSink("ValidatorListener")->IsEnabled());

  coordinator.Tick(ViewCommand::kBack);
  RunUntilSettled();

  EXPECT_EQ(coordinator.state(), ViewState::kPrimary);
  EXPECT_FALSE(stage_->IsLoaded("Validator"));
  EXPECT_TRUE(stage_->FindNode("OperatorScreensCanvas")->active);
  EXPECT_NE(stage_->FindNode("SimulationHost"), nullptr);
  EXPECT_EQ(EnabledReachable(*stage_), 1u);
}

TEST_F(StageContractTest, ST_004_FailedLoadOnStageRollsBack) {
  auto& coordinator = MakeCoordinator();
  stage_->FailNextLoad("asset missing");

  coordinator.Tick(ViewCommand::kSwitchToOverlay);
  RunUntilSettled();

  EXPECT_EQ(coordinator.state(), ViewState::kPrimary);
  EXPECT_FALSE(stage_->IsLoaded("Validator"));
  EXPECT_TRUE(stage_->FindNode("OperatorScreensCanvas")->active);
  EXPECT_EQ(coordinator.Snapshot().load_failure_total, 1u);
}

}  // namespace
