// Repository: Stagehand
// Component: Demo Stage
// Purpose: Canned primary/overlay presentations for the harness and server.
// Copyright (c) 2025 Stagehand

#include "DemoStage.h"

#include <utility>

#include "stagehand/util/Logger.hpp"

namespace stagehand::standalone {

using util::Logger;

void SelectorPanel::ToggleSelector() {
  open_ = !open_;
  ++toggle_count_;
  Logger::Info(std::string("[SelectorPanel] Selector ") + (open_ ? "OPEN" : "CLOSED"));
}

void DemoDataBridge::ResolveSources() {
  ++resolve_count_;
  Logger::Info("[DemoDataBridge] Resolved simulation data sources (pass " +
               std::to_string(resolve_count_) + ")");
}

DemoWorld BuildDemoWorld(const runtime::CoordinatorConfig& config, int completion_ticks) {
  DemoWorld world;
  world.stage = std::make_shared<stage::Stage>("Stagehand", completion_ticks);
  world.data_bridge = std::make_shared<DemoDataBridge>();

  const std::string main_output = config.main_output_node;
  world.stage->RegisterPresentation(
      config.primary_context, [main_output](stage::ContextBuilder& b) {
        b.AddNode("OperatorScreensCanvas")
            .AddAudioSink("MainListener", main_output)
            .AddSimulationProcess("AgentSimulation", "SimulationHost")
            .AddAudioSink("AmbienceListener", "Ambience");
      });

  world.stage->RegisterPresentation(
      config.overlay_presentation, [](stage::ContextBuilder& b) {
        b.AddAudioSink("ValidatorListener", "ValidatorCamera")
            .AddNode("ValidatorUI")
            .SetControlSurface(std::make_shared<SelectorPanel>());
      });

  if (!world.stage->LoadNow(config.primary_context)) {
    Logger::Error("[DemoStage] Failed to load primary context '" +
                  config.primary_context + "'");
  }

  world.collaborators.loader = world.stage;
  world.collaborators.sink_source = world.stage;
  world.collaborators.process_host = world.stage;
  world.collaborators.primary_container = world.stage->ContainerFor("OperatorScreensCanvas");
  world.collaborators.data_bridge = world.data_bridge;
  return world;
}

void ConnectControlSurface(stage::Stage& stage, runtime::ViewCoordinator& coordinator) {
  stage.SetControlSurfaceListener(
      [&coordinator](std::weak_ptr<presentation::IOverlayControlSurface> surface) {
        coordinator.RegisterOverlayControlSurface(std::move(surface));
      });
}

}  // namespace stagehand::standalone
