// Repository: Stagehand
// Component: Demo Stage
// Purpose: Canned primary/overlay presentations for the harness and server.
// Copyright (c) 2025 Stagehand

#ifndef STAGEHAND_STANDALONE_DEMO_STAGE_H_
#define STAGEHAND_STANDALONE_DEMO_STAGE_H_

#include <cstdint>
#include <memory>
#include <string>

#include "stagehand/presentation/IDataBridge.h"
#include "stagehand/presentation/IOverlayControlSurface.h"
#include "stagehand/runtime/CoordinatorConfig.h"
#include "stagehand/runtime/ViewCoordinator.h"
#include "stagehand/stage/Stage.h"

namespace stagehand::standalone {

// Overlay selector panel. Logs every toggle.
class SelectorPanel : public presentation::IOverlayControlSurface {
 public:
  void ToggleSelector() override;

  [[nodiscard]] bool open() const { return open_; }
  [[nodiscard]] uint64_t toggle_count() const { return toggle_count_; }

 private:
  bool open_ = false;
  uint64_t toggle_count_ = 0;
};

class DemoDataBridge : public presentation::IDataBridge {
 public:
  void ResolveSources() override;

  [[nodiscard]] uint64_t resolve_count() const { return resolve_count_; }

 private:
  uint64_t resolve_count_ = 0;
};

struct DemoWorld {
  std::shared_ptr<stage::Stage> stage;
  std::shared_ptr<DemoDataBridge> data_bridge;
  runtime::CoordinatorCollaborators collaborators;
};

// Builds the demo stage for `config` and loads the primary context:
//   <primary_context>: OperatorScreensCanvas (primary container),
//                      <main_output_node> with the main listener,
//                      SimulationHost running AgentSimulation,
//                      Ambience with a second enabled listener.
//   <overlay_presentation>: ValidatorCamera with its own enabled listener,
//                           ValidatorUI carrying the selector panel.
DemoWorld BuildDemoWorld(const runtime::CoordinatorConfig& config, int completion_ticks);

// Hands each newly loaded overlay's selector panel to the coordinator.
void ConnectControlSurface(stage::Stage& stage, runtime::ViewCoordinator& coordinator);

}  // namespace stagehand::standalone

#endif  // STAGEHAND_STANDALONE_DEMO_STAGE_H_
