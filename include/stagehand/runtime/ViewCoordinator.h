// Repository: Stagehand
// Component: ViewCoordinator
// Purpose: Primary/overlay view state machine with async transitions,
//          deferred selector open and audio sink arbitration triggers.
// Copyright (c) 2025 Stagehand

#ifndef STAGEHAND_RUNTIME_VIEW_COORDINATOR_H_
#define STAGEHAND_RUNTIME_VIEW_COORDINATOR_H_

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "stagehand/audio/AudioSinkArbiter.h"
#include "stagehand/audio/IAudioSink.h"
#include "stagehand/presentation/IDataBridge.h"
#include "stagehand/presentation/IOverlayControlSurface.h"
#include "stagehand/presentation/IPresentationLoader.h"
#include "stagehand/presentation/IViewContainer.h"
#include "stagehand/runtime/CompletionChannel.h"
#include "stagehand/runtime/CoordinatorConfig.h"
#include "stagehand/runtime/DeferredActionQueue.h"
#include "stagehand/runtime/PersistentProcessAnchor.h"
#include "stagehand/runtime/ViewTypes.h"
#include "stagehand/time/ITimeSource.h"

namespace stagehand::runtime {

// Everything the coordinator talks to. loader and sink_source are required;
// the rest degrade to warnings when absent. time_source defaults to the
// steady clock.
struct CoordinatorCollaborators {
  std::shared_ptr<presentation::IPresentationLoader> loader;
  std::shared_ptr<audio::IAudioSinkSource> sink_source;
  std::shared_ptr<IProcessHost> process_host;
  std::shared_ptr<presentation::IViewContainer> primary_container;
  std::shared_ptr<presentation::IDataBridge> data_bridge;
  std::shared_ptr<time::ITimeSource> time_source;
};

// ViewCoordinator
//
// Owns which of two presentations is current and moves between them safely
// while the simulation process keeps running underneath.
//
//   [Primary] --switch_to_overlay / toggle_selector--> [Overlay]
//      ^                                                  |
//      +---- switch_to_primary / select_screen / cycle_screen / back
//
// A transition sets the transition lock, issues the loader request and
// returns. The loader's completion is posted to a CompletionChannel and
// applied at the start of a later Tick(). While locked, new transition
// requests and all tick commands are dropped, not queued.
//
// It does NOT:
// - render or lay out anything (it only toggles the primary container)
// - bind keys (see RouteKeys)
// - drive the simulation process (it only keeps it alive)
//
// Single-threaded: call everything from the tick thread. Only loader
// completions may originate elsewhere, and they go through the channel.
//
// At most one instance exists per process. Create() reports a second
// construction as a configuration error.
class ViewCoordinator {
 public:
  struct MetricsSnapshot {
    std::map<std::pair<ViewState, ViewState>, uint64_t> transitions;
    ViewState state = ViewState::kPrimary;
    bool transition_locked = false;
    bool overlay_loaded = false;
    bool control_surface_resolved = false;
    bool deferred_pending = false;
    bool process_anchored = false;
    uint64_t ticks_total = 0;
    uint64_t commands_dispatched_total = 0;
    uint64_t commands_suppressed_total = 0;  // Arrived while locked
    uint64_t ignored_request_total = 0;      // Self-transition or locked
    uint64_t load_requests_total = 0;
    uint64_t unload_requests_total = 0;
    uint64_t load_failure_total = 0;
    uint64_t unload_failure_total = 0;
    uint64_t unload_noop_total = 0;
    uint64_t immediate_flip_total = 0;       // Already-loaded / not-loaded bypass
    uint64_t stale_completion_total = 0;
    uint64_t deferred_invoked_total = 0;
    uint64_t deferred_discarded_total = 0;
    uint64_t selector_forwarded_total = 0;
    uint64_t selector_dropped_total = 0;
    uint64_t data_bridge_resolves_total = 0;
    uint64_t arbitration_passes_total = 0;
    uint64_t sinks_disabled_total = 0;
    uint64_t fallback_created_total = 0;
    std::string audio_winner;
  };

  // Returns nullptr (and logs a configuration error) if another coordinator
  // is alive, the config is invalid, or a required collaborator is missing.
  static std::unique_ptr<ViewCoordinator> Create(CoordinatorConfig config,
                                                 CoordinatorCollaborators collaborators);

  ~ViewCoordinator();

  ViewCoordinator(const ViewCoordinator&) = delete;
  ViewCoordinator& operator=(const ViewCoordinator&) = delete;

  // Anchors the simulation process and runs the startup arbitration pass.
  // Idempotent; the first Tick() calls it if the host did not.
  void Start();

  // One frame: apply pending completions, run the interval arbitration, then
  // dispatch the tick's command (if any, and only when unlocked).
  void Tick(std::optional<ViewCommand> command = std::nullopt);

  // Dispatches one command against the current state. Returns false if the
  // command was dropped (locked) or had no effect in the current view.
  bool HandleCommand(ViewCommand command);

  // Transition requests. Return true if the request was accepted. A request
  // for the current view, or any request while locked, is a silent no-op.
  bool SwitchToOverlay();
  bool SwitchToPrimary();

  // Toggle the overlay selector from any view. From the primary view this
  // queues the selector open and starts the overlay transition.
  void RequestSelector();

  // Applies every completion posted so far. Returns how many were applied.
  std::size_t ProcessCompletions();

  // Called by the overlay's own initialization code. The overlay owns the
  // surface; the coordinator keeps a weak reference.
  void RegisterOverlayControlSurface(std::weak_ptr<presentation::IOverlayControlSurface> surface);

  // Forces an arbitration pass now, outside the interval.
  audio::ArbitrationResult ArbitrateAudio();

  [[nodiscard]] ViewState state() const { return state_; }
  [[nodiscard]] bool IsTransitionLocked() const { return transition_locked_; }
  [[nodiscard]] bool IsOverlayLoaded() const { return overlay_loaded_; }
  [[nodiscard]] bool HasPendingDeferredAction() const { return deferred_.HasPending(); }
  [[nodiscard]] bool IsControlSurfaceResolved() const { return !control_surface_.expired(); }
  [[nodiscard]] bool started() const { return started_; }

  // Context whose enabled sinks win arbitration rule 2.
  [[nodiscard]] std::string PreferredAudioContext() const;

  [[nodiscard]] const CoordinatorConfig& config() const { return config_; }
  [[nodiscard]] const PersistentProcessAnchor& anchor() const { return anchor_; }
  [[nodiscard]] const audio::AudioSinkArbiter& arbiter() const { return arbiter_; }

  [[nodiscard]] MetricsSnapshot Snapshot() const;

 private:
  ViewCoordinator(CoordinatorConfig config, CoordinatorCollaborators collaborators);

  presentation::CompletionCallback MakeCompletionCallback() const;
  void ApplyCompletion(const presentation::OperationResult& result);

  void ApplyOverlayLoaded();
  void ApplyOverlayUnloaded();
  void HandleLoadFailure(const std::string& reason);
  void HandleUnloadFailure(const std::string& reason);

  void TransitionTo(ViewState to);
  void SetPrimaryVisible(bool visible);
  bool ResolveControlSurface();
  bool ForwardToggleSelector();
  void DrainDeferredAction();
  void RunArbitration(const char* reason);
  void MaybeRunIntervalArbitration();
  void LogVerbose(const std::string& line) const;

  CoordinatorConfig config_;
  CoordinatorCollaborators collaborators_;
  std::shared_ptr<CompletionChannel> completions_;

  PersistentProcessAnchor anchor_;
  audio::AudioSinkArbiter arbiter_;
  DeferredActionQueue deferred_;

  ViewState state_ = ViewState::kPrimary;
  bool transition_locked_ = false;
  bool overlay_loaded_ = false;
  bool started_ = false;
  bool warned_missing_container_ = false;

  // The one load/unload currently in flight (set only while locked).
  std::optional<presentation::OperationHandle> in_flight_;

  // registered_surface_ is what the overlay handed us; control_surface_ is
  // the resolved handle, valid only while the overlay view is up.
  std::weak_ptr<presentation::IOverlayControlSurface> registered_surface_;
  std::weak_ptr<presentation::IOverlayControlSurface> control_surface_;

  int64_t last_arbitration_ms_ = 0;

  std::map<std::pair<ViewState, ViewState>, uint64_t> transitions_;
  uint64_t ticks_total_ = 0;
  uint64_t commands_dispatched_total_ = 0;
  uint64_t commands_suppressed_total_ = 0;
  uint64_t ignored_request_total_ = 0;
  uint64_t load_requests_total_ = 0;
  uint64_t unload_requests_total_ = 0;
  uint64_t load_failure_total_ = 0;
  uint64_t unload_failure_total_ = 0;
  uint64_t unload_noop_total_ = 0;
  uint64_t immediate_flip_total_ = 0;
  uint64_t stale_completion_total_ = 0;
  uint64_t selector_forwarded_total_ = 0;
  uint64_t selector_dropped_total_ = 0;
  uint64_t data_bridge_resolves_total_ = 0;
};

}  // namespace stagehand::runtime

#endif  // STAGEHAND_RUNTIME_VIEW_COORDINATOR_H_
