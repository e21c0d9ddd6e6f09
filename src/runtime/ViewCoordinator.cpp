// Repository: Stagehand
// Component: ViewCoordinator
// Purpose: Primary/overlay view state machine with async transitions,
//          deferred selector open and audio sink arbitration triggers.
// Copyright (c) 2025 Stagehand

#include "stagehand/runtime/ViewCoordinator.h"

#include <atomic>
#include <utility>

#include "stagehand/time/SystemTimeSource.h"
#include "stagehand/util/Logger.hpp"

namespace stagehand::runtime {

using util::Logger;

namespace {

// One coordinator per process. Cleared by the destructor.
std::atomic<bool> g_instance_alive{false};

}  // namespace

std::unique_ptr<ViewCoordinator> ViewCoordinator::Create(
    CoordinatorConfig config, CoordinatorCollaborators collaborators) {
  if (!config.IsValid()) {
    Logger::Error("[ViewCoordinator] Configuration error: invalid config " +
                  config.ToJson());
    return nullptr;
  }
  if (!collaborators.loader) {
    Logger::Error("[ViewCoordinator] Configuration error: no presentation loader");
    return nullptr;
  }
  if (!collaborators.sink_source) {
    Logger::Error("[ViewCoordinator] Configuration error: no audio sink source");
    return nullptr;
  }

  bool expected = false;
  if (!g_instance_alive.compare_exchange_strong(expected, true)) {
    Logger::Error("[ViewCoordinator] Configuration error: a coordinator instance "
                  "already exists; refusing to create a second one");
    return nullptr;
  }

  if (!collaborators.time_source) {
    collaborators.time_source = std::make_shared<time::SystemTimeSource>();
  }

  return std::unique_ptr<ViewCoordinator>(
      new ViewCoordinator(std::move(config), std::move(collaborators)));
}

ViewCoordinator::ViewCoordinator(CoordinatorConfig config,
                                 CoordinatorCollaborators collaborators)
    : config_(std::move(config)),
      collaborators_(std::move(collaborators)),
      completions_(std::make_shared<CompletionChannel>()),
      anchor_(collaborators_.process_host.get(), config_.primary_context),
      arbiter_(collaborators_.sink_source.get(), config_.ToArbiterConfig()) {}

ViewCoordinator::~ViewCoordinator() {
  if (in_flight_) {
    Logger::Warn(std::string("[ViewCoordinator] Destroyed with ") +
                 presentation::OperationKindToString(in_flight_->kind) + " of '" +
                 in_flight_->presentation + "' still in flight");
  }
  g_instance_alive.store(false);
}

void ViewCoordinator::Start() {
  if (started_) {
    return;
  }
  started_ = true;

  anchor_.Establish();

  if (!collaborators_.primary_container) {
    Logger::Warn("[ViewCoordinator] No primary view container wired; "
                 "view switching will not hide/show operator screens");
    warned_missing_container_ = true;
  }

  RunArbitration("startup");
  LogVerbose("[ViewCoordinator] Initialized: view=primary overlay='" +
             config_.overlay_presentation + "' primary_context='" +
             config_.primary_context + "'");
}

void ViewCoordinator::Tick(std::optional<ViewCommand> command) {
  if (!started_) {
    Start();
  }
  ++ticks_total_;

  ProcessCompletions();
  MaybeRunIntervalArbitration();

  if (!command) {
    return;
  }

  if (transition_locked_) {
    ++commands_suppressed_total_;
    Logger::Debug(std::string("[ViewCoordinator] Command ") +
                  ViewCommandToString(*command) + " dropped: transition in progress");
    return;
  }

  HandleCommand(*command);
}

bool ViewCoordinator::HandleCommand(ViewCommand command) {
  if (transition_locked_) {
    ++commands_suppressed_total_;
    return false;
  }
  ++commands_dispatched_total_;

  switch (state_) {
    case ViewState::kPrimary:
      if (command == ViewCommand::kToggleSelector) {
        RequestSelector();
        return true;
      }
      if (command == ViewCommand::kSwitchToOverlay) {
        return SwitchToOverlay();
      }
      if (command == ViewCommand::kSwitchToPrimary) {
        return SwitchToPrimary();
      }
      // Screen keys and back belong to the operator screens here.
      return false;

    case ViewState::kOverlay:
      if (command == ViewCommand::kToggleSelector) {
        return ForwardToggleSelector();
      }
      if (IsReturnToPrimaryCommand(command)) {
        return SwitchToPrimary();
      }
      if (command == ViewCommand::kSwitchToOverlay) {
        return SwitchToOverlay();
      }
      return false;
  }
  return false;
}

bool ViewCoordinator::SwitchToOverlay() {
  if (state_ == ViewState::kOverlay || transition_locked_) {
    ++ignored_request_total_;
    return false;
  }

  LogVerbose("[ViewCoordinator] Switching to overlay view...");
  transition_locked_ = true;
  SetPrimaryVisible(false);

  if (!overlay_loaded_) {
    auto handle = collaborators_.loader->LoadOverlay(config_.overlay_presentation,
                                                     MakeCompletionCallback());
    if (!handle) {
      HandleLoadFailure("presentation is not registered or not loadable");
      return false;
    }
    in_flight_ = std::move(handle);
    ++load_requests_total_;
    return true;
  }

  // Overlay resources are already resident: flip without a round-trip.
  ++immediate_flip_total_;
  TransitionTo(ViewState::kOverlay);
  transition_locked_ = false;
  ResolveControlSurface();
  RunArbitration("overlay already loaded");
  DrainDeferredAction();
  LogVerbose("[ViewCoordinator] Overlay already loaded, view active");
  return true;
}

bool ViewCoordinator::SwitchToPrimary() {
  if (state_ == ViewState::kPrimary || transition_locked_) {
    ++ignored_request_total_;
    return false;
  }

  LogVerbose("[ViewCoordinator] Switching to primary view...");
  transition_locked_ = true;
  SetPrimaryVisible(true);

  if (overlay_loaded_) {
    auto handle = collaborators_.loader->UnloadOverlay(config_.overlay_presentation,
                                                       MakeCompletionCallback());
    if (!handle) {
      // Nothing resident to unload; same outcome as a completed unload.
      ++unload_noop_total_;
      LogVerbose("[ViewCoordinator] Overlay was not loaded, primary view active");
      ApplyOverlayUnloaded();
      return true;
    }
    in_flight_ = std::move(handle);
    ++unload_requests_total_;
    return true;
  }

  ++immediate_flip_total_;
  ApplyOverlayUnloaded();
  return true;
}

void ViewCoordinator::RequestSelector() {
  if (state_ == ViewState::kOverlay) {
    ForwardToggleSelector();
    return;
  }

  deferred_.Set(DeferredAction::kOpenSelector);
  SwitchToOverlay();
}

std::size_t ViewCoordinator::ProcessCompletions() {
  auto results = completions_->DrainAll();
  for (const auto& result : results) {
    ApplyCompletion(result);
  }
  return results.size();
}

void ViewCoordinator::RegisterOverlayControlSurface(
    std::weak_ptr<presentation::IOverlayControlSurface> surface) {
  registered_surface_ = std::move(surface);
  Logger::Debug("[ViewCoordinator] Overlay control surface registered");
}

audio::ArbitrationResult ViewCoordinator::ArbitrateAudio() {
  last_arbitration_ms_ = collaborators_.time_source->NowMonotonicMs();
  return arbiter_.Arbitrate(PreferredAudioContext());
}

std::string ViewCoordinator::PreferredAudioContext() const {
  if (state_ == ViewState::kOverlay && overlay_loaded_) {
    return config_.overlay_presentation;
  }
  return config_.primary_context;
}

ViewCoordinator::MetricsSnapshot ViewCoordinator::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.transitions = transitions_;
  snapshot.state = state_;
  snapshot.transition_locked = transition_locked_;
  snapshot.overlay_loaded = overlay_loaded_;
  snapshot.control_surface_resolved = !control_surface_.expired();
  snapshot.deferred_pending = deferred_.HasPending();
  snapshot.process_anchored = anchor_.IsAnchored();
  snapshot.ticks_total = ticks_total_;
  snapshot.commands_dispatched_total = commands_dispatched_total_;
  snapshot.commands_suppressed_total = commands_suppressed_total_;
  snapshot.ignored_request_total = ignored_request_total_;
  snapshot.load_requests_total = load_requests_total_;
  snapshot.unload_requests_total = unload_requests_total_;
  snapshot.load_failure_total = load_failure_total_;
  snapshot.unload_failure_total = unload_failure_total_;
  snapshot.unload_noop_total = unload_noop_total_;
  snapshot.immediate_flip_total = immediate_flip_total_;
  snapshot.stale_completion_total = stale_completion_total_;
  snapshot.deferred_invoked_total = deferred_.invoked_total();
  snapshot.deferred_discarded_total = deferred_.discarded_total();
  snapshot.selector_forwarded_total = selector_forwarded_total_;
  snapshot.selector_dropped_total = selector_dropped_total_;
  snapshot.data_bridge_resolves_total = data_bridge_resolves_total_;

  const auto& stats = arbiter_.stats();
  snapshot.arbitration_passes_total = stats.passes_total;
  snapshot.sinks_disabled_total = stats.sinks_disabled_total;
  snapshot.fallback_created_total = stats.fallback_created_total;
  snapshot.audio_winner = stats.last_winner;
  return snapshot;
}

presentation::CompletionCallback ViewCoordinator::MakeCompletionCallback() const {
  // Weak: a loader may outlive the coordinator and still fire.
  std::weak_ptr<CompletionChannel> channel = completions_;
  return [channel](const presentation::OperationResult& result) {
    if (auto live = channel.lock()) {
      live->Post(result);
    }
  };
}

void ViewCoordinator::ApplyCompletion(const presentation::OperationResult& result) {
  if (!in_flight_ || in_flight_->id != result.handle.id) {
    ++stale_completion_total_;
    Logger::Warn(std::string("[ViewCoordinator] Ignoring stale ") +
                 presentation::OperationKindToString(result.handle.kind) +
                 " completion for '" + result.handle.presentation + "' (op " +
                 std::to_string(result.handle.id) + ")");
    return;
  }
  in_flight_.reset();

  if (result.handle.kind == presentation::OperationKind::kLoad) {
    if (result.success) {
      ApplyOverlayLoaded();
    } else {
      HandleLoadFailure(result.message);
    }
    return;
  }

  if (result.success) {
    ApplyOverlayUnloaded();
  } else {
    HandleUnloadFailure(result.message);
  }
}

void ViewCoordinator::ApplyOverlayLoaded() {
  overlay_loaded_ = true;
  TransitionTo(ViewState::kOverlay);
  transition_locked_ = false;

  if (!ResolveControlSurface()) {
    Logger::Warn("[ViewCoordinator] Overlay loaded but registered no control "
                 "surface; selector commands will be ignored until it does");
  }

  if (collaborators_.data_bridge) {
    collaborators_.data_bridge->ResolveSources();
    ++data_bridge_resolves_total_;
  }

  RunArbitration("overlay loaded");
  DrainDeferredAction();
  LogVerbose("[ViewCoordinator] Overlay '" + config_.overlay_presentation +
             "' loaded, view active");
}

void ViewCoordinator::ApplyOverlayUnloaded() {
  overlay_loaded_ = false;
  TransitionTo(ViewState::kPrimary);
  transition_locked_ = false;
  control_surface_.reset();
  registered_surface_.reset();

  RunArbitration("overlay unloaded");
  LogVerbose("[ViewCoordinator] Overlay unloaded, primary view active");
}

void ViewCoordinator::HandleLoadFailure(const std::string& reason) {
  ++load_failure_total_;
  Logger::Error("[ViewCoordinator] Failed to load overlay '" +
                config_.overlay_presentation + "': " + reason);

  SetPrimaryVisible(true);
  transition_locked_ = false;
  if (deferred_.Clear()) {
    Logger::Warn(std::string("[ViewCoordinator] Discarded pending ") +
                 DeferredActionToString(DeferredAction::kOpenSelector) +
                 ": overlay unavailable");
  }
}

void ViewCoordinator::HandleUnloadFailure(const std::string& reason) {
  // The primary container is already visible again. The overlay's resources
  // are presumed still resident, so the next switch to overlay takes the
  // already-loaded path and the next switch back retries the unload.
  ++unload_failure_total_;
  Logger::Error("[ViewCoordinator] Failed to unload overlay '" +
                config_.overlay_presentation + "': " + reason);

  TransitionTo(ViewState::kPrimary);
  transition_locked_ = false;
  control_surface_.reset();
  RunArbitration("overlay unload failed");
}

void ViewCoordinator::TransitionTo(ViewState to) {
  if (state_ == to) {
    return;
  }
  transitions_[{state_, to}]++;
  state_ = to;
}

void ViewCoordinator::SetPrimaryVisible(bool visible) {
  auto& container = collaborators_.primary_container;
  if (!container) {
    if (!warned_missing_container_) {
      Logger::Warn("[ViewCoordinator] No primary view container wired; "
                   "view switching will not hide/show operator screens");
      warned_missing_container_ = true;
    }
    return;
  }

  container->SetVisible(visible);
  LogVerbose("[ViewCoordinator] Primary container '" + container->GetName() + "' " +
             (visible ? "SHOWN" : "HIDDEN"));
}

bool ViewCoordinator::ResolveControlSurface() {
  control_surface_ = registered_surface_;
  return !control_surface_.expired();
}

bool ViewCoordinator::ForwardToggleSelector() {
  auto surface = control_surface_.lock();
  if (!surface) {
    // One re-resolve attempt; the overlay may have registered late.
    ResolveControlSurface();
    surface = control_surface_.lock();
  }

  if (!surface) {
    ++selector_dropped_total_;
    Logger::Warn("[ViewCoordinator] Selector toggle ignored: overlay control "
                 "surface not registered");
    return false;
  }

  surface->ToggleSelector();
  ++selector_forwarded_total_;
  return true;
}

void ViewCoordinator::DrainDeferredAction() {
  deferred_.DrainIfPending([this](DeferredAction action) {
    if (action == DeferredAction::kOpenSelector) {
      ForwardToggleSelector();
    }
  });
}

void ViewCoordinator::RunArbitration(const char* reason) {
  Logger::Debug(std::string("[ViewCoordinator] Audio arbitration: ") + reason);
  ArbitrateAudio();
}

void ViewCoordinator::MaybeRunIntervalArbitration() {
  const int64_t now_ms = collaborators_.time_source->NowMonotonicMs();
  if (now_ms - last_arbitration_ms_ >= config_.arbitration_interval_ms) {
    RunArbitration("interval");
  }
}

void ViewCoordinator::LogVerbose(const std::string& line) const {
  if (config_.verbose_logging) {
    Logger::Info(line);
  } else {
    Logger::Debug(line);
  }
}

}  // namespace stagehand::runtime
