// Repository: Stagehand
// Component: View Domain Types
// Purpose: View states and the command vocabulary accepted by ViewCoordinator.
// Copyright (c) 2025 Stagehand

#ifndef STAGEHAND_RUNTIME_VIEW_TYPES_H_
#define STAGEHAND_RUNTIME_VIEW_TYPES_H_

#include <optional>
#include <string>

namespace stagehand::runtime {

// ViewState is the presentation currently shown to the operator.
// Exactly one value is current; there is no "both" or "neither".
enum class ViewState {
  kPrimary,  // Operator screens (primary view container visible)
  kOverlay,  // Overlay presentation loaded, primary container hidden
};

// Commands arrive at most once per tick from input translation or the
// control plane.
enum class ViewCommand {
  kSwitchToOverlay,
  kSwitchToPrimary,
  kToggleSelector,
  kSelectScreen,  // Operator screen hotkey (1-8); returns to primary from overlay
  kCycleScreen,   // Operator screen cycle (Tab); returns to primary from overlay
  kBack,          // Escape; returns to primary from overlay, no-op in primary
};

// The single deferred action kind this system queues.
enum class DeferredAction {
  kOpenSelector,
};

const char* ViewStateToString(ViewState state);
const char* ViewCommandToString(ViewCommand command);
const char* DeferredActionToString(DeferredAction action);

// Parses the wire/script spelling produced by ViewCommandToString
// (e.g. "switch_to_overlay"). Returns nullopt for unknown names.
std::optional<ViewCommand> ViewCommandFromString(const std::string& name);

// True for commands that send the operator back to the primary view when
// the overlay is current.
bool IsReturnToPrimaryCommand(ViewCommand command);

}  // namespace stagehand::runtime

#endif  // STAGEHAND_RUNTIME_VIEW_TYPES_H_
