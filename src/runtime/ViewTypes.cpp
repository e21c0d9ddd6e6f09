// Repository: Stagehand
// Component: View Domain Types
// Purpose: String conversions for view states and commands.
// Copyright (c) 2025 Stagehand

#include "stagehand/runtime/ViewTypes.h"

namespace stagehand::runtime {

const char* ViewStateToString(ViewState state) {
  switch (state) {
    case ViewState::kPrimary:
      return "primary";
    case ViewState::kOverlay:
      return "overlay";
  }
  return "unknown";
}

const char* ViewCommandToString(ViewCommand command) {
  switch (command) {
    case ViewCommand::kSwitchToOverlay:
      return "switch_to_overlay";
    case ViewCommand::kSwitchToPrimary:
      return "switch_to_primary";
    case ViewCommand::kToggleSelector:
      return "toggle_selector";
    case ViewCommand::kSelectScreen:
      return "select_screen";
    case ViewCommand::kCycleScreen:
      return "cycle_screen";
    case ViewCommand::kBack:
      return "back";
  }
  return "unknown";
}

const char* DeferredActionToString(DeferredAction action) {
  switch (action) {
    case DeferredAction::kOpenSelector:
      return "open_selector";
  }
  return "unknown";
}

std::optional<ViewCommand> ViewCommandFromString(const std::string& name) {
  static constexpr ViewCommand kAll[] = {
      ViewCommand::kSwitchToOverlay, ViewCommand::kSwitchToPrimary,
      ViewCommand::kToggleSelector,  ViewCommand::kSelectScreen,
      ViewCommand::kCycleScreen,     ViewCommand::kBack,
  };
  for (ViewCommand command : kAll) {
    if (name == ViewCommandToString(command)) {
      return command;
    }
  }
  return std::nullopt;
}

bool IsReturnToPrimaryCommand(ViewCommand command) {
  return command == ViewCommand::kSwitchToPrimary ||
         command == ViewCommand::kSelectScreen ||
         command == ViewCommand::kCycleScreen ||
         command == ViewCommand::kBack;
}

}  // namespace stagehand::runtime
