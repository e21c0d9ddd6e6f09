// Repository: Stagehand
// Component: InputRouter
// Purpose: Reduces the keys pressed in one tick to at most one ViewCommand.
// Copyright (c) 2025 Stagehand

#ifndef STAGEHAND_RUNTIME_INPUT_ROUTER_H_
#define STAGEHAND_RUNTIME_INPUT_ROUTER_H_

#include <optional>
#include <string>
#include <vector>

#include "stagehand/runtime/ViewTypes.h"

namespace stagehand::runtime {

// Fixed key table, priority resolved per view:
//
//   Primary: F2 -> toggle_selector, else V -> switch_to_overlay
//   Overlay: F2 -> toggle_selector, else 1..8 -> select_screen,
//            else Tab -> cycle_screen, else Escape -> back
//
// Key names are case-insensitive ("esc" is accepted for Escape). Keys with
// no meaning in the current view are ignored; screen keys in the primary
// view belong to the operator screens, not to the coordinator.
std::optional<ViewCommand> RouteKeys(ViewState view,
                                     const std::vector<std::string>& pressed_keys);

}  // namespace stagehand::runtime

#endif  // STAGEHAND_RUNTIME_INPUT_ROUTER_H_
