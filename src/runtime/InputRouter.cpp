// Repository: Stagehand
// Component: InputRouter
// Purpose: Reduces the keys pressed in one tick to at most one ViewCommand.
// Copyright (c) 2025 Stagehand

#include "stagehand/runtime/InputRouter.h"

#include <algorithm>
#include <cctype>

namespace stagehand::runtime {

namespace {

std::string Normalize(const std::string& key) {
  std::string out(key);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (out == "esc") {
    out = "escape";
  }
  return out;
}

bool IsScreenKey(const std::string& key) {
  return key.size() == 1 && key[0] >= '1' && key[0] <= '8';
}

}  // namespace

std::optional<ViewCommand> RouteKeys(ViewState view,
                                     const std::vector<std::string>& pressed_keys) {
  bool f2 = false;
  bool v = false;
  bool screen = false;
  bool tab = false;
  bool escape = false;

  for (const auto& raw : pressed_keys) {
    const std::string key = Normalize(raw);
    if (key == "f2") f2 = true;
    else if (key == "v") v = true;
    else if (key == "tab") tab = true;
    else if (key == "escape") escape = true;
    else if (IsScreenKey(key)) screen = true;
  }

  if (f2) {
    return ViewCommand::kToggleSelector;
  }

  switch (view) {
    case ViewState::kPrimary:
      if (v) return ViewCommand::kSwitchToOverlay;
      break;
    case ViewState::kOverlay:
      if (screen) return ViewCommand::kSelectScreen;
      if (tab) return ViewCommand::kCycleScreen;
      if (escape) return ViewCommand::kBack;
      break;
  }
  return std::nullopt;
}

}  // namespace stagehand::runtime
