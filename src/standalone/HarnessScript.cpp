// Repository: Stagehand
// Component: Harness Script
// Purpose: Parses the harness key script into one step per tick.
// Copyright (c) 2025 Stagehand

#include "HarnessScript.h"

#include <sstream>
#include <utility>

#include "stagehand/util/Logger.hpp"

namespace stagehand::standalone {

using util::Logger;

std::vector<ScriptStep> ParseScript(std::istream& in) {
  std::vector<ScriptStep> steps;
  std::string pending_fail_load;
  std::string pending_fail_unload;
  std::string line;
  int line_number = 0;

  auto push_step = [&](std::vector<std::string> keys) {
    ScriptStep step;
    step.keys = std::move(keys);
    step.fail_load = std::move(pending_fail_load);
    step.fail_unload = std::move(pending_fail_unload);
    pending_fail_load.clear();
    pending_fail_unload.clear();
    steps.push_back(std::move(step));
  };

  while (std::getline(in, line)) {
    ++line_number;
    for (auto& c : line) {
      if (c == ',') c = ' ';
    }
    std::istringstream tokens(line);
    std::string first;
    if (!(tokens >> first) || first[0] == '#') {
      continue;
    }

    if (first == "!idle") {
      int count = 0;
      if (!(tokens >> count) || count < 1) {
        Logger::Warn("[HARNESS] Line " + std::to_string(line_number) +
                     ": '!idle' needs a count of at least 1; line skipped");
        continue;
      }
      if (count > kMaxIdleTicks) {
        Logger::Warn("[HARNESS] Line " + std::to_string(line_number) + ": idle count " +
                     std::to_string(count) + " clamped to " +
                     std::to_string(kMaxIdleTicks));
        count = kMaxIdleTicks;
      }
      for (int i = 0; i < count; ++i) push_step({});
      continue;
    }
    if (first == "!fail-load" || first == "!fail-unload") {
      std::string reason;
      std::getline(tokens >> std::ws, reason);
      if (reason.empty()) reason = "injected failure";
      (first == "!fail-load" ? pending_fail_load : pending_fail_unload) = reason;
      continue;
    }
    if (first == ".") {
      push_step({});
      continue;
    }

    std::vector<std::string> keys{first};
    std::string key;
    while (tokens >> key) keys.push_back(key);
    push_step(std::move(keys));
  }

  if (!pending_fail_load.empty()) {
    Logger::Warn("[HARNESS] '!fail-load " + pending_fail_load +
                 "' has no tick after it and was ignored");
  }
  if (!pending_fail_unload.empty()) {
    Logger::Warn("[HARNESS] '!fail-unload " + pending_fail_unload +
                 "' has no tick after it and was ignored");
  }
  return steps;
}

}  // namespace stagehand::standalone
