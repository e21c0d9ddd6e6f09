// Repository: Stagehand
// Component: Harness Script
// Purpose: Parses the harness key script into one step per tick.
// Copyright (c) 2025 Stagehand

#ifndef STAGEHAND_STANDALONE_HARNESS_SCRIPT_H_
#define STAGEHAND_STANDALONE_HARNESS_SCRIPT_H_

#include <istream>
#include <string>
#include <vector>

namespace stagehand::standalone {

// Upper bound for a single `!idle N` line.
inline constexpr int kMaxIdleTicks = 10000;

struct ScriptStep {
  std::vector<std::string> keys;
  std::string fail_load;    // Non-empty: inject before this tick
  std::string fail_unload;
};

// SCRIPT FORMAT (one tick per line):
//   v                  keys pressed this tick (space or comma separated)
//   f2 tab             several keys in one tick
//   .                  idle tick (no keys)
//   # comment          ignored
//   !idle N            N idle ticks, 1 <= N <= kMaxIdleTicks
//   !fail-load TEXT    the next load completion fails with TEXT
//   !fail-unload TEXT  the next unload completion fails with TEXT
//
// A failure directive attaches to the next tick line. Problems (a bad idle
// count, a directive with no tick after it) are logged as warnings and the
// offending line is skipped; an idle count above the cap is clamped.
std::vector<ScriptStep> ParseScript(std::istream& in);

}  // namespace stagehand::standalone

#endif  // STAGEHAND_STANDALONE_HARNESS_SCRIPT_H_
