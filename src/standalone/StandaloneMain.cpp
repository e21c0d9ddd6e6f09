// Repository: Stagehand
// Component: Standalone View Coordinator Harness
// Purpose: Drives the view coordinator over the demo stage from a key script
//          and prints a diagnostic timeline.
// Copyright (c) 2025 Stagehand
//
// This binary is for testing and diagnostics only.
//
// SCRIPT FORMAT (one tick per line):
//   v                  keys pressed this tick (space or comma separated)
//   f2 tab             several keys in one tick
//   .                  idle tick (no keys)
//   # comment          ignored
//   !idle N            N idle ticks (capped)
//   !fail-load TEXT    the next load completion fails with TEXT
//   !fail-unload TEXT  the next unload completion fails with TEXT

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "DemoStage.h"
#include "HarnessScript.h"
#include "stagehand/runtime/CoordinatorConfig.h"
#include "stagehand/runtime/InputRouter.h"
#include "stagehand/runtime/ViewCoordinator.h"
#include "stagehand/util/Logger.hpp"

namespace {

using stagehand::runtime::CoordinatorConfig;
using stagehand::runtime::ViewCoordinator;
using stagehand::standalone::ParseScript;
using stagehand::standalone::ScriptStep;

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    std::cerr << "\n[HARNESS] Received signal " << signal << ", requesting termination...\n";
    g_termination_requested.store(true, std::memory_order_release);
  }
}

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  std::string script_path;  // Empty: built-in demo script
  std::string config_path;
  int completion_ticks = 2;
  bool diagnostic = false;
  bool debug = false;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Standalone view coordinator harness for testing and diagnostics.\n"
            << "Runs the coordinator against an in-memory demo stage, one script\n"
            << "line per tick.\n"
            << "\n"
            << "OPTIONS:\n"
            << "  --script PATH        Key script (default: built-in demo script)\n"
            << "  --config PATH        Coordinator config JSON (default: built-in defaults)\n"
            << "  --load-ticks N       Ticks until a load/unload completes (default: 2)\n"
            << "  --diagnostic         Print the per-tick timeline to stdout\n"
            << "  --debug              Enable debug log lines\n"
            << "  --help               Show this help message\n"
            << "\n"
            << "EXAMPLES:\n"
            << "  " << program_name << " --diagnostic\n"
            << "  " << program_name << " --script keys.txt --config stagehand.json --diagnostic\n"
            << "\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--script" && i + 1 < argc) {
      args.script_path = argv[++i];
    } else if (arg == "--config" && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if (arg == "--load-ticks" && i + 1 < argc) {
      args.completion_ticks = std::atoi(argv[++i]);
    } else if (arg == "--diagnostic") {
      args.diagnostic = true;
    } else if (arg == "--debug") {
      args.debug = true;
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }

  if (args.completion_ticks < 1) {
    args.error = "--load-ticks must be at least 1";
    return args;
  }

  args.valid = true;
  return args;
}

// =============================================================================
// Script
// =============================================================================

const char* kDemoScript =
    "# Open the overlay, let it load, go back.\n"
    "v\n"
    "!idle 3\n"
    "escape\n"
    "!idle 3\n"
    "# Selector from the primary view opens once the overlay is up.\n"
    "f2\n"
    "v\n"
    "!idle 3\n"
    "f2\n"
    "3\n"
    "!idle 3\n"
    "# Failed load rolls back to the primary view.\n"
    "!fail-load simulated asset error\n"
    "f2\n"
    "!idle 3\n";

std::string JoinKeys(const std::vector<std::string>& keys) {
  std::string out;
  for (const auto& k : keys) {
    if (!out.empty()) out += "+";
    out += k;
  }
  return out.empty() ? "-" : out;
}

// =============================================================================
// Diagnostic Output
// =============================================================================

void PrintDiagnosticHeader(const CoordinatorConfig& config) {
  std::cout << "\n";
  std::cout << "=== View Coordinator Timeline ===\n";
  std::cout << "Overlay: " << config.overlay_presentation
            << "  Primary context: " << config.primary_context
            << "  Main output: " << config.main_output_node << "\n";
  std::cout << std::left
            << std::setw(6) << "TICK"
            << std::setw(14) << "KEYS"
            << std::setw(20) << "COMMAND"
            << std::setw(9) << "VIEW"
            << std::setw(8) << "LOCKED"
            << std::setw(8) << "LOADED"
            << "AUDIO\n";
  std::cout << std::string(80, '-') << "\n";
}

void PrintTimelineRow(uint64_t tick, const std::vector<std::string>& keys,
                      const std::optional<stagehand::runtime::ViewCommand>& command,
                      const ViewCoordinator& coordinator) {
  const auto snapshot = coordinator.Snapshot();
  std::cout << std::left
            << std::setw(6) << tick
            << std::setw(14) << JoinKeys(keys)
            << std::setw(20)
            << (command ? stagehand::runtime::ViewCommandToString(*command) : "-")
            << std::setw(9) << stagehand::runtime::ViewStateToString(snapshot.state)
            << std::setw(8) << (snapshot.transition_locked ? "yes" : "no")
            << std::setw(8) << (snapshot.overlay_loaded ? "yes" : "no")
            << (snapshot.audio_winner.empty() ? "<none>" : snapshot.audio_winner)
            << "\n";
}

void PrintSummary(const ViewCoordinator& coordinator) {
  const auto s = coordinator.Snapshot();
  std::cout << "\n=== Summary ===\n"
            << "Final view:            " << stagehand::runtime::ViewStateToString(s.state) << "\n"
            << "Overlay loaded:        " << (s.overlay_loaded ? "yes" : "no") << "\n"
            << "Process anchored:      " << (s.process_anchored ? "yes" : "no") << "\n"
            << "Ticks:                 " << s.ticks_total << "\n"
            << "Loads / unloads:       " << s.load_requests_total << " / "
            << s.unload_requests_total << "\n"
            << "Load failures:         " << s.load_failure_total << "\n"
            << "Unload failures:       " << s.unload_failure_total << "\n"
            << "Suppressed commands:   " << s.commands_suppressed_total << "\n"
            << "Ignored requests:      " << s.ignored_request_total << "\n"
            << "Deferred invoked:      " << s.deferred_invoked_total << "\n"
            << "Deferred discarded:    " << s.deferred_discarded_total << "\n"
            << "Selector forwarded:    " << s.selector_forwarded_total << "\n"
            << "Arbitration passes:    " << s.arbitration_passes_total << "\n"
            << "Sinks disabled:        " << s.sinks_disabled_total << "\n"
            << "Fallback created:      " << s.fallback_created_total << "\n"
            << "Audio winner:          "
            << (s.audio_winner.empty() ? "<none>" : s.audio_winner) << "\n";
}

int Run(const CliArgs& args) {
  using namespace stagehand;

  CoordinatorConfig config;
  if (!args.config_path.empty()) {
    auto loaded = CoordinatorConfig::FromFile(args.config_path);
    if (!loaded) {
      std::cerr << "Error: Failed to load config from " << args.config_path << "\n";
      return 1;
    }
    config = *loaded;
  }

  std::vector<ScriptStep> steps;
  if (args.script_path.empty()) {
    std::istringstream demo(kDemoScript);
    steps = ParseScript(demo);
  } else {
    std::ifstream file(args.script_path);
    if (!file.is_open()) {
      std::cerr << "Error: Cannot open script " << args.script_path << "\n";
      return 1;
    }
    steps = ParseScript(file);
  }
  std::cerr << "[HARNESS] " << steps.size() << " ticks scripted\n";

  auto world = standalone::BuildDemoWorld(config, args.completion_ticks);
  auto coordinator = runtime::ViewCoordinator::Create(config, world.collaborators);
  if (!coordinator) {
    std::cerr << "Error: Coordinator could not be created (see log)\n";
    return 1;
  }
  standalone::ConnectControlSurface(*world.stage, *coordinator);
  coordinator->Start();

  if (args.diagnostic) {
    PrintDiagnosticHeader(config);
  }

  uint64_t tick = 0;
  for (const auto& step : steps) {
    if (g_termination_requested.load(std::memory_order_acquire)) {
      std::cerr << "[HARNESS] Terminated after " << tick << " ticks\n";
      break;
    }
    if (!step.fail_load.empty()) world.stage->FailNextLoad(step.fail_load);
    if (!step.fail_unload.empty()) world.stage->FailNextUnload(step.fail_unload);

    world.stage->Advance();
    const auto command = runtime::RouteKeys(coordinator->state(), step.keys);
    coordinator->Tick(command);
    ++tick;

    if (args.diagnostic) {
      PrintTimelineRow(tick, step.keys, command, *coordinator);
    }
  }

  // Let in-flight work settle so the summary reflects a resting state.
  while (coordinator->IsTransitionLocked() && world.stage->PendingOperations() > 0) {
    world.stage->Advance();
    coordinator->Tick();
  }

  if (args.diagnostic) {
    PrintSummary(*coordinator);
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);

  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }

  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  if (args.debug) {
    stagehand::util::Logger::SetDebugEnabled(true);
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  return Run(args);
}
