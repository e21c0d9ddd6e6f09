// Repository: Stagehand
// Component: Stagehand Server
// Purpose: Runs the view coordinator tick loop over the demo stage and serves
//          the ViewControl gRPC control plane.
// Copyright (c) 2025 Stagehand

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <grpcpp/grpcpp.h>

#include "DemoStage.h"
#include "control/view_control_service.h"
#include "stagehand/runtime/CommandInbox.h"
#include "stagehand/runtime/CoordinatorConfig.h"
#include "stagehand/runtime/ViewCoordinator.h"
#include "stagehand/util/Logger.hpp"

namespace {

using stagehand::util::Logger;

std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

struct CliArgs {
  std::string address = "0.0.0.0:50061";
  std::string config_path;
  int tick_ms = 16;
  int completion_ticks = 3;
  bool debug = false;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "  --listen ADDR        gRPC listen address (default: 0.0.0.0:50061)\n"
            << "  --port N             Shorthand for --listen 0.0.0.0:N\n"
            << "  --config PATH        Coordinator config JSON\n"
            << "  --tick-ms N          Tick period in milliseconds (default: 16)\n"
            << "  --load-ticks N       Ticks until a load/unload completes (default: 3)\n"
            << "  --debug              Enable debug log lines\n"
            << "  --help               Show this help message\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--listen" && i + 1 < argc) {
      args.address = argv[++i];
    } else if (arg == "--port" && i + 1 < argc) {
      args.address = std::string("0.0.0.0:") + argv[++i];
    } else if (arg == "--config" && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if (arg == "--tick-ms" && i + 1 < argc) {
      args.tick_ms = std::atoi(argv[++i]);
    } else if (arg == "--load-ticks" && i + 1 < argc) {
      args.completion_ticks = std::atoi(argv[++i]);
    } else if (arg == "--debug") {
      args.debug = true;
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }
  if (args.tick_ms < 1) {
    args.error = "--tick-ms must be at least 1";
    return args;
  }
  if (args.completion_ticks < 1) {
    args.error = "--load-ticks must be at least 1";
    return args;
  }
  args.valid = true;
  return args;
}

stagehand::runtime::ViewStatus StatusOf(const stagehand::runtime::ViewCoordinator& coordinator) {
  const auto snapshot = coordinator.Snapshot();
  stagehand::runtime::ViewStatus status;
  status.view = snapshot.state;
  status.overlay_loaded = snapshot.overlay_loaded;
  status.transition_locked = snapshot.transition_locked;
  status.deferred_pending = snapshot.deferred_pending;
  status.process_anchored = snapshot.process_anchored;
  status.audio_winner = snapshot.audio_winner;
  status.tick = snapshot.ticks_total;
  return status;
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace stagehand;

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
    Logger::SetDebugEnabled(true);
  }

  runtime::CoordinatorConfig config;
  if (!args.config_path.empty()) {
    auto loaded = runtime::CoordinatorConfig::FromFile(args.config_path);
    if (!loaded) {
      Logger::Error("[Server] Failed to load config from " + args.config_path);
      return 1;
    }
    config = *loaded;
  }

  auto world = standalone::BuildDemoWorld(config, args.completion_ticks);
  auto coordinator = runtime::ViewCoordinator::Create(config, world.collaborators);
  if (!coordinator) {
    Logger::Error("[Server] Coordinator could not be created");
    return 1;
  }
  standalone::ConnectControlSurface(*world.stage, *coordinator);

  auto inbox = std::make_shared<runtime::CommandInbox>();
  auto board = std::make_shared<runtime::ViewStatusBoard>();
  control::ViewControlImpl service(inbox, board);

  grpc::ServerBuilder builder;
  builder.AddListeningPort(args.address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
  if (!server) {
    Logger::Error("[Server] Failed to listen on " + args.address);
    return 1;
  }
  Logger::Info("[Server] ViewControl listening on " + args.address);

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  coordinator->Start();
  board->Publish(StatusOf(*coordinator));

  // The tick loop owns the stage and the coordinator; RPC threads only touch
  // the inbox and the board.
  const auto period = std::chrono::milliseconds(args.tick_ms);
  auto next_tick = std::chrono::steady_clock::now();
  while (!g_termination_requested.load(std::memory_order_acquire)) {
    world.stage->Advance();
    coordinator->Tick(inbox->PopOne());
    board->Publish(StatusOf(*coordinator));

    next_tick += period;
    std::this_thread::sleep_until(next_tick);
  }

  Logger::Info("[Server] Shutting down");
  server->Shutdown();
  return 0;
}
