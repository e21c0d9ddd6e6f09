// Repository: Stagehand
// Component: PersistentProcessAnchor
// Purpose: Keeps the long-lived simulation process alive across every
//          presentation load/unload.
// Copyright (c) 2025 Stagehand

#include "stagehand/runtime/PersistentProcessAnchor.h"

#include <utility>

#include "stagehand/util/Logger.hpp"

namespace stagehand::runtime {

using util::Logger;

PersistentProcessAnchor::PersistentProcessAnchor(IProcessHost* host,
                                                 std::string primary_context)
    : host_(host), primary_context_(std::move(primary_context)) {}

const std::optional<PersistentProcessHandle>& PersistentProcessAnchor::Establish() {
  if (attempted_) {
    return handle_;
  }
  attempted_ = true;

  if (!host_) {
    Logger::Warn("[PersistentProcessAnchor] No process host wired; "
                 "simulation process persistence is not guaranteed");
    return handle_;
  }

  if (auto co_located = host_->FindCoLocatedProcess()) {
    PersistentProcessHandle handle;
    handle.location = *co_located;
    handle.location.co_located = true;
    handle.inherited = true;
    handle_ = std::move(handle);
    Logger::Info("[PersistentProcessAnchor] Simulation process '" +
                 handle_->location.process_name +
                 "' on coordinator container, persistence inherited");
    return handle_;
  }

  auto located = host_->FindProcessInContext(primary_context_);
  if (!located) {
    Logger::Warn("[PersistentProcessAnchor] No simulation process found in '" +
                 primary_context_ + "'; overlay views will have no data");
    return handle_;
  }

  if (!host_->MarkPersistent(located->container_name)) {
    Logger::Warn("[PersistentProcessAnchor] Container '" +
                 located->container_name +
                 "' vanished before it could be marked persistent");
    return handle_;
  }

  PersistentProcessHandle handle;
  handle.location = *located;
  handle_ = std::move(handle);
  Logger::Info("[PersistentProcessAnchor] Simulation process '" +
               handle_->location.process_name + "' on '" +
               handle_->location.container_name + "' marked persistent");
  return handle_;
}

}  // namespace stagehand::runtime
