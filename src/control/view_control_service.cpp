// Repository: Stagehand
// Component: ViewControl gRPC Service Implementation
// Purpose: Implements the ViewControl service on top of the command inbox and
//          the published view status.
// Copyright (c) 2025 Stagehand

#include "control/view_control_service.h"

#include <utility>

#include "stagehand/util/Logger.hpp"

namespace stagehand {
namespace control {

using util::Logger;

namespace {

constexpr char kApiVersion[] = "1.0.0";

}  // namespace

std::optional<runtime::ViewCommand> CommandFromProto(ViewCommandKind kind) {
  switch (kind) {
    case VIEW_COMMAND_SWITCH_TO_OVERLAY:
      return runtime::ViewCommand::kSwitchToOverlay;
    case VIEW_COMMAND_SWITCH_TO_PRIMARY:
      return runtime::ViewCommand::kSwitchToPrimary;
    case VIEW_COMMAND_TOGGLE_SELECTOR:
      return runtime::ViewCommand::kToggleSelector;
    case VIEW_COMMAND_SELECT_SCREEN:
      return runtime::ViewCommand::kSelectScreen;
    case VIEW_COMMAND_CYCLE_SCREEN:
      return runtime::ViewCommand::kCycleScreen;
    case VIEW_COMMAND_BACK:
      return runtime::ViewCommand::kBack;
    default:
      return std::nullopt;
  }
}

ViewKind ViewToProto(runtime::ViewState view) {
  switch (view) {
    case runtime::ViewState::kPrimary:
      return VIEW_PRIMARY;
    case runtime::ViewState::kOverlay:
      return VIEW_OVERLAY;
  }
  return VIEW_UNSPECIFIED;
}

ViewControlImpl::ViewControlImpl(std::shared_ptr<runtime::CommandInbox> inbox,
                                 std::shared_ptr<runtime::ViewStatusBoard> status)
    : inbox_(std::move(inbox)), status_(std::move(status)) {
  Logger::Info(std::string("[ViewControlImpl] Service initialized (API version: ") +
               kApiVersion + ")");
}

ViewControlImpl::~ViewControlImpl() {
  Logger::Info("[ViewControlImpl] Service shutting down");
}

grpc::Status ViewControlImpl::IssueCommand(grpc::ServerContext* /*context*/,
                                           const IssueCommandRequest* request,
                                           IssueCommandResponse* response) {
  const auto command = CommandFromProto(request->command());
  if (!command) {
    // Error semantics via response accepted=false, not gRPC Status.
    response->set_accepted(false);
    response->set_message("unspecified or unknown view command");
    Logger::Warn("[IssueCommand] Rejected command value " +
                 std::to_string(static_cast<int>(request->command())));
    return grpc::Status::OK;
  }

  const bool kept_all = inbox_->Push(*command);
  response->set_accepted(true);
  response->set_dropped_older(!kept_all);
  response->set_message(std::string("queued ") + runtime::ViewCommandToString(*command));
  Logger::Debug(std::string("[IssueCommand] Queued ") +
                runtime::ViewCommandToString(*command) +
                (kept_all ? "" : " (dropped oldest queued command)"));
  return grpc::Status::OK;
}

grpc::Status ViewControlImpl::GetViewStatus(grpc::ServerContext* /*context*/,
                                            const GetViewStatusRequest* /*request*/,
                                            ViewStatusResponse* response) {
  const runtime::ViewStatus status = status_->Read();
  response->set_view(ViewToProto(status.view));
  response->set_overlay_loaded(status.overlay_loaded);
  response->set_transition_locked(status.transition_locked);
  response->set_deferred_pending(status.deferred_pending);
  response->set_process_anchored(status.process_anchored);
  response->set_audio_winner(status.audio_winner);
  response->set_tick(status.tick);
  return grpc::Status::OK;
}

grpc::Status ViewControlImpl::GetVersion(grpc::ServerContext* /*context*/,
                                         const ApiVersionRequest* /*request*/,
                                         ApiVersion* response) {
  response->set_version(kApiVersion);
  Logger::Debug(std::string("[GetVersion] Returning version: ") + kApiVersion);
  return grpc::Status::OK;
}

}  // namespace control
}  // namespace stagehand
