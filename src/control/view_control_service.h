// Repository: Stagehand
// Component: ViewControl gRPC Service Implementation
// Purpose: Implements the ViewControl service on top of the command inbox and
//          the published view status.
// Copyright (c) 2025 Stagehand

#ifndef STAGEHAND_CONTROL_VIEW_CONTROL_SERVICE_H_
#define STAGEHAND_CONTROL_VIEW_CONTROL_SERVICE_H_

#include <memory>
#include <optional>

#include <grpcpp/grpcpp.h>

#include "stagehand_control.grpc.pb.h"
#include "stagehand_control.pb.h"
#include "stagehand/runtime/CommandInbox.h"
#include "stagehand/runtime/ViewTypes.h"

namespace stagehand {
namespace control {

// Maps the wire enum onto a coordinator command. nullopt for UNSPECIFIED or
// unknown values.
std::optional<runtime::ViewCommand> CommandFromProto(ViewCommandKind kind);
ViewKind ViewToProto(runtime::ViewState view);

// ViewControlImpl implements the gRPC service defined in stagehand_control.proto.
// This is a thin adapter: commands go into the inbox for the tick thread and
// status is read from the board the tick thread publishes. It never touches
// the coordinator.
class ViewControlImpl final : public ViewControl::Service {
 public:
  ViewControlImpl(std::shared_ptr<runtime::CommandInbox> inbox,
                  std::shared_ptr<runtime::ViewStatusBoard> status);
  ~ViewControlImpl() override;

  ViewControlImpl(const ViewControlImpl&) = delete;
  ViewControlImpl& operator=(const ViewControlImpl&) = delete;

  grpc::Status IssueCommand(grpc::ServerContext* context,
                            const IssueCommandRequest* request,
                            IssueCommandResponse* response) override;

  grpc::Status GetViewStatus(grpc::ServerContext* context,
                             const GetViewStatusRequest* request,
                             ViewStatusResponse* response) override;

  grpc::Status GetVersion(grpc::ServerContext* context,
                          const ApiVersionRequest* request,
                          ApiVersion* response) override;

 private:
  std::shared_ptr<runtime::CommandInbox> inbox_;
  std::shared_ptr<runtime::ViewStatusBoard> status_;
};

}  // namespace control
}  // namespace stagehand

#endif  // STAGEHAND_CONTROL_VIEW_CONTROL_SERVICE_H_
