#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "camsync/v1/node_service.grpc.pb.h"
#include "internal/service/node_service.hpp"

namespace camsync::grpc {

class NodeServer final : public camsync::v1::NodeService::Service {
public:
  explicit NodeServer(std::shared_ptr<camsync::service::NodeService> svc);

  ::grpc::Status Ready(::grpc::ServerContext*,
                      const camsync::v1::ReadyRequest*,
                      camsync::v1::ReadyResponse*) override;
  ::grpc::Status Capture(::grpc::ServerContext*,
                      const camsync::v1::CaptureRequest*,
                      camsync::v1::CaptureResponse*) override;
  ::grpc::Status Status(::grpc::ServerContext*,
                      const camsync::v1::StatusRequest*,
                      camsync::v1::StatusResponse*) override;

private:
  std::shared_ptr<camsync::service::NodeService> service_;
};

}
