#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "camsync/v1/registry_service.grpc.pb.h"
#include "internal/service/registry_service.hpp"

namespace camsync::grpc {

class RegistryServer final : public camsync::v1::RegistryService::Service {
public:
  explicit RegistryServer(std::shared_ptr<camsync::service::RegistryService> svc);

  ::grpc::Status Register(::grpc::ServerContext*,
                      const camsync::v1::RegisterRequest*,
                      camsync::v1::RegisterResponse*) override;
  ::grpc::Status NodeOnline(::grpc::ServerContext*,
                      const camsync::v1::NodeOnlineRequest*,
                      camsync::v1::NodeOnlineResponse*) override;
  ::grpc::Status NodeOffline(::grpc::ServerContext*,
                      const camsync::v1::NodeOfflineRequest*,
                      camsync::v1::NodeOfflineResponse*) override;
  ::grpc::Status Heartbeat(::grpc::ServerContext*,
                      const camsync::v1::HeartbeatRequest*,
                      camsync::v1::HeartbeatResponse*) override;
  ::grpc::Status UploadCapture(::grpc::ServerContext*,
                      const camsync::v1::UploadCaptureRequest*,
                      camsync::v1::UploadCaptureResponse*) override;

private:
  std::shared_ptr<camsync::service::RegistryService> service_;
};

}
