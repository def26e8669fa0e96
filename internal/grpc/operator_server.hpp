#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "camsync/v1/operator_service.grpc.pb.h"
#include "internal/service/operator_service.hpp"

namespace camsync::grpc {

class OperatorServer final : public camsync::v1::OperatorService::Service {
public:
  explicit OperatorServer(std::shared_ptr<camsync::service::OperatorService> svc);

  ::grpc::Status GetCameras(::grpc::ServerContext*,
                      const camsync::v1::GetCamerasRequest*,
                      camsync::v1::GetCamerasResponse*) override;
  ::grpc::Status SwitchCamera(::grpc::ServerContext*,
                      const camsync::v1::SwitchCameraRequest*,
                      camsync::v1::SwitchCameraResponse*) override;
  ::grpc::Status CheckReady(::grpc::ServerContext*,
                      const camsync::v1::CheckReadyRequest*,
                      camsync::v1::CheckReadyResponse*) override;
  ::grpc::Status TriggerCapture(::grpc::ServerContext*,
                      const camsync::v1::TriggerCaptureRequest*,
                      camsync::v1::TriggerCaptureResponse*) override;

private:
  std::shared_ptr<camsync::service::OperatorService> service_;
};

}
