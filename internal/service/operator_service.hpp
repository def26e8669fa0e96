#pragma once

#include "camsync/v1/operator_service.pb.h"
#include "service_context.hpp"

namespace camsync::service {

// Operator surface: plain calls onto the registry and the dispatcher.
class OperatorService {
public:
  explicit OperatorService(ServiceContext ctx);

  camsync::v1::GetCamerasResponse GetCameras(const camsync::v1::GetCamerasRequest& req);
  camsync::v1::SwitchCameraResponse SwitchCamera(const camsync::v1::SwitchCameraRequest& req);
  camsync::v1::CheckReadyResponse CheckReady(const camsync::v1::CheckReadyRequest& req);
  camsync::v1::TriggerCaptureResponse TriggerCapture(const camsync::v1::TriggerCaptureRequest& req);

private:
  ServiceContext ctx_;
};

}
