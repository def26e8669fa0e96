#pragma once

#include "camsync/v1/registry_service.pb.h"
#include "service_context.hpp"

namespace camsync::service {

// Master-side endpoints called by nodes.
class RegistryService {
public:
  explicit RegistryService(ServiceContext ctx);

  camsync::v1::RegisterResponse Register(const camsync::v1::RegisterRequest& req);
  camsync::v1::NodeOnlineResponse NodeOnline(const camsync::v1::NodeOnlineRequest& req);
  camsync::v1::NodeOfflineResponse NodeOffline(const camsync::v1::NodeOfflineRequest& req);
  camsync::v1::HeartbeatResponse Heartbeat(const camsync::v1::HeartbeatRequest& req);
  camsync::v1::UploadCaptureResponse UploadCapture(const camsync::v1::UploadCaptureRequest& req);

private:
  ServiceContext ctx_;
};

}
