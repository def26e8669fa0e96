#pragma once

#include "camsync/v1/node_service.pb.h"
#include "service_context.hpp"

namespace camsync::service {

// Node-side endpoints called by the master.
class NodeService {
public:
  explicit NodeService(ServiceContext ctx);

  camsync::v1::ReadyResponse Ready(const camsync::v1::ReadyRequest& req);
  camsync::v1::CaptureResponse Capture(const camsync::v1::CaptureRequest& req);
  camsync::v1::StatusResponse Status(const camsync::v1::StatusRequest& req);

private:
  ServiceContext ctx_;
};

}
