#pragma once

#include "camsync/v1/node_service.pb.h"
#include "device.hpp"
#include "internal/util/result.hpp"

namespace camsync::fleet {

/*
  Master -> node calls.

  Implementations own their per-call deadlines and never throw for network
  failures; every outcome comes back as a Result.
*/
class NodeTransport {
 public:
  virtual ~NodeTransport() = default;

  virtual util::Result<v1::ReadyResponse> Ready(const Endpoint& endpoint) = 0;

  virtual util::Result<v1::CaptureResponse> Capture(const Endpoint& endpoint, const v1::CaptureRequest& request) = 0;
};

} // namespace camsync::fleet
