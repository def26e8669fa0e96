#pragma once

#include "camsync/v1/registry_service.pb.h"
#include "internal/fleet/device.hpp"
#include "internal/util/result.hpp"

namespace camsync::agent {

/*
  Node -> master calls. Failures are routine (master restarting, network
  partitions) and come back as Status, never as exceptions.
*/
class RegistryLink {
 public:
  virtual ~RegistryLink() = default;

  // the master address may only be known after discovery
  virtual void SetMaster(const fleet::Endpoint& master) = 0;

  virtual util::Result<int> Register(const v1::RegisterRequest& request) = 0;
  virtual util::Status      NodeOnline(const v1::NodeOnlineRequest& request) = 0;
  virtual util::Status      NodeOffline(const v1::NodeOfflineRequest& request) = 0;

  // Rejected when the master does not know this node
  virtual util::Status Heartbeat(const v1::HeartbeatRequest& request) = 0;

  virtual util::Result<v1::UploadCaptureResponse> Upload(const v1::UploadCaptureRequest& request) = 0;
};

} // namespace camsync::agent
