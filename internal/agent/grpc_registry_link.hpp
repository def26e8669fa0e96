#pragma once

#include <chrono>
#include <memory>
#include <mutex>

#include <grpcpp/grpcpp.h>

#include "camsync/v1/registry_service.grpc.pb.h"
#include "registry_link.hpp"

namespace camsync::agent {

struct RegistryLinkTimeouts {
  std::chrono::milliseconds registration{10000};
  std::chrono::milliseconds heartbeat{5000};
  std::chrono::milliseconds upload{30000};
};

class GrpcRegistryLink final : public RegistryLink {
 public:
  explicit GrpcRegistryLink(RegistryLinkTimeouts timeouts);

  void SetMaster(const fleet::Endpoint& master) override;

  util::Result<int> Register(const v1::RegisterRequest& request) override;
  util::Status      NodeOnline(const v1::NodeOnlineRequest& request) override;
  util::Status      NodeOffline(const v1::NodeOfflineRequest& request) override;
  util::Status      Heartbeat(const v1::HeartbeatRequest& request) override;

  util::Result<v1::UploadCaptureResponse> Upload(const v1::UploadCaptureRequest& request) override;

 private:
  // null until a master address is set
  std::shared_ptr<v1::RegistryService::Stub> Stub() const;

  RegistryLinkTimeouts timeouts_;

  mutable std::mutex                         mutex_;
  std::shared_ptr<v1::RegistryService::Stub> stub_;
};

} // namespace camsync::agent
