#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <grpcpp/grpcpp.h>

#include "node_transport.hpp"

namespace camsync::fleet {

/*
  NodeTransport over insecure gRPC channels, one cached channel per node
  address.
*/
class GrpcNodeTransport final : public NodeTransport {
 public:
  GrpcNodeTransport(std::chrono::milliseconds probe_timeout, std::chrono::milliseconds command_timeout);

  util::Result<v1::ReadyResponse> Ready(const Endpoint& endpoint) override;

  util::Result<v1::CaptureResponse> Capture(const Endpoint& endpoint, const v1::CaptureRequest& request) override;

 private:
  std::shared_ptr<::grpc::Channel> ChannelFor(const Endpoint& endpoint);

  std::chrono::milliseconds probe_timeout_;
  std::chrono::milliseconds command_timeout_;

  std::mutex                                              mutex_;
  std::map<std::string, std::shared_ptr<::grpc::Channel>> channels_;
};

} // namespace camsync::fleet
