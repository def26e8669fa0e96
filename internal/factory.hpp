#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace camsync::clock { class ClockSync; class ClockSyncWorker; }
namespace camsync::fleet { class FleetRegistry; class HeartbeatMonitor; }
namespace camsync::discovery { class DiscoveryResponder; }
namespace camsync::agent { class CaptureAgent; class NodeSession; }

namespace camsync::factory {

/*
  MasterApplication

  Everything the master process owns. Lives for the lifetime of the process;
  background workers are started after the gRPC server is listening.
*/
struct MasterApplication {
  std::string bind_address;
  std::size_t max_receive_bytes = 0;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  std::shared_ptr<camsync::clock::ClockSync> clock;
  std::shared_ptr<camsync::fleet::FleetRegistry> registry;

  std::shared_ptr<camsync::clock::ClockSyncWorker> clock_worker;
  std::shared_ptr<camsync::fleet::HeartbeatMonitor> heartbeat_monitor;
  std::shared_ptr<camsync::discovery::DiscoveryResponder> discovery;

  void StartBackground();
  void StopBackground();
};

struct NodeApplication {
  std::string bind_address;
  std::size_t max_receive_bytes = 0;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  std::shared_ptr<camsync::clock::ClockSync> clock;
  std::shared_ptr<camsync::agent::CaptureAgent> agent;
  std::shared_ptr<camsync::agent::NodeSession> session;

  std::shared_ptr<camsync::clock::ClockSyncWorker> clock_worker;

  // session start talks to the master; call once the node server is up
  void StartBackground();
  void StopBackground();
};

/*
  Composition roots. The only place that knows concrete transports, time
  sources and camera backends.
*/
MasterApplication BuildMaster(const camsync::runtime::config::RuntimeConfig& config);
NodeApplication BuildNode(const camsync::runtime::config::RuntimeConfig& config);

}
