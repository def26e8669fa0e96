#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "internal/discovery/discovery_client.hpp"
#include "internal/fleet/device.hpp"
#include "internal/runtime/periodic_worker.hpp"

namespace camsync::clock {
class ClockSync;
}

namespace camsync::agent {

class CameraBackend;
class CaptureAgent;
class RegistryLink;

struct SessionOptions {
  int      node_id = 0;      // 0 = ask the master for one
  fleet::Endpoint master;    // empty ip = discover
  std::string     local_ip;  // empty = detect
  uint32_t        node_port = 8084;
  std::string     state_file;  // empty = an assigned id is not persisted

  camsync::discovery::DiscoveryOptions discovery;

  std::chrono::seconds heartbeat_interval{10};
  std::chrono::seconds heartbeat_backoff{5};
};

/*
  NodeSession

  Membership lifecycle of one node:
    sync clock -> locate master -> init camera -> register / node_online
    -> heartbeat loop ... -> node_offline -> drain pending captures

  A heartbeat the master rejects (it restarted and forgot us) triggers a fresh
  node_online on the next tick.
*/
class NodeSession {
 public:
  NodeSession(SessionOptions options, std::shared_ptr<clock::ClockSync> clock, std::shared_ptr<CameraBackend> camera,
              std::shared_ptr<RegistryLink> link, std::shared_ptr<CaptureAgent> agent);
  ~NodeSession();

  // Throws util::Unavailable when the master cannot be located or no id can
  // be obtained; camera initialization failures propagate unchanged.
  void Start();
  void Stop();

  // one heartbeat-loop iteration; false asks the loop to back off
  bool HeartbeatOnce();

  int node_id() const {
    return node_id_;
  }
  const std::string& local_ip() const {
    return options_.local_ip;
  }
  bool announced() const {
    return announced_;
  }

 private:
  void ResolveLocalIp();
  void ResolveMaster();
  void AcquireNodeId();
  bool Announce();

  SessionOptions                    options_;
  std::shared_ptr<clock::ClockSync> clock_;
  std::shared_ptr<CameraBackend>    camera_;
  std::shared_ptr<RegistryLink>     link_;
  std::shared_ptr<CaptureAgent>     agent_;

  std::atomic<int>  node_id_{0};
  std::atomic<bool> announced_{false};
  std::atomic<bool> started_{false};

  runtime::PeriodicWorker heartbeat_worker_;
};

} // namespace camsync::agent
