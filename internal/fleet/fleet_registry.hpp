#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "device.hpp"
#include "internal/util/time.hpp"

namespace camsync::fleet {

class NodeTransport;

struct RegistryOptions {
  std::chrono::seconds heartbeat_timeout{30};
  uint32_t             default_node_port = 8084;
};

/*
  FleetRegistry

  Sole owner of the device records. Every mutation goes through this API and
  is serialized by one mutex; network probes run outside the lock.

  Device ids are the smallest positive integer not held by a tracked device.
  Devices are never removed, only marked offline, so an id stays bound to its
  device for the life of the process.

  The reference (preview) device is a display hint. It is designated when a
  device joins and none is set, and moves to the lowest-id reachable device
  when the current one goes offline.
*/
class FleetRegistry {
 public:
  FleetRegistry(RegistryOptions options, std::shared_ptr<NodeTransport> transport, util::SteadyClockFn now = util::SteadyNow);

  // throws util::InvalidArgument for an empty ip
  int Register(Endpoint endpoint, const v1::Capabilities& capabilities);

  // upsert for a node restarting with a previously assigned id
  void MarkOnline(int id, Endpoint endpoint, const v1::Capabilities& capabilities);

  // no-op for unknown ids
  void MarkOffline(int id);

  // false when the id is unknown
  bool UpdateHeartbeat(int id, bool is_ready);

  // single heartbeat-monitor pass; returns the ids that went offline
  std::vector<int> SweepExpired();

  // probes every reachable device concurrently; never throws for probe failures
  std::map<int, bool> CheckAllReady();

  // dispatch outcomes
  void MarkCapturing(int id);
  void MarkError(int id);

  bool               SwitchReference(int id);
  std::optional<int> Reference() const;

  std::vector<Device>     ListDevices() const;
  std::optional<Device>   Locate(int id) const;
  uint32_t                OnlineCount() const;
  uint32_t                ReadyCount() const;
  std::map<v1::DeviceState, uint32_t> CountByState() const;

  util::SteadyTimePoint Now() const {
    return now_();
  }

 private:
  int  AllocateIdLocked() const;
  // offline or error; hands the reference on when this device held it
  void SetUnreachableLocked(Device& device, v1::DeviceState state);
  void ReassignReferenceLocked();

  RegistryOptions                options_;
  std::shared_ptr<NodeTransport> transport_;
  util::SteadyClockFn            now_;

  mutable std::mutex     mutex_;
  std::map<int, Device>  devices_;
  std::optional<int>     reference_;
};

} // namespace camsync::fleet
