#pragma once

#include <chrono>
#include <memory>

#include "internal/runtime/periodic_worker.hpp"

namespace camsync::fleet {

class FleetRegistry;

/*
  Background liveness sweep: the only path that notices a node that vanished
  without sending node_offline.
*/
class HeartbeatMonitor {
 public:
  HeartbeatMonitor(std::shared_ptr<FleetRegistry> registry, std::chrono::seconds interval);

  void Start();
  void Stop();

  // one pass; also republishes the per-state device gauge
  void Tick();

 private:
  std::shared_ptr<FleetRegistry> registry_;
  runtime::PeriodicWorker        worker_;
};

} // namespace camsync::fleet
