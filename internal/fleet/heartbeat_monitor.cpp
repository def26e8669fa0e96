#include "heartbeat_monitor.hpp"

#include "device.hpp"
#include "fleet_registry.hpp"
#include "internal/observability/spans.hpp"

namespace camsync::fleet {

HeartbeatMonitor::HeartbeatMonitor(std::shared_ptr<FleetRegistry> registry, std::chrono::seconds interval)
    : registry_(std::move(registry)), worker_("heartbeat-monitor", interval, interval, [this] {
        Tick();
        return true;
      }) {}

void HeartbeatMonitor::Start() {
  worker_.Start();
}

void HeartbeatMonitor::Stop() {
  worker_.Stop();
}

void HeartbeatMonitor::Tick() {
  auto& metrics = camsync::observability::Metrics::Instance();
  metrics.RecordHeartbeatExpired(registry_->SweepExpired().size());

  const auto counts = registry_->CountByState();
  for (auto state : {v1::DEVICE_STATE_OFFLINE, v1::DEVICE_STATE_ONLINE, v1::DEVICE_STATE_READY, v1::DEVICE_STATE_CAPTURING, v1::DEVICE_STATE_ERROR}) {
    auto it = counts.find(state);
    metrics.SetDeviceCount(StateName(state), it == counts.end() ? 0 : it->second);
  }
}

} // namespace camsync::fleet
