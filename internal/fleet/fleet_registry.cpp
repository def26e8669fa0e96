#include "fleet_registry.hpp"

#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "node_transport.hpp"

namespace camsync::fleet {

using camsync::observability::BoolField;
using camsync::observability::IntField;
using camsync::observability::StringField;

FleetRegistry::FleetRegistry(RegistryOptions options, std::shared_ptr<NodeTransport> transport, util::SteadyClockFn now)
    : options_(options), transport_(std::move(transport)), now_(std::move(now)) {}

int FleetRegistry::AllocateIdLocked() const {
  int candidate = 1;
  for (const auto& [id, device] : devices_) {
    if (id != candidate) {
      break;
    }
    ++candidate;
  }
  return candidate;
}

int FleetRegistry::Register(Endpoint endpoint, const v1::Capabilities& capabilities) {
  if (endpoint.ip.empty()) {
    throw util::InvalidArgument("register: local_ip is required");
  }
  if (endpoint.port == 0) {
    endpoint.port = options_.default_node_port;
  }

  std::lock_guard<std::mutex> lock(mutex_);

  Device device;
  device.id             = AllocateIdLocked();
  device.endpoint       = std::move(endpoint);
  device.state          = v1::DEVICE_STATE_ONLINE;
  device.last_heartbeat = now_();
  device.capabilities   = capabilities;

  const int id = device.id;
  CAMSYNC_LOG_INFO("device registered", {IntField("node_id", id), StringField("address", device.endpoint.Address())});
  devices_.emplace(id, std::move(device));

  if (!reference_) {
    reference_ = id;
  }
  return id;
}

void FleetRegistry::MarkOnline(int id, Endpoint endpoint, const v1::Capabilities& capabilities) {
  if (id <= 0) {
    throw util::InvalidArgument("node_online: node_id must be positive");
  }
  if (endpoint.port == 0) {
    endpoint.port = options_.default_node_port;
  }

  std::lock_guard<std::mutex> lock(mutex_);

  auto [it, inserted]    = devices_.try_emplace(id);
  Device& device         = it->second;
  device.id              = id;
  device.endpoint        = std::move(endpoint);
  device.state           = v1::DEVICE_STATE_ONLINE;
  device.last_heartbeat  = now_();
  device.capabilities    = capabilities;

  CAMSYNC_LOG_INFO(inserted ? "device online" : "device back online",
                   {IntField("node_id", id), StringField("address", device.endpoint.Address())});

  if (!reference_) {
    reference_ = id;
  }
}

void FleetRegistry::MarkOffline(int id) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = devices_.find(id);
  if (it == devices_.end()) {
    return;
  }
  SetUnreachableLocked(it->second, v1::DEVICE_STATE_OFFLINE);
  CAMSYNC_LOG_INFO("device offline", {IntField("node_id", id)});
}

bool FleetRegistry::UpdateHeartbeat(int id, bool is_ready) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = devices_.find(id);
  if (it == devices_.end()) {
    CAMSYNC_LOG_WARN("heartbeat from unknown device", {IntField("node_id", id)});
    return false;
  }

  Device& device        = it->second;
  device.last_heartbeat = now_();
  device.is_ready       = is_ready;

  if (device.state == v1::DEVICE_STATE_OFFLINE || device.state == v1::DEVICE_STATE_ERROR) {
    CAMSYNC_LOG_INFO("device resumed", {IntField("node_id", id), StringField("from", StateName(device.state))});
    device.state = v1::DEVICE_STATE_ONLINE;
    if (!reference_) {
      reference_ = id;
    }
  }
  return true;
}

std::vector<int> FleetRegistry::SweepExpired() {
  std::lock_guard<std::mutex> lock(mutex_);

  const auto       now = now_();
  std::vector<int> expired;
  for (auto& [id, device] : devices_) {
    if (device.state == v1::DEVICE_STATE_OFFLINE) {
      continue;
    }
    if (now - device.last_heartbeat > options_.heartbeat_timeout) {
      SetUnreachableLocked(device, v1::DEVICE_STATE_OFFLINE);
      expired.push_back(id);
      CAMSYNC_LOG_WARN("heartbeat timeout, device offline", {IntField("node_id", id)});
    }
  }
  return expired;
}

std::map<int, bool> FleetRegistry::CheckAllReady() {
  std::vector<std::pair<int, Endpoint>> targets;
  std::map<int, bool>                   ready_status;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, device] : devices_) {
      ready_status[id] = false;
      if (IsReachable(device.state)) {
        targets.emplace_back(id, device.endpoint);
      } else {
        device.is_ready = false;
      }
    }
  }

  const auto trace = observability::CurrentTraceHeaders();

  std::vector<std::optional<util::Result<v1::ReadyResponse>>> outcomes(targets.size());
  std::vector<std::thread>                                    probes;
  probes.reserve(targets.size());
  for (size_t i = 0; i < targets.size(); ++i) {
    probes.emplace_back([this, &targets, &outcomes, &trace, i] {
      observability::RemoteContextScope parent(trace);
      outcomes[i] = transport_->Ready(targets[i].second);
    });
  }
  for (auto& probe : probes) {
    probe.join();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  for (size_t i = 0; i < targets.size(); ++i) {
    const int   id      = targets[i].first;
    const auto& outcome = *outcomes[i];

    auto it = devices_.find(id);
    // went offline while the probe was in flight
    if (it == devices_.end() || !IsReachable(it->second.state)) {
      continue;
    }
    Device& device = it->second;

    if (!outcome.ok()) {
      CAMSYNC_LOG_WARN("readiness probe failed", {IntField("node_id", id), StringField("code", util::ToString(outcome.status().code)),
                                                  StringField("error", outcome.status().message)});
      SetUnreachableLocked(device, v1::DEVICE_STATE_ERROR);
      continue;
    }

    const bool ready = outcome->ready();
    device.state     = ready ? v1::DEVICE_STATE_READY : v1::DEVICE_STATE_ONLINE;
    device.is_ready  = ready;
    ready_status[id] = ready;
  }

  return ready_status;
}

void FleetRegistry::MarkCapturing(int id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = devices_.find(id);
  if (it != devices_.end()) {
    it->second.state = v1::DEVICE_STATE_CAPTURING;
  }
}

void FleetRegistry::MarkError(int id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = devices_.find(id);
  if (it != devices_.end()) {
    SetUnreachableLocked(it->second, v1::DEVICE_STATE_ERROR);
  }
}

bool FleetRegistry::SwitchReference(int id) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = devices_.find(id);
  if (it == devices_.end() || !IsReachable(it->second.state)) {
    return false;
  }
  reference_ = id;
  CAMSYNC_LOG_INFO("reference device switched", {IntField("node_id", id)});
  return true;
}

std::optional<int> FleetRegistry::Reference() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reference_;
}

void FleetRegistry::SetUnreachableLocked(Device& device, v1::DeviceState state) {
  device.state    = state;
  device.is_ready = false;
  if (reference_ && *reference_ == device.id) {
    ReassignReferenceLocked();
  }
}

void FleetRegistry::ReassignReferenceLocked() {
  for (const auto& [id, device] : devices_) {
    if (IsReachable(device.state)) {
      reference_ = id;
      CAMSYNC_LOG_INFO("reference device reassigned", {IntField("node_id", id)});
      return;
    }
  }
  reference_.reset();
  CAMSYNC_LOG_INFO("no reachable device left for reference", {BoolField("reference_set", false)});
}

std::vector<Device> FleetRegistry::ListDevices() const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<Device> out;
  out.reserve(devices_.size());
  for (const auto& [id, device] : devices_) {
    out.push_back(device);
  }
  return out;
}

std::optional<Device> FleetRegistry::Locate(int id) const {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = devices_.find(id);
  if (it == devices_.end()) {
    return std::nullopt;
  }
  return it->second;
}

uint32_t FleetRegistry::OnlineCount() const {
  std::lock_guard<std::mutex> lock(mutex_);

  uint32_t count = 0;
  for (const auto& [id, device] : devices_) {
    if (IsReachable(device.state)) {
      ++count;
    }
  }
  return count;
}

uint32_t FleetRegistry::ReadyCount() const {
  std::lock_guard<std::mutex> lock(mutex_);

  uint32_t count = 0;
  for (const auto& [id, device] : devices_) {
    if (device.is_ready) {
      ++count;
    }
  }
  return count;
}

std::map<v1::DeviceState, uint32_t> FleetRegistry::CountByState() const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::map<v1::DeviceState, uint32_t> counts;
  for (const auto& [id, device] : devices_) {
    ++counts[device.state];
  }
  return counts;
}

} // namespace camsync::fleet
