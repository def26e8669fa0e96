#include "device.hpp"

#include <chrono>

namespace camsync::fleet {

bool IsReachable(v1::DeviceState state) {
  return state == v1::DEVICE_STATE_ONLINE || state == v1::DEVICE_STATE_READY || state == v1::DEVICE_STATE_CAPTURING;
}

const char* StateName(v1::DeviceState state) {
  switch (state) {
    case v1::DEVICE_STATE_OFFLINE:
      return "offline";
    case v1::DEVICE_STATE_ONLINE:
      return "online";
    case v1::DEVICE_STATE_READY:
      return "ready";
    case v1::DEVICE_STATE_CAPTURING:
      return "capturing";
    case v1::DEVICE_STATE_ERROR:
      return "error";
    default:
      return "unspecified";
  }
}

v1::Capabilities NormalizeCapabilities(const v1::Capabilities* caps) {
  if (caps) {
    return *caps;
  }
  v1::Capabilities all;
  all.set_camera(true);
  all.set_preview(true);
  all.set_capture(true);
  return all;
}

v1::DeviceInfo ToDeviceInfo(const Device& device, util::SteadyTimePoint now) {
  v1::DeviceInfo info;
  info.set_node_id(device.id);
  info.set_ip_address(device.endpoint.ip);
  info.set_node_port(device.endpoint.port);
  info.set_status(device.state);
  info.set_is_ready(device.is_ready);
  info.set_heartbeat_age(std::chrono::duration<double>(now - device.last_heartbeat).count());
  *info.mutable_capabilities() = device.capabilities;
  return info;
}

} // namespace camsync::fleet
