#pragma once

#include <cstdint>
#include <string>

#include "camsync/v1/types.pb.h"
#include "internal/util/time.hpp"

namespace camsync::fleet {

struct Endpoint {
  std::string ip;
  uint32_t    port = 0;

  std::string Address() const {
    return ip + ":" + std::to_string(port);
  }
};

/*
  Registry-side record of one capture node.

  `state` is the lifecycle state; `is_ready` is the camera readiness the node
  last reported and moves independently of it.
*/
struct Device {
  int                   id = 0;
  Endpoint              endpoint;
  v1::DeviceState       state = v1::DEVICE_STATE_ONLINE;
  util::SteadyTimePoint last_heartbeat{};
  bool                  is_ready = false;
  v1::Capabilities      capabilities;
};

// online, ready and capturing devices answer probes and commands
bool IsReachable(v1::DeviceState state);

const char* StateName(v1::DeviceState state);

// missing capability sets advertise everything
v1::Capabilities NormalizeCapabilities(const v1::Capabilities* caps);

v1::DeviceInfo ToDeviceInfo(const Device& device, util::SteadyTimePoint now);

} // namespace camsync::fleet
