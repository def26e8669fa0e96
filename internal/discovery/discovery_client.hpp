#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "internal/fleet/device.hpp"
#include "internal/util/result.hpp"

namespace camsync::discovery {

struct DiscoveryOptions {
  uint16_t                  port = 8085;
  std::vector<std::string>  broadcast_addresses;
  std::chrono::milliseconds timeout{5000};
};

// Broadcasts discover_master and waits for the first valid master_response.
// The master address is taken from the datagram sender, the port from the
// response body. Timeout when nothing valid arrives.
util::Result<fleet::Endpoint> DiscoverMaster(const DiscoveryOptions& options, const std::string& node_ip);

} // namespace camsync::discovery
