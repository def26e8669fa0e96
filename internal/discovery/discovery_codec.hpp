#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "camsync/v1/discovery.pb.h"
#include "internal/util/result.hpp"

namespace camsync::discovery {

inline constexpr std::string_view kDiscoverMaster = "discover_master";
inline constexpr std::string_view kMasterResponse = "master_response";

v1::DiscoveryMessage MakeDiscoverRequest(const std::string& node_ip);
v1::DiscoveryMessage MakeMasterResponse(const std::string& master_ip, uint32_t master_port);

// JSON with proto field names
std::string Encode(const v1::DiscoveryMessage& message);

// InvalidResponse for anything that is not a JSON object of known type
util::Result<v1::DiscoveryMessage> Decode(std::string_view datagram);

} // namespace camsync::discovery
