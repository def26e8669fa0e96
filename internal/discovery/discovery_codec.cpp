#include "discovery_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace camsync::discovery {

v1::DiscoveryMessage MakeDiscoverRequest(const std::string& node_ip) {
  v1::DiscoveryMessage message;
  message.set_type(std::string(kDiscoverMaster));
  message.set_node_ip(node_ip);
  return message;
}

v1::DiscoveryMessage MakeMasterResponse(const std::string& master_ip, uint32_t master_port) {
  v1::DiscoveryMessage message;
  message.set_type(std::string(kMasterResponse));
  message.set_master_ip(master_ip);
  message.set_master_port(master_port);
  return message;
}

std::string Encode(const v1::DiscoveryMessage& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("discovery: failed to encode message: " + std::string(status.message()));
  }
  return json;
}

util::Result<v1::DiscoveryMessage> Decode(std::string_view datagram) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  v1::DiscoveryMessage message;
  auto                 status = google::protobuf::util::JsonStringToMessage(std::string(datagram), &message, options);
  if (!status.ok()) {
    return util::Result<v1::DiscoveryMessage>::Err(util::ErrorCode::InvalidResponse, std::string(status.message()));
  }

  if (message.type() == kDiscoverMaster) {
    return util::Result<v1::DiscoveryMessage>::Ok(std::move(message));
  }
  if (message.type() == kMasterResponse) {
    if (message.master_port() == 0 || message.master_port() > 65535) {
      return util::Result<v1::DiscoveryMessage>::Err(util::ErrorCode::InvalidResponse, "master_response without a valid master_port");
    }
    return util::Result<v1::DiscoveryMessage>::Ok(std::move(message));
  }
  return util::Result<v1::DiscoveryMessage>::Err(util::ErrorCode::InvalidResponse, "unknown discovery type '" + message.type() + "'");
}

} // namespace camsync::discovery
