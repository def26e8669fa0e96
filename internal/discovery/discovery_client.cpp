#include "discovery_client.hpp"

#include "discovery_codec.hpp"
#include "internal/observability/logging.hpp"
#include "udp_socket.hpp"

namespace camsync::discovery {

using camsync::observability::IntField;
using camsync::observability::StringField;

util::Result<fleet::Endpoint> DiscoverMaster(const DiscoveryOptions& options, const std::string& node_ip) {
  using Clock = std::chrono::steady_clock;

  UdpSocket socket;
  auto      opened = socket.Open(0, "0.0.0.0", true);
  if (!opened.ok()) {
    return util::Result<fleet::Endpoint>::Err(opened);
  }

  const auto request = Encode(MakeDiscoverRequest(node_ip));
  size_t     sent    = 0;
  for (const auto& address : options.broadcast_addresses) {
    auto status = socket.SendTo(request, address, options.port);
    if (!status.ok()) {
      CAMSYNC_LOG_DEBUG("discovery broadcast failed", {StringField("address", address), StringField("error", status.message)});
      continue;
    }
    ++sent;
  }
  if (sent == 0) {
    return util::Result<fleet::Endpoint>::Err(util::ErrorCode::Unreachable, "no broadcast address accepted the discovery request");
  }

  const auto deadline = Clock::now() + options.timeout;
  while (true) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    if (remaining.count() <= 0) {
      break;
    }
    auto timeout = socket.SetReceiveTimeout(remaining);
    if (!timeout.ok()) {
      return util::Result<fleet::Endpoint>::Err(timeout);
    }

    auto received = socket.Receive();
    if (!received.ok()) {
      if (received.status().code == util::ErrorCode::Timeout) {
        continue;
      }
      return util::Result<fleet::Endpoint>::Err(received.status());
    }

    auto message = Decode(received->payload);
    if (!message.ok() || message->type() != kMasterResponse) {
      continue;
    }

    fleet::Endpoint master{received->sender_ip, message->master_port()};
    CAMSYNC_LOG_INFO("master discovered", {StringField("master_ip", master.ip), IntField("master_port", master.port)});
    return util::Result<fleet::Endpoint>::Ok(std::move(master));
  }

  return util::Result<fleet::Endpoint>::Err(util::ErrorCode::Timeout, "no master_response within discovery timeout");
}

} // namespace camsync::discovery
