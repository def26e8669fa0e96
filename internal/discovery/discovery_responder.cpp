#include "discovery_responder.hpp"

#include <stdexcept>

#include "discovery_codec.hpp"
#include "internal/observability/logging.hpp"

namespace camsync::discovery {

using camsync::observability::IntField;
using camsync::observability::StringField;

namespace {

constexpr std::chrono::milliseconds kPollTimeout{500};
constexpr std::chrono::milliseconds kErrorBackoff{1000};

} // namespace

DiscoveryResponder::DiscoveryResponder(uint16_t port, std::string master_ip, uint32_t master_port)
    : port_(port), master_ip_(std::move(master_ip)), master_port_(master_port),
      worker_("discovery-responder", std::chrono::milliseconds(0), kErrorBackoff, [this] { return PollOnce(); }, true) {}

void DiscoveryResponder::Start() {
  auto opened = socket_.Open(port_, "0.0.0.0", false);
  if (!opened.ok()) {
    throw std::runtime_error("discovery responder: " + opened.message);
  }
  auto timeout = socket_.SetReceiveTimeout(kPollTimeout);
  if (!timeout.ok()) {
    throw std::runtime_error("discovery responder: " + timeout.message);
  }

  worker_.Start();
  CAMSYNC_LOG_INFO("discovery responder listening", {IntField("port", port_), StringField("master_ip", master_ip_)});
}

void DiscoveryResponder::Stop() {
  worker_.Stop();
  socket_.Close();
}

bool DiscoveryResponder::PollOnce() {
  auto received = socket_.Receive();
  if (!received.ok()) {
    if (received.status().code == util::ErrorCode::Timeout) {
      return true;
    }
    CAMSYNC_LOG_WARN("discovery receive failed", {StringField("error", received.status().message)});
    return false;
  }

  const auto& datagram = received.value();
  auto        message  = Decode(datagram.payload);
  if (!message.ok() || message->type() != kDiscoverMaster) {
    CAMSYNC_LOG_WARN("ignoring malformed discovery datagram",
                     {StringField("from", datagram.sender_ip), StringField("error", message.ok() ? "unexpected type" : message.status().message)});
    return true;
  }

  auto sent = socket_.SendTo(Encode(MakeMasterResponse(master_ip_, master_port_)), datagram.sender_ip, datagram.sender_port);
  if (!sent.ok()) {
    CAMSYNC_LOG_WARN("discovery reply failed", {StringField("to", datagram.sender_ip), StringField("error", sent.message)});
    return true;
  }

  CAMSYNC_LOG_INFO("answered discovery request", {StringField("from", datagram.sender_ip), StringField("node_ip", message->node_ip())});
  return true;
}

} // namespace camsync::discovery
