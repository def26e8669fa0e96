#pragma once

#include <cstdint>
#include <string>

#include "internal/runtime/periodic_worker.hpp"
#include "udp_socket.hpp"

namespace camsync::discovery {

/*
  Passive UDP responder on the master. Answers each discover_master datagram
  with the registry's advertised address, unicast to the sender. Runs
  independently of registration and heartbeat traffic.
*/
class DiscoveryResponder {
 public:
  DiscoveryResponder(uint16_t port, std::string master_ip, uint32_t master_port);

  // throws std::runtime_error when the port cannot be bound
  void Start();
  void Stop();

  // one receive attempt; false only for socket errors
  bool PollOnce();

 private:
  uint16_t    port_;
  std::string master_ip_;
  uint32_t    master_port_;

  UdpSocket               socket_;
  runtime::PeriodicWorker worker_;
};

} // namespace camsync::discovery
