#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "internal/util/result.hpp"

namespace camsync::discovery {

struct Datagram {
  std::string payload;
  std::string sender_ip;
  uint16_t    sender_port = 0;
};

// IPv4 UDP socket with optional broadcast. Closed on destruction.
class UdpSocket {
 public:
  UdpSocket() = default;
  ~UdpSocket();

  UdpSocket(const UdpSocket&)            = delete;
  UdpSocket& operator=(const UdpSocket&) = delete;

  // port 0 binds an ephemeral port
  util::Status Open(uint16_t port, const std::string& bind_address, bool allow_broadcast);
  void         Close();

  util::Status SetReceiveTimeout(std::chrono::milliseconds timeout);

  util::Status SendTo(const std::string& payload, const std::string& ip, uint16_t port);

  // Timeout when nothing arrived within the receive timeout
  util::Result<Datagram> Receive();

  bool is_open() const {
    return fd_ >= 0;
  }

 private:
  int fd_ = -1;
};

// Address of the interface that routes outward; no packet is sent.
util::Result<std::string> DetectLocalIp();

} // namespace camsync::discovery
