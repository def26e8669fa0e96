#include "udp_socket.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>

namespace camsync::discovery {

using util::ErrorCode;

namespace {

constexpr size_t kMaxDatagram = 2048;

bool MakeSockaddr(const std::string& address, uint16_t port, sockaddr_in* out) {
  *out            = sockaddr_in{};
  out->sin_family = AF_INET;
  out->sin_port   = htons(port);
  if (address.empty() || address == "0.0.0.0") {
    out->sin_addr.s_addr = htonl(INADDR_ANY);
    return true;
  }
  return ::inet_pton(AF_INET, address.c_str(), &out->sin_addr) == 1;
}

std::string Errno(const char* what) {
  return std::string(what) + ": " + std::strerror(errno);
}

} // namespace

UdpSocket::~UdpSocket() {
  Close();
}

util::Status UdpSocket::Open(uint16_t port, const std::string& bind_address, bool allow_broadcast) {
  if (fd_ >= 0) {
    return util::Status::Ok();
  }

  sockaddr_in addr{};
  if (!MakeSockaddr(bind_address, port, &addr)) {
    return util::Status::Err(ErrorCode::IOError, "invalid bind address " + bind_address);
  }

  fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (fd_ < 0) {
    return util::Status::Err(ErrorCode::IOError, Errno("socket"));
  }

  int reuse = 1;
  if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
    auto status = util::Status::Err(ErrorCode::IOError, Errno("setsockopt(SO_REUSEADDR)"));
    Close();
    return status;
  }
  if (allow_broadcast) {
    int broadcast = 1;
    if (::setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &broadcast, sizeof(broadcast)) < 0) {
      auto status = util::Status::Err(ErrorCode::IOError, Errno("setsockopt(SO_BROADCAST)"));
      Close();
      return status;
    }
  }

  if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    auto status = util::Status::Err(ErrorCode::IOError, Errno(("bind " + bind_address + ":" + std::to_string(port)).c_str()));
    Close();
    return status;
  }
  return util::Status::Ok();
}

void UdpSocket::Close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

util::Status UdpSocket::SetReceiveTimeout(std::chrono::milliseconds timeout) {
  timeval tv{};
  tv.tv_sec  = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  if (::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
    return util::Status::Err(ErrorCode::IOError, Errno("setsockopt(SO_RCVTIMEO)"));
  }
  return util::Status::Ok();
}

util::Status UdpSocket::SendTo(const std::string& payload, const std::string& ip, uint16_t port) {
  sockaddr_in addr{};
  if (!MakeSockaddr(ip, port, &addr)) {
    return util::Status::Err(ErrorCode::IOError, "invalid address " + ip);
  }

  const auto sent = ::sendto(fd_, payload.data(), payload.size(), 0, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
  if (sent < 0) {
    return util::Status::Err(ErrorCode::Unreachable, Errno("sendto"));
  }
  return util::Status::Ok();
}

util::Result<Datagram> UdpSocket::Receive() {
  std::array<char, kMaxDatagram> buffer{};
  sockaddr_in                    from{};
  socklen_t                      from_len = sizeof(from);

  const auto received = ::recvfrom(fd_, buffer.data(), buffer.size(), 0, reinterpret_cast<sockaddr*>(&from), &from_len);
  if (received < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
      return util::Result<Datagram>::Err(ErrorCode::Timeout);
    }
    return util::Result<Datagram>::Err(ErrorCode::IOError, Errno("recvfrom"));
  }

  std::array<char, INET_ADDRSTRLEN> ip{};
  ::inet_ntop(AF_INET, &from.sin_addr, ip.data(), ip.size());

  Datagram datagram;
  datagram.payload.assign(buffer.data(), static_cast<size_t>(received));
  datagram.sender_ip   = ip.data();
  datagram.sender_port = ntohs(from.sin_port);
  return util::Result<Datagram>::Ok(std::move(datagram));
}

util::Result<std::string> DetectLocalIp() {
  const int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (fd < 0) {
    return util::Result<std::string>::Err(ErrorCode::IOError, Errno("socket"));
  }

  sockaddr_in remote{};
  MakeSockaddr("8.8.8.8", 80, &remote);

  sockaddr_in local{};
  socklen_t   local_len = sizeof(local);
  const bool  ok        = ::connect(fd, reinterpret_cast<sockaddr*>(&remote), sizeof(remote)) == 0 &&
                  ::getsockname(fd, reinterpret_cast<sockaddr*>(&local), &local_len) == 0;
  const auto error = ok ? std::string() : Errno("route lookup");
  ::close(fd);

  if (!ok) {
    return util::Result<std::string>::Err(ErrorCode::Unreachable, error);
  }

  std::array<char, INET_ADDRSTRLEN> ip{};
  ::inet_ntop(AF_INET, &local.sin_addr, ip.data(), ip.size());
  return util::Result<std::string>::Ok(ip.data());
}

} // namespace camsync::discovery
