#include "sntp_time_source.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>

namespace camsync::clock {

namespace {

// seconds between 1900-01-01 and 1970-01-01
constexpr double   kNtpUnixDelta  = 2208988800.0;
constexpr size_t   kPacketSize    = 48;
constexpr uint8_t  kClientModeV3  = 0x1B;
constexpr size_t   kTransmitField = 40;

uint32_t ReadBigEndian32(const uint8_t* data) {
  uint32_t value = 0;
  std::memcpy(&value, data, sizeof(value));
  return ntohl(value);
}

class ScopedFd {
 public:
  explicit ScopedFd(int fd) : fd_(fd) {}
  ~ScopedFd() {
    if (fd_ >= 0) ::close(fd_);
  }
  ScopedFd(const ScopedFd&)            = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;

  int get() const { return fd_; }

 private:
  int fd_;
};

} // namespace

SntpTimeSource::SntpTimeSource(std::string host, std::chrono::milliseconds timeout, unsigned short port)
    : host_(std::move(host)), timeout_(timeout), port_(port) {}

util::Result<double> SntpTimeSource::Query() {
  addrinfo hints{};
  hints.ai_family   = AF_INET;
  hints.ai_socktype = SOCK_DGRAM;

  addrinfo*   resolved = nullptr;
  const auto  service  = std::to_string(port_);
  const int   rc       = ::getaddrinfo(host_.c_str(), service.c_str(), &hints, &resolved);
  if (rc != 0 || resolved == nullptr) {
    return util::Result<double>::Err(util::ErrorCode::Unreachable, "resolve " + host_ + ": " + ::gai_strerror(rc));
  }
  std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> addresses(resolved, &::freeaddrinfo);

  ScopedFd sock(::socket(addresses->ai_family, addresses->ai_socktype, addresses->ai_protocol));
  if (sock.get() < 0) {
    return util::Result<double>::Err(util::ErrorCode::IOError, std::string("socket: ") + std::strerror(errno));
  }

  timeval tv{};
  tv.tv_sec  = static_cast<time_t>(timeout_.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout_.count() % 1000) * 1000);
  if (::setsockopt(sock.get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
    return util::Result<double>::Err(util::ErrorCode::IOError, std::string("setsockopt(SO_RCVTIMEO): ") + std::strerror(errno));
  }

  std::array<uint8_t, kPacketSize> packet{};
  packet[0] = kClientModeV3;

  if (::sendto(sock.get(), packet.data(), packet.size(), 0, addresses->ai_addr, addresses->ai_addrlen) < 0) {
    return util::Result<double>::Err(util::ErrorCode::Unreachable, std::string("sendto: ") + std::strerror(errno));
  }

  const ssize_t received = ::recvfrom(sock.get(), packet.data(), packet.size(), 0, nullptr, nullptr);
  if (received < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return util::Result<double>::Err(util::ErrorCode::Timeout, "no reply from " + host_);
    }
    return util::Result<double>::Err(util::ErrorCode::IOError, std::string("recvfrom: ") + std::strerror(errno));
  }
  if (static_cast<size_t>(received) < kPacketSize) {
    return util::Result<double>::Err(util::ErrorCode::InvalidResponse, "short NTP reply from " + host_);
  }

  const uint32_t seconds  = ReadBigEndian32(packet.data() + kTransmitField);
  const uint32_t fraction = ReadBigEndian32(packet.data() + kTransmitField + 4);
  if (seconds == 0) {
    return util::Result<double>::Err(util::ErrorCode::InvalidResponse, "unsynchronized NTP server " + host_);
  }

  return util::Result<double>::Ok(static_cast<double>(seconds) - kNtpUnixDelta + static_cast<double>(fraction) / 4294967296.0);
}

} // namespace camsync::clock
