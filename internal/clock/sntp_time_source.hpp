#pragma once

#include <chrono>
#include <string>

#include "time_source.hpp"

namespace camsync::clock {

/*
  Simple Network Time Protocol client (RFC 4330, client mode, version 3).

  One request per Query; the server transmit timestamp is returned as is,
  without round-trip compensation.
*/
class SntpTimeSource final : public TimeSource {
 public:
  SntpTimeSource(std::string host, std::chrono::milliseconds timeout, unsigned short port = 123);

  util::Result<double> Query() override;

  std::string Name() const override {
    return host_;
  }

 private:
  std::string               host_;
  std::chrono::milliseconds timeout_;
  unsigned short            port_;
};

} // namespace camsync::clock
