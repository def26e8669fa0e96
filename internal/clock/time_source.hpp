#pragma once

#include <string>

#include "internal/util/result.hpp"

namespace camsync::clock {

/*
  An external reference clock.

  Query returns the reference's wall time in fractional Unix seconds.
*/
class TimeSource {
 public:
  virtual ~TimeSource() = default;

  virtual util::Result<double> Query() = 0;

  virtual std::string Name() const = 0;
};

} // namespace camsync::clock
