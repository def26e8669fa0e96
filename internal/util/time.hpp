#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace camsync::util {

/*
  Time utilities - single place to control clock sources.

  Wall time is expressed as fractional seconds since the Unix epoch, which is
  also the unit of every timestamp on the wire. Liveness bookkeeping uses the
  monotonic clock.
*/

using SteadyClock     = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;

using WallClockFn   = std::function<double()>;
using SteadyClockFn = std::function<SteadyTimePoint()>;

double          UnixSeconds();
SteadyTimePoint SteadyNow();

uint64_t ToUnixMillis(double seconds);

std::chrono::duration<double> Seconds(double seconds);

// "YYYY-MM-DD HH:MM:SS.mmm" in local time.
std::string FormatLocalTime(double seconds);

} // namespace camsync::util
