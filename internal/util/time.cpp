#include "time.hpp"

#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace camsync::util {

double UnixSeconds() {
  return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
}

SteadyTimePoint SteadyNow() {
  return SteadyClock::now();
}

uint64_t ToUnixMillis(double seconds) {
  return static_cast<uint64_t>(std::floor(seconds * 1000.0));
}

std::chrono::duration<double> Seconds(double seconds) {
  return std::chrono::duration<double>(seconds);
}

std::string FormatLocalTime(double seconds) {
  const auto  millis   = ToUnixMillis(seconds);
  std::time_t whole    = static_cast<std::time_t>(millis / 1000);
  const auto  fraction = static_cast<int>(millis % 1000);

  std::tm local{};
  localtime_r(&whole, &local);

  std::ostringstream out;
  out << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << fraction;
  return out.str();
}

} // namespace camsync::util
