#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "time_source.hpp"
#include "internal/util/result.hpp"
#include "internal/util/time.hpp"

namespace camsync::clock {

/*
  Per-process estimate of the offset between the local wall clock and true time.

    synchronized_time = local_time + offset

  Sync walks the time sources in priority order and keeps the first answer; it
  never averages. A failed round leaves the previous offset (0 if never synced)
  in place. All members are safe to call from any thread.
*/
class ClockSync {
 public:
  explicit ClockSync(std::vector<std::shared_ptr<TimeSource>> sources, double default_max_age_seconds = 300.0,
                     util::WallClockFn local_clock = util::UnixSeconds);

  util::Status Sync();

  double SynchronizedTime() const;
  double LocalTime() const;

  bool IsSynchronized() const;
  bool IsSynchronized(double max_age_seconds) const;

  double                Offset() const;
  std::optional<double> LastSyncTime() const;

 private:
  std::vector<std::shared_ptr<TimeSource>> sources_;
  double                                   default_max_age_;
  util::WallClockFn                        local_clock_;

  // one round of queries at a time; readers never wait on the network
  std::mutex sync_mutex_;

  mutable std::mutex    state_mutex_;
  double                offset_ = 0.0;
  std::optional<double> last_sync_;
};

} // namespace camsync::clock
