#include "clock_sync.hpp"

#include <string>

#include "internal/observability/logging.hpp"

namespace camsync::clock {

using camsync::observability::DoubleField;
using camsync::observability::StringField;

ClockSync::ClockSync(std::vector<std::shared_ptr<TimeSource>> sources, double default_max_age_seconds, util::WallClockFn local_clock)
    : sources_(std::move(sources)), default_max_age_(default_max_age_seconds), local_clock_(std::move(local_clock)) {}

util::Status ClockSync::Sync() {
  std::lock_guard sync_lock(sync_mutex_);

  for (const auto& source : sources_) {
    const double local_at_send = local_clock_();
    auto         remote        = source->Query();
    if (!remote) {
      CAMSYNC_LOG_WARN("time source query failed",
                       {StringField("source", source->Name()), StringField("error", remote.status().message)});
      continue;
    }

    const double offset = remote.value() - local_at_send;
    {
      std::lock_guard lock(state_mutex_);
      offset_    = offset;
      last_sync_ = local_clock_();
    }

    CAMSYNC_LOG_INFO("clock synchronized", {StringField("source", source->Name()), DoubleField("offset_sec", offset)});
    return util::Status::Ok();
  }

  CAMSYNC_LOG_ERROR("all time sources failed, keeping previous offset", {DoubleField("offset_sec", Offset())});
  return util::Status::Err(util::ErrorCode::Unreachable, "all time sources failed");
}

double ClockSync::SynchronizedTime() const {
  return local_clock_() + Offset();
}

double ClockSync::LocalTime() const {
  return local_clock_();
}

bool ClockSync::IsSynchronized() const {
  return IsSynchronized(default_max_age_);
}

bool ClockSync::IsSynchronized(double max_age_seconds) const {
  const auto last = LastSyncTime();
  if (!last) {
    return false;
  }
  return (local_clock_() - *last) < max_age_seconds;
}

double ClockSync::Offset() const {
  std::lock_guard lock(state_mutex_);
  return offset_;
}

std::optional<double> ClockSync::LastSyncTime() const {
  std::lock_guard lock(state_mutex_);
  return last_sync_;
}

} // namespace camsync::clock
