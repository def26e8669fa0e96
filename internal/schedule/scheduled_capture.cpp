#include "scheduled_capture.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <thread>

#include "internal/clock/clock_sync.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace camsync::schedule {

using camsync::observability::DoubleField;
using camsync::observability::StringField;

namespace {

constexpr double kCoarseStepSeconds = 1.0;

} // namespace

ScheduledCapture::ScheduledCapture(std::shared_ptr<clock::ClockSync> clock) : clock_(std::move(clock)) {}

double ScheduledCapture::Schedule(const std::string& session_id, double delay_seconds) {
  if (!std::isfinite(delay_seconds) || delay_seconds < 0) {
    throw util::InvalidArgument("schedule: delay_seconds must be a finite value >= 0");
  }

  if (!clock_->IsSynchronized()) {
    // failure is tolerated: the estimate degrades to the previous (or zero) offset
    if (!clock_->Sync()) {
      CAMSYNC_LOG_WARN("scheduling on an unsynchronized clock", {StringField("session_id", session_id)});
    }
  }

  const double capture_time = clock_->SynchronizedTime() + delay_seconds;

  CAMSYNC_LOG_INFO("capture scheduled", {StringField("session_id", session_id), StringField("capture_time", util::FormatLocalTime(capture_time)),
                                         DoubleField("delay_sec", delay_seconds)});
  return capture_time;
}

double ScheduledCapture::WaitUntil(double capture_time, const std::function<void()>& action) const {
  if (!std::isfinite(capture_time)) {
    throw util::InvalidArgument("wait: capture_time is not finite");
  }
  while (true) {
    const double remaining = capture_time - clock_->SynchronizedTime();
    if (remaining <= 0) {
      break;
    }
    // re-reading the clock each second bounds the effect of a mid-wait re-sync
    std::this_thread::sleep_for(util::Seconds(std::min(remaining, kCoarseStepSeconds)));
  }

  const double lateness = clock_->SynchronizedTime() - capture_time;
  action();
  return lateness;
}

std::string ScheduledCapture::GenerateSessionId() {
  uint64_t now_ms = util::ToUnixMillis(util::UnixSeconds());
  uint64_t last   = last_session_ms_.load();
  uint64_t next   = 0;
  do {
    next = std::max(now_ms, last + 1);
  } while (!last_session_ms_.compare_exchange_weak(last, next));

  return kSessionPrefix + std::to_string(next);
}

std::string ScheduledCapture::ArtifactFilename(int node_id, double capture_time) {
  const auto  millis = util::ToUnixMillis(capture_time);
  std::time_t whole  = static_cast<std::time_t>(millis / 1000);

  std::tm local{};
  localtime_r(&whole, &local);

  std::ostringstream out;
  out << std::put_time(&local, "%Y%m%d_%H%M%S") << '_' << std::setw(3) << std::setfill('0') << (millis % 1000) << "-node"
      << std::setw(2) << std::setfill('0') << node_id << ".jpg";
  return out.str();
}

} // namespace camsync::schedule
