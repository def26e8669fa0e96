#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace camsync::clock {
class ClockSync;
}

namespace camsync::schedule {

/*
  Turns a lead time into one shared capture instant and waits for it.

  Schedule runs once on the dispatch side; every node then runs WaitUntil on
  its own clock estimate. There is no cross-node barrier.
*/
class ScheduledCapture {
 public:
  static constexpr const char* kSessionPrefix = "capture_";

  explicit ScheduledCapture(std::shared_ptr<clock::ClockSync> clock);

  // Syncs first when the clock estimate is missing or stale. Throws
  // util::InvalidArgument for a negative or non-finite delay.
  double Schedule(const std::string& session_id, double delay_seconds);

  // Coarse-then-fine wait on the synchronized clock: 1 s steps while more than
  // a second remains, then the exact remainder. Invokes `action` exactly once,
  // immediately if `capture_time` has already passed. Returns how late the
  // action fired, in seconds. A non-finite `capture_time` throws
  // util::InvalidArgument without invoking `action`.
  double WaitUntil(double capture_time, const std::function<void()>& action) const;

  // "capture_<epoch ms>", strictly increasing within the process.
  std::string GenerateSessionId();

  // "YYYYMMDD_HHMMSS_mmm-nodeNN.jpg" from the capture instant in local time.
  static std::string ArtifactFilename(int node_id, double capture_time);

  const clock::ClockSync& clock() const {
    return *clock_;
  }

 private:
  std::shared_ptr<clock::ClockSync> clock_;
  std::atomic<uint64_t>             last_session_ms_{0};
};

} // namespace camsync::schedule
