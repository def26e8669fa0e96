#pragma once

#include <chrono>
#include <memory>

#include "internal/runtime/periodic_worker.hpp"

namespace camsync::clock {

class ClockSync;

// Periodic re-sync. In-flight waits re-read the synchronized time each step,
// so a refresh mid-wait only moves the remaining sleep.
class ClockSyncWorker {
 public:
  ClockSyncWorker(std::shared_ptr<ClockSync> clock, std::chrono::seconds interval);

  void Start();
  void Stop();

  // one re-sync pass; false when every time source failed
  bool Tick();

 private:
  std::shared_ptr<ClockSync> clock_;
  runtime::PeriodicWorker    worker_;
};

} // namespace camsync::clock
