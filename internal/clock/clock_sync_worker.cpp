#include "clock_sync_worker.hpp"

#include <algorithm>

#include "clock_sync.hpp"
#include "internal/observability/spans.hpp"

namespace camsync::clock {

namespace {

constexpr std::chrono::seconds kRetryAfterFailure{60};

} // namespace

ClockSyncWorker::ClockSyncWorker(std::shared_ptr<ClockSync> clock, std::chrono::seconds interval)
    : clock_(std::move(clock)), worker_("clock-sync", interval, std::min(interval, kRetryAfterFailure), [this] { return Tick(); }) {}

bool ClockSyncWorker::Tick() {
  const bool synced = clock_->Sync().ok();
  observability::Metrics::Instance().SetClockOffsetMs(clock_->Offset() * 1000.0);
  return synced;
}

void ClockSyncWorker::Start() {
  worker_.Start();
}

void ClockSyncWorker::Stop() {
  worker_.Stop();
}

} // namespace camsync::clock
