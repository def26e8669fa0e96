#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/clock/clock_sync.hpp"
#include "internal/clock/time_source.hpp"

namespace {

using camsync::clock::ClockSync;
using camsync::clock::TimeSource;
using camsync::util::ErrorCode;
using camsync::util::Result;

class ManualClock {
 public:
  double now = 1'000'000.0;

  camsync::util::WallClockFn Fn() {
    return [this] { return now; };
  }
};

// Answers `reference_offset` seconds ahead of the manual clock, or fails.
class FakeTimeSource : public TimeSource {
 public:
  FakeTimeSource(std::string name, ManualClock* clock, std::optional<double> reference_offset)
      : name_(std::move(name)), clock_(clock), reference_offset_(reference_offset) {}

  Result<double> Query() override {
    ++queries;
    if (!reference_offset_) {
      return Result<double>::Err(ErrorCode::Timeout, "no answer");
    }
    return Result<double>::Ok(clock_->now + *reference_offset_);
  }

  std::string Name() const override {
    return name_;
  }

  void SetOffset(std::optional<double> offset) {
    reference_offset_ = offset;
  }

  int queries = 0;

 private:
  std::string           name_;
  ManualClock*          clock_;
  std::optional<double> reference_offset_;
};

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

void TestUnsyncedClockUsesZeroOffset() {
  ManualClock clock;
  ClockSync   sync({}, 300.0, clock.Fn());

  assert(!sync.IsSynchronized());
  assert(!sync.LastSyncTime().has_value());
  assert(Near(sync.Offset(), 0.0));
  assert(Near(sync.SynchronizedTime(), clock.now));
}

void TestFirstSuccessfulSourceWinsWithoutAveraging() {
  ManualClock clock;
  auto        down   = std::make_shared<FakeTimeSource>("down", &clock, std::nullopt);
  auto        first  = std::make_shared<FakeTimeSource>("first", &clock, 2.5);
  auto        second = std::make_shared<FakeTimeSource>("second", &clock, -7.0);
  ClockSync   sync({down, first, second}, 300.0, clock.Fn());

  assert(sync.Sync().ok());
  assert(down->queries == 1);
  assert(first->queries == 1);
  assert(second->queries == 0);

  assert(Near(sync.Offset(), 2.5));
  assert(Near(sync.SynchronizedTime(), clock.now + 2.5));
  assert(sync.IsSynchronized());
  assert(Near(*sync.LastSyncTime(), clock.now));
}

void TestAllSourcesFailingKeepsPreviousOffset() {
  ManualClock clock;
  auto        source = std::make_shared<FakeTimeSource>("only", &clock, 4.0);
  ClockSync   sync({source}, 300.0, clock.Fn());

  assert(sync.Sync().ok());
  const double synced_at = *sync.LastSyncTime();

  source->SetOffset(std::nullopt);
  clock.now += 10.0;
  auto status = sync.Sync();
  assert(!status.ok());
  assert(status.code == ErrorCode::Unreachable);
  assert(Near(sync.Offset(), 4.0));
  assert(Near(*sync.LastSyncTime(), synced_at));
}

void TestNeverSyncedFailureLeavesZeroOffset() {
  ManualClock clock;
  auto        source = std::make_shared<FakeTimeSource>("only", &clock, std::nullopt);
  ClockSync   sync({source}, 300.0, clock.Fn());

  assert(!sync.Sync().ok());
  assert(Near(sync.Offset(), 0.0));
  assert(!sync.IsSynchronized());
}

void TestEstimateGoesStaleAfterMaxAge() {
  ManualClock clock;
  auto        source = std::make_shared<FakeTimeSource>("only", &clock, 1.0);
  ClockSync   sync({source}, 300.0, clock.Fn());

  assert(sync.Sync().ok());

  clock.now += 299.0;
  assert(sync.IsSynchronized());
  assert(!sync.IsSynchronized(100.0));

  clock.now += 1.0;
  assert(!sync.IsSynchronized());

  // stale or not, the offset still applies
  assert(Near(sync.SynchronizedTime(), clock.now + 1.0));

  assert(sync.Sync().ok());
  assert(sync.IsSynchronized());
}

} // namespace

int main() {
  TestUnsyncedClockUsesZeroOffset();
  TestFirstSuccessfulSourceWinsWithoutAveraging();
  TestAllSourcesFailingKeepsPreviousOffset();
  TestNeverSyncedFailureLeavesZeroOffset();
  TestEstimateGoesStaleAfterMaxAge();

  std::cout << "camsync_unit_clock_sync: pass\n";
  return 0;
}
