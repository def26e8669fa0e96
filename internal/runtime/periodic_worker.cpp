#include "periodic_worker.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace camsync::runtime {

using camsync::observability::StringField;

PeriodicWorker::PeriodicWorker(std::string name, std::chrono::milliseconds interval, std::chrono::milliseconds backoff, Tick tick,
                               bool run_immediately)
    : name_(std::move(name)), interval_(interval), backoff_(backoff), tick_(std::move(tick)), run_immediately_(run_immediately) {}

PeriodicWorker::~PeriodicWorker() {
  Stop();
}

void PeriodicWorker::Start() {
  if (running_) {
    return;
  }
  {
    std::lock_guard lock(mutex_);
    stopping_ = false;
  }
  running_ = true;
  thread_  = std::thread(&PeriodicWorker::Loop, this);
}

void PeriodicWorker::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
  running_ = false;
}

bool PeriodicWorker::SleepFor(std::chrono::milliseconds delay) {
  std::unique_lock lock(mutex_);
  return !cv_.wait_for(lock, delay, [&] { return stopping_; });
}

void PeriodicWorker::Loop() {
  if (!run_immediately_ && !SleepFor(interval_)) {
    return;
  }

  while (true) {
    bool ok = false;
    try {
      ok = tick_();
    } catch (const std::exception& e) {
      CAMSYNC_LOG_ERROR("background tick failed", {StringField("worker", name_), StringField("error", e.what())});
    }

    if (!SleepFor(ok ? interval_ : backoff_)) {
      return;
    }
  }
}

} // namespace camsync::runtime
