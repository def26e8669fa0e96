#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace camsync::runtime {

/*
  Long-lived background loop with its own stop signal.

  Runs `tick` every `interval`. A tick that returns false or throws is logged
  and the loop waits `backoff` instead; the loop itself never exits on error.
  Stop wakes a sleeping loop immediately and joins it.
*/
class PeriodicWorker {
 public:
  using Tick = std::function<bool()>;

  PeriodicWorker(std::string name, std::chrono::milliseconds interval, std::chrono::milliseconds backoff, Tick tick,
                 bool run_immediately = false);
  ~PeriodicWorker();

  PeriodicWorker(const PeriodicWorker&)            = delete;
  PeriodicWorker& operator=(const PeriodicWorker&) = delete;

  void Start();
  void Stop();

  bool running() const {
    return running_;
  }

 private:
  void Loop();

  // false when woken by Stop
  bool SleepFor(std::chrono::milliseconds delay);

  std::string               name_;
  std::chrono::milliseconds interval_;
  std::chrono::milliseconds backoff_;
  Tick                      tick_;
  bool                      run_immediately_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stopping_ = false;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace camsync::runtime
