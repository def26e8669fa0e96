#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/fleet/fleet_registry.hpp"
#include "internal/fleet/heartbeat_monitor.hpp"
#include "internal/fleet/node_transport.hpp"
#include "internal/util/errors.hpp"

namespace {

using camsync::fleet::Endpoint;
using camsync::fleet::FleetRegistry;
using camsync::fleet::RegistryOptions;
using camsync::util::ErrorCode;
using camsync::util::Result;
namespace v1 = camsync::v1;

enum class ProbeAnswer { Ready, NotReady, Fail };

// Answers readiness probes per endpoint port; unknown ports are ready.
class FakeTransport : public camsync::fleet::NodeTransport {
 public:
  void Answer(uint32_t port, ProbeAnswer answer) {
    std::lock_guard<std::mutex> lock(mutex_);
    answers_[port] = answer;
  }

  int Probes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return probes_;
  }

  Result<v1::ReadyResponse> Ready(const Endpoint& endpoint) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++probes_;
    auto it     = answers_.find(endpoint.port);
    auto answer = it == answers_.end() ? ProbeAnswer::Ready : it->second;
    if (answer == ProbeAnswer::Fail) {
      return Result<v1::ReadyResponse>::Err(ErrorCode::Timeout, "probe timed out");
    }
    v1::ReadyResponse resp;
    resp.set_ready(answer == ProbeAnswer::Ready);
    return Result<v1::ReadyResponse>::Ok(resp);
  }

  Result<v1::CaptureResponse> Capture(const Endpoint&, const v1::CaptureRequest&) override {
    return Result<v1::CaptureResponse>::Err(ErrorCode::InternalError, "not used");
  }

 private:
  mutable std::mutex                 mutex_;
  std::map<uint32_t, ProbeAnswer>    answers_;
  int                                probes_ = 0;
};

class ManualSteadyClock {
 public:
  camsync::util::SteadyTimePoint now = camsync::util::SteadyTimePoint{} + std::chrono::hours(1);

  camsync::util::SteadyClockFn Fn() {
    return [this] { return now; };
  }
};

v1::Capabilities AllCaps() {
  return camsync::fleet::NormalizeCapabilities(nullptr);
}

void TestIdsAreAllocatedSequentiallyAndNeverReused() {
  auto          transport = std::make_shared<FakeTransport>();
  FleetRegistry registry(RegistryOptions{}, transport);

  assert(registry.Register({"10.0.0.1", 9001}, AllCaps()) == 1);
  assert(registry.Register({"10.0.0.2", 9002}, AllCaps()) == 2);
  assert(registry.Register({"10.0.0.3", 9003}, AllCaps()) == 3);

  // offline devices keep their id
  registry.MarkOffline(2);
  assert(registry.Register({"10.0.0.4", 9004}, AllCaps()) == 4);
  assert(registry.Locate(2)->state == v1::DEVICE_STATE_OFFLINE);
}

void TestRegisterDefaultsPortAndRejectsEmptyIp() {
  FleetRegistry registry(RegistryOptions{}, std::make_shared<FakeTransport>());

  const int id = registry.Register({"10.0.0.1", 0}, AllCaps());
  assert(registry.Locate(id)->endpoint.port == 8084);

  bool threw = false;
  try {
    registry.Register({"", 9000}, AllCaps());
  } catch (const camsync::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestMarkOnlineUpsertsKnownId() {
  FleetRegistry registry(RegistryOptions{}, std::make_shared<FakeTransport>());

  registry.MarkOnline(7, {"10.0.0.7", 9007}, AllCaps());
  assert(registry.Locate(7).has_value());
  assert(registry.Locate(7)->state == v1::DEVICE_STATE_ONLINE);
  assert(*registry.Reference() == 7);

  // the lowest free id is still handed out
  assert(registry.Register({"10.0.0.1", 9001}, AllCaps()) == 1);

  registry.MarkOffline(7);
  registry.MarkOnline(7, {"10.0.0.8", 9008}, AllCaps());
  assert(registry.Locate(7)->endpoint.ip == "10.0.0.8");
  assert(registry.Locate(7)->state == v1::DEVICE_STATE_ONLINE);

  bool threw = false;
  try {
    registry.MarkOnline(0, {"10.0.0.9", 9009}, AllCaps());
  } catch (const camsync::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestHeartbeatTimeoutMarksOffline() {
  ManualSteadyClock clock;
  RegistryOptions   options;
  options.heartbeat_timeout = std::chrono::seconds(30);
  FleetRegistry registry(options, std::make_shared<FakeTransport>(), clock.Fn());

  registry.Register({"10.0.0.1", 9001}, AllCaps());
  registry.Register({"10.0.0.2", 9002}, AllCaps());

  clock.now += std::chrono::seconds(20);
  assert(registry.UpdateHeartbeat(2, true));

  clock.now += std::chrono::seconds(11);
  auto expired = registry.SweepExpired();
  assert(expired.size() == 1 && expired[0] == 1);
  assert(registry.Locate(1)->state == v1::DEVICE_STATE_OFFLINE);
  assert(registry.Locate(2)->state == v1::DEVICE_STATE_ONLINE);

  // already offline devices are not reported twice
  assert(registry.SweepExpired().empty());
}

void TestMonitorTickExpiresOnlyPastTimeoutAndFailsOver() {
  ManualSteadyClock clock;
  RegistryOptions   options;
  options.heartbeat_timeout = std::chrono::seconds(30);
  auto registry             = std::make_shared<FleetRegistry>(options, std::make_shared<FakeTransport>(), clock.Fn());
  camsync::fleet::HeartbeatMonitor monitor(registry, std::chrono::seconds(10));

  registry->Register({"10.0.0.1", 9001}, AllCaps());
  registry->Register({"10.0.0.2", 9002}, AllCaps());
  registry->Register({"10.0.0.3", 9003}, AllCaps());
  assert(registry->SwitchReference(2));

  clock.now += std::chrono::seconds(5);
  assert(registry->UpdateHeartbeat(1, true));
  assert(registry->UpdateHeartbeat(3, true));

  // device 2 has been silent for exactly the timeout: still alive
  clock.now += std::chrono::seconds(25);
  monitor.Tick();
  assert(registry->Locate(2)->state == v1::DEVICE_STATE_ONLINE);
  assert(*registry->Reference() == 2);
  assert(registry->SweepExpired().empty());

  clock.now += std::chrono::seconds(1);
  monitor.Tick();
  assert(registry->Locate(2)->state == v1::DEVICE_STATE_OFFLINE);
  assert(!registry->Locate(2)->is_ready);
  assert(*registry->Reference() == 1);
  assert(registry->Locate(1)->state == v1::DEVICE_STATE_ONLINE);
  assert(registry->Locate(3)->state == v1::DEVICE_STATE_ONLINE);
}

void TestConcurrentRegistrationsGetDistinctIds() {
  constexpr int     kNodes = 32;
  ManualSteadyClock clock;
  FleetRegistry     registry(RegistryOptions{}, std::make_shared<FakeTransport>(), clock.Fn());

  std::atomic<bool> done{false};
  std::thread       churn([&] {
    while (!done) {
      for (const auto& device : registry.ListDevices()) {
        registry.UpdateHeartbeat(device.id, true);
      }
      registry.SweepExpired();
    }
  });

  std::vector<int>         ids(kNodes, 0);
  std::vector<std::thread> workers;
  for (int i = 0; i < kNodes; ++i) {
    workers.emplace_back([&registry, &ids, i] {
      ids[i] = registry.Register({"10.0.1." + std::to_string(i + 1), static_cast<uint32_t>(9000 + i)}, AllCaps());
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }
  done = true;
  churn.join();

  const std::set<int> unique(ids.begin(), ids.end());
  assert(unique.size() == static_cast<size_t>(kNodes));
  assert(*unique.begin() == 1);
  assert(*unique.rbegin() == kNodes);
  assert(registry.ListDevices().size() == static_cast<size_t>(kNodes));
  assert(registry.OnlineCount() == static_cast<uint32_t>(kNodes));
}

void TestUnknownHeartbeatIsRefusedAndKnownOneRestores() {
  FleetRegistry registry(RegistryOptions{}, std::make_shared<FakeTransport>());

  assert(!registry.UpdateHeartbeat(42, true));

  const int id = registry.Register({"10.0.0.1", 9001}, AllCaps());
  registry.MarkOffline(id);
  assert(!registry.Reference().has_value());

  assert(registry.UpdateHeartbeat(id, true));
  assert(registry.Locate(id)->state == v1::DEVICE_STATE_ONLINE);
  assert(registry.Locate(id)->is_ready);
  assert(*registry.Reference() == id);

  registry.MarkError(id);
  assert(registry.UpdateHeartbeat(id, false));
  assert(registry.Locate(id)->state == v1::DEVICE_STATE_ONLINE);
}

void TestReferenceFailsOverToLowestReachable() {
  FleetRegistry registry(RegistryOptions{}, std::make_shared<FakeTransport>());

  registry.Register({"10.0.0.1", 9001}, AllCaps());
  registry.Register({"10.0.0.2", 9002}, AllCaps());
  registry.Register({"10.0.0.3", 9003}, AllCaps());
  assert(*registry.Reference() == 1);

  assert(registry.SwitchReference(3));
  assert(*registry.Reference() == 3);

  // a non-reference device leaving changes nothing
  registry.MarkOffline(1);
  assert(*registry.Reference() == 3);

  registry.MarkOffline(3);
  assert(*registry.Reference() == 2);

  registry.MarkOffline(2);
  assert(!registry.Reference().has_value());

  // offline and unknown devices cannot become the reference
  assert(!registry.SwitchReference(2));
  assert(!registry.SwitchReference(99));
}

void TestCheckAllReadyProbesReachableDevicesOnly() {
  auto          transport = std::make_shared<FakeTransport>();
  FleetRegistry registry(RegistryOptions{}, transport);

  registry.Register({"10.0.0.1", 9001}, AllCaps());
  registry.Register({"10.0.0.2", 9002}, AllCaps());
  registry.Register({"10.0.0.3", 9003}, AllCaps());
  registry.Register({"10.0.0.4", 9004}, AllCaps());
  transport->Answer(9002, ProbeAnswer::NotReady);
  transport->Answer(9003, ProbeAnswer::Fail);
  registry.MarkOffline(4);

  auto status = registry.CheckAllReady();

  assert(status.size() == 4);
  assert(status[1]);
  assert(!status[2]);
  assert(!status[3]);
  assert(!status[4]);
  assert(transport->Probes() == 3);

  assert(registry.Locate(1)->state == v1::DEVICE_STATE_READY);
  assert(registry.Locate(2)->state == v1::DEVICE_STATE_ONLINE);
  assert(registry.Locate(3)->state == v1::DEVICE_STATE_ERROR);
  assert(registry.Locate(4)->state == v1::DEVICE_STATE_OFFLINE);

  assert(registry.ReadyCount() == 1);
  assert(registry.OnlineCount() == 2);

  auto counts = registry.CountByState();
  assert(counts[v1::DEVICE_STATE_READY] == 1);
  assert(counts[v1::DEVICE_STATE_ERROR] == 1);
  assert(counts[v1::DEVICE_STATE_OFFLINE] == 1);
}

void TestProbeFailureHandsReferenceOn() {
  auto          transport = std::make_shared<FakeTransport>();
  FleetRegistry registry(RegistryOptions{}, transport);

  registry.Register({"10.0.0.1", 9001}, AllCaps());
  registry.Register({"10.0.0.2", 9002}, AllCaps());
  assert(*registry.Reference() == 1);

  transport->Answer(9001, ProbeAnswer::Fail);
  registry.CheckAllReady();
  assert(registry.Locate(1)->state == v1::DEVICE_STATE_ERROR);
  assert(*registry.Reference() == 2);

  registry.MarkError(2);
  assert(!registry.Reference().has_value());

  // the first device to come back takes the reference again
  assert(registry.UpdateHeartbeat(2, true));
  assert(*registry.Reference() == 2);
}

void TestEmptyFleetProbesNothing() {
  auto          transport = std::make_shared<FakeTransport>();
  FleetRegistry registry(RegistryOptions{}, transport);

  assert(registry.CheckAllReady().empty());
  assert(transport->Probes() == 0);
  assert(registry.ListDevices().empty());
}

} // namespace

int main() {
  TestIdsAreAllocatedSequentiallyAndNeverReused();
  TestRegisterDefaultsPortAndRejectsEmptyIp();
  TestMarkOnlineUpsertsKnownId();
  TestHeartbeatTimeoutMarksOffline();
  TestMonitorTickExpiresOnlyPastTimeoutAndFailsOver();
  TestConcurrentRegistrationsGetDistinctIds();
  TestUnknownHeartbeatIsRefusedAndKnownOneRestores();
  TestReferenceFailsOverToLowestReachable();
  TestCheckAllReadyProbesReachableDevicesOnly();
  TestProbeFailureHandsReferenceOn();
  TestEmptyFleetProbesNothing();

  std::cout << "camsync_unit_fleet_registry: pass\n";
  return 0;
}
