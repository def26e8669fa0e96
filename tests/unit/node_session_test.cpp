#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <vector>

#include "internal/agent/camera_backend.hpp"
#include "internal/agent/capture_agent.hpp"
#include "internal/agent/node_session.hpp"
#include "internal/agent/node_state_store.hpp"
#include "internal/agent/registry_link.hpp"
#include "internal/clock/clock_sync.hpp"
#include "internal/discovery/discovery_responder.hpp"
#include "internal/schedule/scheduled_capture.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;
namespace v1 = camsync::v1;

using camsync::agent::NodeSession;
using camsync::agent::SessionOptions;
using camsync::util::ErrorCode;
using camsync::util::Result;
using camsync::util::Status;

class FakeCamera : public camsync::agent::CameraBackend {
 public:
  std::atomic<bool> initialized{false};
  std::atomic<bool> shut_down{false};

  void Initialize() override {
    initialized = true;
  }
  bool IsReady() const override {
    return initialized;
  }
  Status Capture(const std::string&) override {
    return Status::Ok();
  }
  void Shutdown() override {
    shut_down   = true;
    initialized = false;
  }
};

class FakeLink : public camsync::agent::RegistryLink {
 public:
  std::atomic<bool> register_fails{false};
  std::atomic<bool> reject_heartbeat{false};

  std::atomic<int> registers{0};
  std::atomic<int> onlines{0};
  std::atomic<int> offlines{0};
  std::atomic<int> heartbeats{0};

  void SetMaster(const camsync::fleet::Endpoint& master) override {
    std::lock_guard<std::mutex> lock(mutex_);
    master_ = master;
  }

  camsync::fleet::Endpoint Master() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return master_;
  }

  Result<int> Register(const v1::RegisterRequest& request) override {
    ++registers;
    if (register_fails) {
      return Result<int>::Err(ErrorCode::Unreachable, "connection refused");
    }
    assert(!request.local_ip().empty());
    return Result<int>::Ok(6);
  }

  Status NodeOnline(const v1::NodeOnlineRequest& request) override {
    assert(request.node_id() > 0);
    ++onlines;
    return Status::Ok();
  }

  Status NodeOffline(const v1::NodeOfflineRequest&) override {
    ++offlines;
    return Status::Ok();
  }

  Status Heartbeat(const v1::HeartbeatRequest&) override {
    ++heartbeats;
    if (reject_heartbeat) {
      return Status::Err(ErrorCode::Rejected, "unknown node");
    }
    return Status::Ok();
  }

  Result<v1::UploadCaptureResponse> Upload(const v1::UploadCaptureRequest&) override {
    return Result<v1::UploadCaptureResponse>::Err(ErrorCode::Unreachable, "not used");
  }

 private:
  mutable std::mutex       mutex_;
  camsync::fleet::Endpoint master_;
};

struct Fixture {
  std::shared_ptr<camsync::clock::ClockSync>   clock;
  std::shared_ptr<FakeCamera>                  camera = std::make_shared<FakeCamera>();
  std::shared_ptr<FakeLink>                    link   = std::make_shared<FakeLink>();
  std::shared_ptr<camsync::agent::CaptureAgent> agent;
  fs::path                                     root;

  Fixture() {
    root  = fs::temp_directory_path() / "camsync_node_session_test";
    clock = std::make_shared<camsync::clock::ClockSync>(std::vector<std::shared_ptr<camsync::clock::TimeSource>>{});
    agent = std::make_shared<camsync::agent::CaptureAgent>(std::make_shared<camsync::schedule::ScheduledCapture>(clock), camera, link,
                                                           root.string());
  }

  ~Fixture() {
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  SessionOptions Options() const {
    SessionOptions options;
    options.master             = {"10.0.0.1", 8080};
    options.local_ip           = "10.0.0.20";
    options.heartbeat_interval = std::chrono::seconds(3600);
    options.heartbeat_backoff  = std::chrono::seconds(3600);
    return options;
  }
};

void TestFreshNodeRegistersAndAnnounces() {
  Fixture     f;
  NodeSession session(f.Options(), f.clock, f.camera, f.link, f.agent);

  session.Start();
  assert(f.link->registers == 1);
  assert(f.link->onlines == 1);
  assert(session.node_id() == 6);
  assert(f.agent->node_id() == 6);
  assert(session.announced());
  assert(f.camera->initialized);
  assert(f.link->Master().ip == "10.0.0.1");

  session.Stop();
  assert(f.link->offlines == 1);
  assert(f.camera->shut_down);

  // second stop is a no-op
  session.Stop();
  assert(f.link->offlines == 1);
}

void TestKnownNodeIdSkipsRegistration() {
  Fixture        f;
  SessionOptions options = f.Options();
  options.node_id        = 3;
  NodeSession session(options, f.clock, f.camera, f.link, f.agent);

  session.Start();
  assert(f.link->registers == 0);
  assert(f.link->onlines == 1);
  assert(session.node_id() == 3);
  session.Stop();
}

void TestAssignedIdSurvivesRestart() {
  Fixture        f;
  SessionOptions options = f.Options();
  options.state_file     = (f.root / "state" / "node_state.json").string();

  {
    NodeSession first(options, f.clock, f.camera, f.link, f.agent);
    first.Start();
    assert(first.node_id() == 6);
    first.Stop();
  }
  assert(f.link->registers == 1);
  assert(fs::exists(options.state_file));

  auto stored = camsync::agent::NodeStateStore(options.state_file).LoadNodeId();
  assert(stored.ok());
  assert(stored.value() == 6);

  // the restarted node comes back under its old id via node_online only
  NodeSession second(options, f.clock, f.camera, f.link, f.agent);
  second.Start();
  assert(second.node_id() == 6);
  assert(f.link->registers == 1);
  assert(f.link->onlines == 2);
  second.Stop();
}

void TestUnreadableStateFileFallsBackToRegistration() {
  Fixture        f;
  SessionOptions options = f.Options();
  options.state_file     = (f.root / "node_state.json").string();

  fs::create_directories(f.root);
  {
    std::ofstream out(options.state_file);
    out << "{not json";
  }

  NodeSession session(options, f.clock, f.camera, f.link, f.agent);
  session.Start();
  assert(f.link->registers == 1);
  assert(session.node_id() == 6);
  session.Stop();

  // registration rewrote the broken file
  auto stored = camsync::agent::NodeStateStore(options.state_file).LoadNodeId();
  assert(stored.ok());
  assert(stored.value() == 6);
}

void TestMissingStateFileMeansNoId() {
  Fixture f;
  auto    stored = camsync::agent::NodeStateStore(f.root / "absent.json").LoadNodeId();
  assert(stored.ok());
  assert(stored.value() == 0);
}

void TestRegistrationFailureIsFatal() {
  Fixture f;
  f.link->register_fails = true;
  NodeSession session(f.Options(), f.clock, f.camera, f.link, f.agent);

  bool threw = false;
  try {
    session.Start();
  } catch (const camsync::util::Unavailable&) {
    threw = true;
  }
  assert(threw);
  assert(f.link->onlines == 0);

  session.Stop();
  assert(f.link->offlines == 0);
}

void TestRejectedHeartbeatTriggersReannounce() {
  Fixture        f;
  SessionOptions options = f.Options();
  options.node_id        = 4;
  NodeSession session(options, f.clock, f.camera, f.link, f.agent);

  // without Start the loop body can be driven directly
  assert(session.HeartbeatOnce());
  assert(f.link->onlines == 1);
  assert(f.link->heartbeats == 0);

  assert(session.HeartbeatOnce());
  assert(f.link->heartbeats == 1);

  f.link->reject_heartbeat = true;
  assert(!session.HeartbeatOnce());
  assert(!session.announced());

  f.link->reject_heartbeat = false;
  assert(session.HeartbeatOnce());
  assert(f.link->onlines == 2);
  assert(session.announced());
}

void TestMasterFoundByDiscovery() {
  constexpr uint16_t kPort = 28085;

  camsync::discovery::DiscoveryResponder responder(kPort, "10.9.9.9", 8181);
  responder.Start();

  Fixture        f;
  SessionOptions options = f.Options();
  options.master         = {};
  options.discovery.port = kPort;
  options.discovery.broadcast_addresses = {"127.0.0.1"};
  options.discovery.timeout             = std::chrono::milliseconds(3000);

  NodeSession session(options, f.clock, f.camera, f.link, f.agent);
  session.Start();

  // address from the datagram sender, port from the response body
  const auto master = f.link->Master();
  assert(master.ip == "127.0.0.1");
  assert(master.port == 8181);

  session.Stop();
  responder.Stop();
}

void TestDiscoveryTimeoutIsFatal() {
  Fixture        f;
  SessionOptions options = f.Options();
  options.master         = {};
  options.discovery.port = 28086;
  options.discovery.broadcast_addresses = {"127.0.0.1"};
  options.discovery.timeout             = std::chrono::milliseconds(300);

  NodeSession session(options, f.clock, f.camera, f.link, f.agent);

  bool threw = false;
  try {
    session.Start();
  } catch (const camsync::util::Unavailable&) {
    threw = true;
  }
  assert(threw);
  assert(!f.camera->initialized);
}

} // namespace

int main() {
  TestFreshNodeRegistersAndAnnounces();
  TestKnownNodeIdSkipsRegistration();
  TestAssignedIdSurvivesRestart();
  TestUnreadableStateFileFallsBackToRegistration();
  TestMissingStateFileMeansNoId();
  TestRegistrationFailureIsFatal();
  TestRejectedHeartbeatTriggersReannounce();
  TestMasterFoundByDiscovery();
  TestDiscoveryTimeoutIsFatal();

  std::cout << "camsync_unit_node_session: pass\n";
  return 0;
}
