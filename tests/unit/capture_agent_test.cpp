#include <atomic>
#include <cassert>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/agent/camera_backend.hpp"
#include "internal/agent/capture_agent.hpp"
#include "internal/agent/registry_link.hpp"
#include "internal/agent/simulated_camera.hpp"
#include "internal/clock/clock_sync.hpp"
#include "internal/schedule/scheduled_capture.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;
namespace v1 = camsync::v1;

using camsync::agent::CaptureAgent;
using camsync::util::ErrorCode;
using camsync::util::Result;
using camsync::util::Status;

class FakeCamera : public camsync::agent::CameraBackend {
 public:
  std::atomic<bool> ready{true};
  std::atomic<bool> fail{false};

  FakeCamera() {
    camera_.Initialize();
  }

  void Initialize() override {}
  bool IsReady() const override {
    return ready;
  }

  Status Capture(const std::string& path) override {
    std::lock_guard<std::mutex> lock(mutex_);
    shots_.push_back(path);
    if (fail) {
      return Status::Err(ErrorCode::IOError, "sensor error");
    }
    return camera_.Capture(path);
  }

  void Shutdown() override {}

  std::vector<std::string> Shots() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shots_;
  }

 private:
  mutable std::mutex               mutex_;
  std::vector<std::string>         shots_;
  camsync::agent::SimulatedCamera  camera_;
};

class FakeLink : public camsync::agent::RegistryLink {
 public:
  std::atomic<bool> fail_upload{false};

  void SetMaster(const camsync::fleet::Endpoint&) override {}
  Result<int> Register(const v1::RegisterRequest&) override {
    return Result<int>::Ok(1);
  }
  Status NodeOnline(const v1::NodeOnlineRequest&) override {
    return Status::Ok();
  }
  Status NodeOffline(const v1::NodeOfflineRequest&) override {
    return Status::Ok();
  }
  Status Heartbeat(const v1::HeartbeatRequest&) override {
    return Status::Ok();
  }

  Result<v1::UploadCaptureResponse> Upload(const v1::UploadCaptureRequest& request) override {
    std::lock_guard<std::mutex> lock(mutex_);
    uploads_.push_back(request);
    if (fail_upload) {
      return Result<v1::UploadCaptureResponse>::Err(ErrorCode::Unreachable, "master down");
    }
    v1::UploadCaptureResponse resp;
    resp.set_success(true);
    resp.set_filename(request.filename());
    resp.set_path("/srv/" + request.filename());
    return Result<v1::UploadCaptureResponse>::Ok(resp);
  }

  std::vector<v1::UploadCaptureRequest> Uploads() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return uploads_;
  }

 private:
  mutable std::mutex                    mutex_;
  std::vector<v1::UploadCaptureRequest> uploads_;
};

struct Fixture {
  fs::path                                             root;
  std::shared_ptr<camsync::schedule::ScheduledCapture> scheduler;
  std::shared_ptr<FakeCamera>                          camera = std::make_shared<FakeCamera>();
  std::shared_ptr<FakeLink>                            link   = std::make_shared<FakeLink>();
  std::unique_ptr<CaptureAgent>                        agent;

  explicit Fixture(const std::string& name) {
    root = fs::temp_directory_path() / ("camsync_agent_test_" + name);
    fs::remove_all(root);
    scheduler = std::make_shared<camsync::schedule::ScheduledCapture>(
        std::make_shared<camsync::clock::ClockSync>(std::vector<std::shared_ptr<camsync::clock::TimeSource>>{}));
    agent = std::make_unique<CaptureAgent>(scheduler, camera, link, root.string());
    agent->SetNodeId(3);
  }

  ~Fixture() {
    agent.reset();
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  double Now() const {
    return scheduler->clock().SynchronizedTime();
  }
};

v1::CaptureRequest Command(const std::string& session_id, double capture_time) {
  v1::CaptureRequest req;
  req.set_session_id(session_id);
  req.set_capture_time(capture_time);
  return req;
}

void TestValidationErrors() {
  Fixture f("validation");

  bool threw = false;
  try {
    f.agent->HandleCapture(Command("", f.Now()));
  } catch (const camsync::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    f.agent->HandleCapture(Command("capture_1", 0.0));
  } catch (const camsync::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  f.camera->ready = false;
  threw           = false;
  try {
    f.agent->HandleCapture(Command("capture_1", f.Now() + 1.0));
  } catch (const camsync::util::FailedPrecondition&) {
    threw = true;
  }
  assert(threw);
  assert(f.agent->PendingCount() == 0);
}

void TestNonFiniteCaptureTimeIsRejected() {
  Fixture f("non_finite");

  for (const double capture_time : {std::nan(""), std::numeric_limits<double>::infinity(), -std::numeric_limits<double>::infinity()}) {
    bool threw = false;
    try {
      f.agent->HandleCapture(Command("capture_bad", capture_time));
    } catch (const camsync::util::InvalidArgument&) {
      threw = true;
    }
    assert(threw);
  }
  assert(f.agent->PendingCount() == 0);

  // a rejected instant must not leave work behind for Drain
  f.agent->Drain();
  assert(f.camera->Shots().empty());
}

void TestCommandIsAcknowledgedBeforeFiring() {
  Fixture f("ack");

  const double capture_time = f.Now() + 0.3;
  const auto   started      = std::chrono::steady_clock::now();
  auto         resp         = f.agent->HandleCapture(Command("capture_ack", capture_time));
  assert(std::chrono::steady_clock::now() - started < std::chrono::milliseconds(200));

  assert(resp.success());
  assert(resp.session_id() == "capture_ack");
  assert(resp.capture_time() == capture_time);
  assert(resp.node_id() == 3);
  assert(f.agent->PendingCount() == 1);
  assert(f.agent->Status().scheduled_captures() == 1);

  f.agent->Drain();
  assert(f.agent->PendingCount() == 0);

  auto shots = f.camera->Shots();
  assert(shots.size() == 1);
  const auto expected = fs::path(f.agent->StorageDir()) / camsync::schedule::ScheduledCapture::ArtifactFilename(3, capture_time);
  assert(shots[0] == expected.string());
  assert(fs::exists(expected));

  auto uploads = f.link->Uploads();
  assert(uploads.size() == 1);
  assert(uploads[0].session_id() == "capture_ack");
  assert(uploads[0].node_id() == 3);
  assert(uploads[0].filename() == expected.filename().string());
  assert(!uploads[0].image_data().empty());
}

void TestDuplicateSessionFiresOnce() {
  Fixture f("duplicate");

  const double capture_time = f.Now() + 0.2;
  auto         first        = f.agent->HandleCapture(Command("capture_dup", capture_time));
  auto         second       = f.agent->HandleCapture(Command("capture_dup", capture_time));
  assert(first.success() && second.success());
  assert(f.agent->PendingCount() == 1);

  f.agent->Drain();
  assert(f.camera->Shots().size() == 1);
}

void TestPastCaptureTimeFiresImmediately() {
  Fixture f("past");

  f.agent->HandleCapture(Command("capture_past", f.Now() - 5.0));
  f.agent->Drain();
  assert(f.camera->Shots().size() == 1);
}

void TestPendingClearsWhenUploadOrCaptureFails() {
  Fixture f("failures");
  f.link->fail_upload = true;

  f.agent->HandleCapture(Command("capture_upload_fails", f.Now()));
  f.agent->Drain();
  assert(f.agent->PendingCount() == 0);
  assert(f.link->Uploads().size() == 1);

  f.camera->fail = true;
  f.agent->HandleCapture(Command("capture_sensor_fails", f.Now()));
  f.agent->Drain();
  assert(f.agent->PendingCount() == 0);
  // nothing to upload after a failed shot
  assert(f.link->Uploads().size() == 1);

  // the same session can be accepted again once it is no longer pending
  f.camera->fail = false;
  f.agent->HandleCapture(Command("capture_sensor_fails", f.Now()));
  f.agent->Drain();
  assert(f.camera->Shots().size() == 3);
}

void TestReadyAndStatusReflectCamera() {
  Fixture f("status");

  auto ready = f.agent->Ready();
  assert(ready.ready());
  assert(ready.node_id() == 3);
  assert(ready.timestamp() > 0);

  f.camera->ready = false;
  assert(!f.agent->Ready().ready());

  auto status = f.agent->Status();
  assert(status.status() == "online");
  assert(!status.camera_ready());
  assert(status.scheduled_captures() == 0);
}

void TestStorageDirFollowsNodeId() {
  Fixture f("storage");
  assert(fs::path(f.agent->StorageDir()).filename() == "node_3");

  f.agent->SetNodeId(0);
  assert(fs::path(f.agent->StorageDir()).filename() == "node_auto");
}

} // namespace

int main() {
  TestValidationErrors();
  TestNonFiniteCaptureTimeIsRejected();
  TestCommandIsAcknowledgedBeforeFiring();
  TestDuplicateSessionFiresOnce();
  TestPastCaptureTimeFiresImmediately();
  TestPendingClearsWhenUploadOrCaptureFails();
  TestReadyAndStatusReflectCamera();
  TestStorageDirFollowsNodeId();

  std::cout << "camsync_unit_capture_agent: pass\n";
  return 0;
}
