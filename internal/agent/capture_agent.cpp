#include "capture_agent.hpp"

#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iterator>

#include "camera_backend.hpp"
#include "internal/clock/clock_sync.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/schedule/scheduled_capture.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "registry_link.hpp"

namespace camsync::agent {

using camsync::observability::DoubleField;
using camsync::observability::IntField;
using camsync::observability::StringField;

CaptureAgent::CaptureAgent(std::shared_ptr<schedule::ScheduledCapture> scheduler, std::shared_ptr<CameraBackend> camera,
                           std::shared_ptr<RegistryLink> link, std::string storage_root)
    : scheduler_(std::move(scheduler)), camera_(std::move(camera)), link_(std::move(link)), storage_root_(std::move(storage_root)) {}

CaptureAgent::~CaptureAgent() {
  Drain();
}

void CaptureAgent::SetNodeId(int node_id) {
  node_id_ = node_id;
}

std::string CaptureAgent::StorageDir() const {
  const int id = node_id_;
  return (std::filesystem::path(storage_root_) / (id > 0 ? "node_" + std::to_string(id) : std::string("node_auto"))).string();
}

v1::CaptureResponse CaptureAgent::HandleCapture(const v1::CaptureRequest& request) {
  if (!std::isfinite(request.capture_time()) || request.capture_time() <= 0 || request.session_id().empty()) {
    throw util::InvalidArgument("capture: capture_time and session_id are required");
  }
  if (!camera_->IsReady()) {
    throw util::FailedPrecondition("capture: camera not ready");
  }

  v1::CaptureResponse resp;
  resp.set_success(true);
  resp.set_session_id(request.session_id());
  resp.set_capture_time(request.capture_time());
  resp.set_node_id(node_id_);

  std::lock_guard<std::mutex> lock(mutex_);
  ReapFinishedLocked();

  if (pending_.count(request.session_id()) > 0) {
    CAMSYNC_LOG_INFO("duplicate capture command acknowledged", {StringField("session_id", request.session_id())});
    return resp;
  }

  // the worker erases its session under mutex_, so it cannot finish before the insert below
  const std::string session_id   = request.session_id();
  const double      capture_time = request.capture_time();
  auto              trace        = observability::CurrentTraceHeaders();
  workers_.push_back(std::async(std::launch::async, [this, session_id, capture_time, trace = std::move(trace)] {
    observability::RemoteContextScope parent(trace);
    Fire(session_id, capture_time);
  }));
  pending_.insert(session_id);

  const double lead = capture_time - scheduler_->clock().SynchronizedTime();
  CAMSYNC_LOG_INFO("capture scheduled",
                   {StringField("session_id", session_id), StringField("capture_time", util::FormatLocalTime(capture_time)), DoubleField("lead_sec", lead)});
  return resp;
}

void CaptureAgent::Fire(const std::string& session_id, double capture_time) {
  observability::SpanScope span("capture.fire");
  span.SetAttribute("camsync.session_id", session_id);
  span.SetAttribute("camsync.node_id", static_cast<std::int64_t>(node_id_));

  try {
    const auto filename = schedule::ScheduledCapture::ArtifactFilename(node_id_, capture_time);
    const auto path     = (std::filesystem::path(StorageDir()) / filename).string();

    util::Status captured;
    const double lateness = scheduler_->WaitUntil(capture_time, [&] { captured = camera_->Capture(path); });
    observability::Metrics::Instance().ObserveFireLatenessMs(lateness * 1000.0);
    span.SetAttribute("camsync.fire_lateness_ms", lateness * 1000.0);

    if (captured.ok()) {
      CAMSYNC_LOG_INFO("capture fired", {StringField("session_id", session_id), StringField("path", path), DoubleField("lateness_ms", lateness * 1000.0)});
      Upload(session_id, filename, path);
    } else {
      span.RecordException(captured.message);
      CAMSYNC_LOG_ERROR("capture failed", {StringField("session_id", session_id), StringField("error", captured.message)});
    }
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    CAMSYNC_LOG_ERROR("capture worker failed", {StringField("session_id", session_id), StringField("error", e.what())});
  }

  std::lock_guard<std::mutex> lock(mutex_);
  pending_.erase(session_id);
}

void CaptureAgent::Upload(const std::string& session_id, const std::string& filename, const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    CAMSYNC_LOG_ERROR("artifact unreadable, upload skipped", {StringField("path", path)});
    return;
  }

  v1::UploadCaptureRequest req;
  req.set_filename(filename);
  req.set_session_id(session_id);
  req.set_node_id(node_id_);
  req.set_image_data(std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()));

  auto uploaded = link_->Upload(req);
  if (!uploaded.ok()) {
    CAMSYNC_LOG_WARN("artifact upload failed", {StringField("session_id", session_id), StringField("filename", filename),
                                                StringField("code", util::ToString(uploaded.status().code)), StringField("error", uploaded.status().message)});
    return;
  }
  CAMSYNC_LOG_INFO("artifact uploaded", {StringField("filename", filename), StringField("stored_at", uploaded->path())});
}

void CaptureAgent::ReapFinishedLocked() {
  std::erase_if(workers_, [](const std::future<void>& worker) { return worker.wait_for(std::chrono::seconds(0)) == std::future_status::ready; });
}

v1::ReadyResponse CaptureAgent::Ready() const {
  const auto& clock = scheduler_->clock();

  v1::ReadyResponse resp;
  resp.set_ready(camera_->IsReady());
  resp.set_node_id(node_id_);
  resp.set_timestamp(clock.SynchronizedTime());
  resp.set_time_synchronized(clock.IsSynchronized());
  return resp;
}

v1::StatusResponse CaptureAgent::Status() const {
  const auto& clock = scheduler_->clock();

  v1::StatusResponse resp;
  resp.set_node_id(node_id_);
  resp.set_status("online");
  resp.set_camera_ready(camera_->IsReady());
  resp.set_time_synchronized(clock.IsSynchronized());
  resp.set_current_time(clock.SynchronizedTime());
  resp.set_scheduled_captures(static_cast<uint32_t>(PendingCount()));
  return resp;
}

size_t CaptureAgent::PendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

void CaptureAgent::Drain() {
  std::vector<std::future<void>> workers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    workers.swap(workers_);
  }
  for (auto& worker : workers) {
    worker.wait();
  }
  if (!workers.empty()) {
    CAMSYNC_LOG_INFO("pending captures drained", {IntField("count", static_cast<int64_t>(workers.size()))});
  }
}

} // namespace camsync::agent
