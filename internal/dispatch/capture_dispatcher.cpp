#include "capture_dispatcher.hpp"

#include <cmath>
#include <optional>
#include <thread>

#include "camsync/v1/node_service.pb.h"
#include "internal/fleet/fleet_registry.hpp"
#include "internal/fleet/node_transport.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/schedule/scheduled_capture.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace camsync::dispatch {

using camsync::observability::IntField;
using camsync::observability::StringField;

CaptureDispatcher::CaptureDispatcher(std::shared_ptr<fleet::FleetRegistry> registry, std::shared_ptr<fleet::NodeTransport> transport,
                                     std::shared_ptr<schedule::ScheduledCapture> scheduler)
    : registry_(std::move(registry)), transport_(std::move(transport)), scheduler_(std::move(scheduler)) {}

DispatchResult CaptureDispatcher::TriggerCapture(double delay_seconds) {
  if (!std::isfinite(delay_seconds) || delay_seconds < 0) {
    throw util::InvalidArgument("trigger_capture: delay_seconds must be a finite value >= 0");
  }

  DispatchResult result;
  result.ready_status = registry_->CheckAllReady();

  for (const auto& [id, ready] : result.ready_status) {
    if (ready) {
      result.ready_nodes.push_back(id);
    }
  }

  if (result.ready_nodes.empty()) {
    result.error = "no ready devices";
    CAMSYNC_LOG_WARN("capture not dispatched: no ready devices", {IntField("tracked", static_cast<int64_t>(result.ready_status.size()))});
    return result;
  }

  result.session_id             = scheduler_->GenerateSessionId();
  result.capture_time           = scheduler_->Schedule(result.session_id, delay_seconds);
  result.capture_time_formatted = util::FormatLocalTime(result.capture_time);

  v1::CaptureRequest command;
  command.set_capture_time(result.capture_time);
  command.set_session_id(result.session_id);
  command.set_delay_seconds(delay_seconds);

  // endpoints are snapshotted before fan-out
  std::vector<std::optional<fleet::Endpoint>> endpoints;
  endpoints.reserve(result.ready_nodes.size());
  for (int id : result.ready_nodes) {
    auto device = registry_->Locate(id);
    endpoints.push_back(device ? std::optional<fleet::Endpoint>(device->endpoint) : std::nullopt);
  }

  const auto trace = observability::CurrentTraceHeaders();

  std::vector<util::Status> outcomes(result.ready_nodes.size());
  std::vector<std::thread>  sends;
  sends.reserve(result.ready_nodes.size());
  for (size_t i = 0; i < result.ready_nodes.size(); ++i) {
    if (!endpoints[i]) {
      outcomes[i] = util::Status::Err(util::ErrorCode::Unreachable, "device no longer tracked");
      continue;
    }
    sends.emplace_back([this, &endpoints, &outcomes, &command, &trace, i] {
      observability::RemoteContextScope parent(trace);
      auto sent = transport_->Capture(*endpoints[i], command);
      outcomes[i] = sent.status();
    });
  }
  for (auto& send : sends) {
    send.join();
  }

  for (size_t i = 0; i < result.ready_nodes.size(); ++i) {
    const int id = result.ready_nodes[i];
    observability::Metrics::Instance().RecordCaptureSend(outcomes[i].ok());
    if (outcomes[i].ok()) {
      registry_->MarkCapturing(id);
      result.send_results[id] = true;
    } else {
      registry_->MarkError(id);
      result.send_results[id] = false;
      CAMSYNC_LOG_WARN("capture command failed", {IntField("node_id", id), StringField("session_id", result.session_id),
                                                  StringField("code", util::ToString(outcomes[i].code)), StringField("error", outcomes[i].message)});
    }
  }

  result.success = true;
  CAMSYNC_LOG_INFO("capture dispatched", {StringField("session_id", result.session_id), StringField("capture_time", result.capture_time_formatted),
                                          IntField("nodes", static_cast<int64_t>(result.ready_nodes.size()))});
  return result;
}

} // namespace camsync::dispatch
