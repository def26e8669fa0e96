#include "operator_service.hpp"

#include "internal/dispatch/capture_dispatcher.hpp"
#include "internal/fleet/fleet_registry.hpp"
#include "observe_rpc.hpp"

namespace camsync::service {

using namespace camsync::v1;

OperatorService::OperatorService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

GetCamerasResponse OperatorService::GetCameras(const GetCamerasRequest&) {
  return ObserveRpc("OperatorService.GetCameras", [&] {
    GetCamerasResponse resp;
    const auto         now = ctx_.registry->Now();
    for (const auto& device : ctx_.registry->ListDevices()) {
      *resp.add_cameras() = fleet::ToDeviceInfo(device, now);
    }
    resp.set_current_preview(ctx_.registry->Reference().value_or(0));
    resp.set_online_count(ctx_.registry->OnlineCount());
    resp.set_ready_count(ctx_.registry->ReadyCount());
    return resp;
  });
}

SwitchCameraResponse OperatorService::SwitchCamera(const SwitchCameraRequest& req) {
  return ObserveRpc("OperatorService.SwitchCamera", [&] {
    SwitchCameraResponse resp;
    resp.set_success(ctx_.registry->SwitchReference(req.node_id()));
    resp.set_current_node(ctx_.registry->Reference().value_or(0));
    return resp;
  });
}

CheckReadyResponse OperatorService::CheckReady(const CheckReadyRequest&) {
  return ObserveRpc("OperatorService.CheckReady", [&] {
    CheckReadyResponse resp;
    for (const auto& [id, ready] : ctx_.registry->CheckAllReady()) {
      (*resp.mutable_ready_status())[id] = ready;
    }
    return resp;
  });
}

TriggerCaptureResponse OperatorService::TriggerCapture(const TriggerCaptureRequest& req) {
  return ObserveRpc("OperatorService.TriggerCapture", [&] {
    const double delay  = req.has_delay_seconds() ? req.delay_seconds() : ctx_.default_delay_seconds;
    const auto   result = ctx_.dispatcher->TriggerCapture(delay);

    TriggerCaptureResponse resp;
    resp.set_success(result.success);
    resp.set_error(result.error);
    resp.set_session_id(result.session_id);
    resp.set_capture_time(result.capture_time);
    resp.set_capture_time_formatted(result.capture_time_formatted);
    for (int id : result.ready_nodes) {
      resp.add_ready_nodes(id);
    }
    for (const auto& [id, sent] : result.send_results) {
      (*resp.mutable_send_results())[id] = sent;
    }
    for (const auto& [id, ready] : result.ready_status) {
      (*resp.mutable_ready_status())[id] = ready;
    }
    return resp;
  });
}

} // namespace camsync::service
