#include "node_service.hpp"

#include "internal/agent/capture_agent.hpp"
#include "observe_rpc.hpp"

namespace camsync::service {

using namespace camsync::v1;

NodeService::NodeService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ReadyResponse NodeService::Ready(const ReadyRequest&) {
  return ObserveRpc("NodeService.Ready", [&] { return ctx_.agent->Ready(); });
}

CaptureResponse NodeService::Capture(const CaptureRequest& req) {
  return ObserveRpc("NodeService.Capture", [&] { return ctx_.agent->HandleCapture(req); });
}

StatusResponse NodeService::Status(const StatusRequest&) {
  return ObserveRpc("NodeService.Status", [&] { return ctx_.agent->Status(); });
}

} // namespace camsync::service
