#include "registry_service.hpp"

#include "internal/clock/clock_sync.hpp"
#include "internal/fleet/fleet_registry.hpp"
#include "internal/storage/artifact_store.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace camsync::service {

using namespace camsync::v1;
using camsync::observability::IntField;
using camsync::observability::StringField;

namespace {

fleet::Endpoint ToEndpoint(const std::string& ip, uint32_t port) {
  return fleet::Endpoint{ip, port};
}

} // namespace

RegistryService::RegistryService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

RegisterResponse RegistryService::Register(const RegisterRequest& req) {
  return ObserveRpc("RegistryService.Register", [&] {
    RegisterResponse resp;
    if (req.local_ip().empty()) {
      resp.set_success(false);
      resp.set_error("local_ip is required");
      return resp;
    }

    const auto caps = fleet::NormalizeCapabilities(req.has_capabilities() ? &req.capabilities() : nullptr);
    resp.set_node_id(ctx_.registry->Register(ToEndpoint(req.local_ip(), req.node_port()), caps));
    resp.set_success(true);
    return resp;
  });
}

NodeOnlineResponse RegistryService::NodeOnline(const NodeOnlineRequest& req) {
  return ObserveRpc("RegistryService.NodeOnline", [&] {
    NodeOnlineResponse resp;
    if (req.node_id() <= 0) {
      resp.set_success(false);
      resp.set_error("node_id must be positive");
      return resp;
    }

    const auto caps = fleet::NormalizeCapabilities(req.has_capabilities() ? &req.capabilities() : nullptr);
    ctx_.registry->MarkOnline(req.node_id(), ToEndpoint(req.local_ip(), req.node_port()), caps);
    resp.set_success(true);
    return resp;
  });
}

NodeOfflineResponse RegistryService::NodeOffline(const NodeOfflineRequest& req) {
  return ObserveRpc("RegistryService.NodeOffline", [&] {
    ctx_.registry->MarkOffline(req.node_id());

    NodeOfflineResponse resp;
    resp.set_success(true);
    return resp;
  });
}

HeartbeatResponse RegistryService::Heartbeat(const HeartbeatRequest& req) {
  return ObserveRpc("RegistryService.Heartbeat", [&] {
    HeartbeatResponse resp;
    resp.set_success(ctx_.registry->UpdateHeartbeat(req.node_id(), req.is_ready()));
    resp.set_timestamp(ctx_.clock->SynchronizedTime());
    return resp;
  });
}

UploadCaptureResponse RegistryService::UploadCapture(const UploadCaptureRequest& req) {
  return ObserveRpc("RegistryService.UploadCapture", [&] {
    UploadCaptureResponse resp;
    resp.set_filename(req.filename());

    if (req.image_data().empty()) {
      resp.set_success(false);
      resp.set_error("no image data");
      return resp;
    }

    try {
      const auto path = ctx_.artifacts->Save(req.filename(), req.image_data());
      resp.set_success(true);
      resp.set_path(path.string());
      CAMSYNC_LOG_INFO("artifact stored", {StringField("filename", req.filename()), StringField("session_id", req.session_id()),
                                           IntField("node_id", req.node_id()), IntField("bytes", static_cast<int64_t>(req.image_data().size()))});
    } catch (const util::InvalidArgument& e) {
      resp.set_success(false);
      resp.set_error(e.what());
    }
    return resp;
  });
}

} // namespace camsync::service
