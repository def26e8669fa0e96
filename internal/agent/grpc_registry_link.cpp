#include "grpc_registry_link.hpp"

#include "internal/grpc/grpc_error.hpp"
#include "internal/observability/logging.hpp"

namespace camsync::agent {

using camsync::observability::StringField;
using util::ErrorCode;

namespace {

void SetDeadline(::grpc::ClientContext* ctx, std::chrono::milliseconds timeout) {
  ctx->set_deadline(std::chrono::system_clock::now() + timeout);
}

util::Status NoMaster() {
  return util::Status::Err(ErrorCode::Unreachable, "master address unknown");
}

} // namespace

GrpcRegistryLink::GrpcRegistryLink(RegistryLinkTimeouts timeouts) : timeouts_(timeouts) {}

void GrpcRegistryLink::SetMaster(const fleet::Endpoint& master) {
  auto channel = ::grpc::CreateChannel(master.Address(), ::grpc::InsecureChannelCredentials());

  std::lock_guard<std::mutex> lock(mutex_);
  stub_ = std::shared_ptr<v1::RegistryService::Stub>(v1::RegistryService::NewStub(channel));
  CAMSYNC_LOG_INFO("registry link target set", {StringField("master", master.Address())});
}

std::shared_ptr<v1::RegistryService::Stub> GrpcRegistryLink::Stub() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stub_;
}

util::Result<int> GrpcRegistryLink::Register(const v1::RegisterRequest& request) {
  auto stub = Stub();
  if (!stub) {
    return util::Result<int>::Err(NoMaster());
  }

  ::grpc::ClientContext ctx;
  SetDeadline(&ctx, timeouts_.registration);
  v1::RegisterResponse resp;
  const auto           status = stub->Register(&ctx, request, &resp);
  if (!status.ok()) {
    return util::Result<int>::Err(camsync::grpc::FromGrpcStatus(status));
  }
  if (!resp.success() || resp.node_id() <= 0) {
    return util::Result<int>::Err(ErrorCode::Rejected, resp.error());
  }
  return util::Result<int>::Ok(resp.node_id());
}

util::Status GrpcRegistryLink::NodeOnline(const v1::NodeOnlineRequest& request) {
  auto stub = Stub();
  if (!stub) {
    return NoMaster();
  }

  ::grpc::ClientContext ctx;
  SetDeadline(&ctx, timeouts_.registration);
  v1::NodeOnlineResponse resp;
  const auto             status = stub->NodeOnline(&ctx, request, &resp);
  if (!status.ok()) {
    return camsync::grpc::FromGrpcStatus(status);
  }
  if (!resp.success()) {
    return util::Status::Err(ErrorCode::Rejected, resp.error());
  }
  return util::Status::Ok();
}

util::Status GrpcRegistryLink::NodeOffline(const v1::NodeOfflineRequest& request) {
  auto stub = Stub();
  if (!stub) {
    return NoMaster();
  }

  ::grpc::ClientContext ctx;
  SetDeadline(&ctx, timeouts_.heartbeat);
  v1::NodeOfflineResponse resp;
  return camsync::grpc::FromGrpcStatus(stub->NodeOffline(&ctx, request, &resp));
}

util::Status GrpcRegistryLink::Heartbeat(const v1::HeartbeatRequest& request) {
  auto stub = Stub();
  if (!stub) {
    return NoMaster();
  }

  ::grpc::ClientContext ctx;
  SetDeadline(&ctx, timeouts_.heartbeat);
  v1::HeartbeatResponse resp;
  const auto            status = stub->Heartbeat(&ctx, request, &resp);
  if (!status.ok()) {
    return camsync::grpc::FromGrpcStatus(status);
  }
  if (!resp.success()) {
    return util::Status::Err(ErrorCode::Rejected, "master does not know this node");
  }
  return util::Status::Ok();
}

util::Result<v1::UploadCaptureResponse> GrpcRegistryLink::Upload(const v1::UploadCaptureRequest& request) {
  auto stub = Stub();
  if (!stub) {
    return util::Result<v1::UploadCaptureResponse>::Err(NoMaster());
  }

  ::grpc::ClientContext ctx;
  SetDeadline(&ctx, timeouts_.upload);
  v1::UploadCaptureResponse resp;
  const auto                status = stub->UploadCapture(&ctx, request, &resp);
  if (!status.ok()) {
    return util::Result<v1::UploadCaptureResponse>::Err(camsync::grpc::FromGrpcStatus(status));
  }
  if (!resp.success()) {
    return util::Result<v1::UploadCaptureResponse>::Err(ErrorCode::Rejected, resp.error());
  }
  return util::Result<v1::UploadCaptureResponse>::Ok(std::move(resp));
}

} // namespace camsync::agent
