#include "grpc_node_transport.hpp"

#include "camsync/v1.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/trace_metadata.hpp"

namespace camsync::fleet {

using util::ErrorCode;

GrpcNodeTransport::GrpcNodeTransport(std::chrono::milliseconds probe_timeout, std::chrono::milliseconds command_timeout)
    : probe_timeout_(probe_timeout), command_timeout_(command_timeout) {}

std::shared_ptr<::grpc::Channel> GrpcNodeTransport::ChannelFor(const Endpoint& endpoint) {
  const auto address = endpoint.Address();

  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = channels_.find(address);
  if (it != channels_.end()) {
    return it->second;
  }
  auto channel = ::grpc::CreateChannel(address, ::grpc::InsecureChannelCredentials());
  channels_.emplace(address, channel);
  return channel;
}

util::Result<v1::ReadyResponse> GrpcNodeTransport::Ready(const Endpoint& endpoint) {
  auto stub = v1::NodeService::NewStub(ChannelFor(endpoint));

  ::grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + probe_timeout_);
  camsync::grpc::AttachTraceContext(&ctx);

  v1::ReadyRequest  req;
  v1::ReadyResponse resp;
  const auto        status = stub->Ready(&ctx, req, &resp);
  if (!status.ok()) {
    return util::Result<v1::ReadyResponse>::Err(camsync::grpc::FromGrpcStatus(status));
  }
  return util::Result<v1::ReadyResponse>::Ok(std::move(resp));
}

util::Result<v1::CaptureResponse> GrpcNodeTransport::Capture(const Endpoint& endpoint, const v1::CaptureRequest& request) {
  auto stub = v1::NodeService::NewStub(ChannelFor(endpoint));

  ::grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + command_timeout_);
  camsync::grpc::AttachTraceContext(&ctx);

  v1::CaptureResponse resp;
  const auto          status = stub->Capture(&ctx, request, &resp);
  if (!status.ok()) {
    return util::Result<v1::CaptureResponse>::Err(camsync::grpc::FromGrpcStatus(status));
  }
  if (!resp.success()) {
    return util::Result<v1::CaptureResponse>::Err(ErrorCode::Rejected, "node declined capture " + request.session_id());
  }
  return util::Result<v1::CaptureResponse>::Ok(std::move(resp));
}

} // namespace camsync::fleet
