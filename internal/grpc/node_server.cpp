#include "node_server.hpp"

#include "grpc_error.hpp"
#include "trace_metadata.hpp"

namespace camsync::grpc {

using namespace camsync::v1;

NodeServer::NodeServer(std::shared_ptr<camsync::service::NodeService> svc) : service_(std::move(svc)) {
}

::grpc::Status NodeServer::Ready(::grpc::ServerContext* ctx, const ReadyRequest* req, ReadyResponse* resp) {
  observability::RemoteContextScope caller(TraceHeadersOf(ctx));
  try {
    *resp = service_->Ready(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status NodeServer::Capture(::grpc::ServerContext* ctx, const CaptureRequest* req, CaptureResponse* resp) {
  observability::RemoteContextScope caller(TraceHeadersOf(ctx));
  try {
    *resp = service_->Capture(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status NodeServer::Status(::grpc::ServerContext* ctx, const StatusRequest* req, StatusResponse* resp) {
  observability::RemoteContextScope caller(TraceHeadersOf(ctx));
  try {
    *resp = service_->Status(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace camsync::grpc
