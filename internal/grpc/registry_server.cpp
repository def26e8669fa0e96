#include "registry_server.hpp"

#include "grpc_error.hpp"

namespace camsync::grpc {

using namespace camsync::v1;

RegistryServer::RegistryServer(std::shared_ptr<camsync::service::RegistryService> svc) : service_(std::move(svc)) {
}

::grpc::Status RegistryServer::Register(::grpc::ServerContext*, const RegisterRequest* req, RegisterResponse* resp) {
  try {
    *resp = service_->Register(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::NodeOnline(::grpc::ServerContext*, const NodeOnlineRequest* req, NodeOnlineResponse* resp) {
  try {
    *resp = service_->NodeOnline(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::NodeOffline(::grpc::ServerContext*, const NodeOfflineRequest* req, NodeOfflineResponse* resp) {
  try {
    *resp = service_->NodeOffline(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::Heartbeat(::grpc::ServerContext*, const HeartbeatRequest* req, HeartbeatResponse* resp) {
  try {
    *resp = service_->Heartbeat(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::UploadCapture(::grpc::ServerContext*, const UploadCaptureRequest* req, UploadCaptureResponse* resp) {
  try {
    *resp = service_->UploadCapture(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace camsync::grpc
