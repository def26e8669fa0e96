#include "operator_server.hpp"

#include "grpc_error.hpp"

namespace camsync::grpc {

using namespace camsync::v1;

OperatorServer::OperatorServer(std::shared_ptr<camsync::service::OperatorService> svc) : service_(std::move(svc)) {
}

::grpc::Status OperatorServer::GetCameras(::grpc::ServerContext*, const GetCamerasRequest* req, GetCamerasResponse* resp) {
  try {
    *resp = service_->GetCameras(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status OperatorServer::SwitchCamera(::grpc::ServerContext*, const SwitchCameraRequest* req, SwitchCameraResponse* resp) {
  try {
    *resp = service_->SwitchCamera(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status OperatorServer::CheckReady(::grpc::ServerContext*, const CheckReadyRequest* req, CheckReadyResponse* resp) {
  try {
    *resp = service_->CheckReady(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status OperatorServer::TriggerCapture(::grpc::ServerContext*, const TriggerCaptureRequest* req, TriggerCaptureResponse* resp) {
  try {
    *resp = service_->TriggerCapture(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace camsync::grpc
