#include "grpc_error.hpp"

namespace camsync::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace camsync::util;

  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const FailedPrecondition*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const Unavailable*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

util::Status FromGrpcStatus(const ::grpc::Status& status) {
  using util::ErrorCode;

  if (status.ok()) {
    return util::Status::Ok();
  }

  switch (status.error_code()) {
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
      return util::Status::Err(ErrorCode::Timeout, status.error_message());
    case ::grpc::StatusCode::UNAVAILABLE:
      return util::Status::Err(ErrorCode::Unreachable, status.error_message());
    case ::grpc::StatusCode::INVALID_ARGUMENT:
    case ::grpc::StatusCode::FAILED_PRECONDITION:
    case ::grpc::StatusCode::NOT_FOUND:
      return util::Status::Err(ErrorCode::Rejected, status.error_message());
    default:
      return util::Status::Err(ErrorCode::InternalError, status.error_message());
  }
}

} // namespace camsync::grpc
