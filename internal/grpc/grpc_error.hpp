#pragma once

#include <grpcpp/grpcpp.h>

#include "internal/util/errors.hpp"
#include "internal/util/result.hpp"

namespace camsync::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/
::grpc::Status ToStatus(const std::exception& e);

/*
  Converts a failed client call into a transport-neutral Status.
*/
util::Status FromGrpcStatus(const ::grpc::Status& status);

} // namespace camsync::grpc
