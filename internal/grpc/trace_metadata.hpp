#pragma once

#include <grpcpp/grpcpp.h>

#include "internal/observability/spans.hpp"

namespace camsync::grpc {

// Adds the calling thread's trace context to an outgoing call.
void AttachTraceContext(::grpc::ClientContext* ctx);

// Trace headers the caller sent, if any.
observability::TraceHeaders TraceHeadersOf(const ::grpc::ServerContext* ctx);

} // namespace camsync::grpc
