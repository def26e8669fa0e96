#include "trace_metadata.hpp"

namespace camsync::grpc {

namespace {

constexpr const char* kPropagatedKeys[] = {"traceparent", "tracestate"};

} // namespace

void AttachTraceContext(::grpc::ClientContext* ctx) {
  for (const auto& [key, value] : observability::CurrentTraceHeaders()) {
    ctx->AddMetadata(key, value);
  }
}

observability::TraceHeaders TraceHeadersOf(const ::grpc::ServerContext* ctx) {
  observability::TraceHeaders headers;
  if (ctx == nullptr) {
    return headers;
  }
  const auto& metadata = ctx->client_metadata();
  for (const char* key : kPropagatedKeys) {
    auto it = metadata.find(key);
    if (it != metadata.end()) {
      headers.emplace(key, std::string(it->second.data(), it->second.size()));
    }
  }
  return headers;
}

} // namespace camsync::grpc
