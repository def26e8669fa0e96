#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace camsync::service {

// Wraps one service call in a span plus request count/latency metrics. Errors
// are logged and rethrown for the gRPC adapter to translate.
template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  camsync::observability::SpanScope span(route);

  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] { return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count(); };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      camsync::observability::Metrics::Instance().RecordRequest(route, true);
      camsync::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return;
    } else {
      auto result = fn();
      camsync::observability::Metrics::Instance().RecordRequest(route, true);
      camsync::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    CAMSYNC_LOG_ERROR("RPC failed", {camsync::observability::StringField("route", route), camsync::observability::StringField("error", ex.what())});
    camsync::observability::Metrics::Instance().RecordRequest(route, false);
    camsync::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

} // namespace camsync::service
