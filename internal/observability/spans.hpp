#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace camsync::runtime::config {
class RuntimeConfig;
}

namespace camsync::observability {

bool InitializeTracing(const camsync::runtime::config::RuntimeConfig& config, std::string_view service_name);
bool InitializeMetrics(const camsync::runtime::config::RuntimeConfig& config, std::string_view service_name);
void ShutdownTracing();
void ShutdownMetrics();

// W3C trace context (traceparent / tracestate) as lowercase header pairs.
using TraceHeaders = std::map<std::string, std::string>;

// Serializes the calling thread's active span; empty when there is none.
TraceHeaders CurrentTraceHeaders();

/*
  Makes a propagated context current for the lifetime of the scope so that
  spans opened inside it (on this thread) become children of the remote span.
  Used on both sides of a hop: a node continuing the master's capture trace,
  and fan-out threads continuing the trace of the thread that spawned them.
*/
class RemoteContextScope {
 public:
  explicit RemoteContextScope(const TraceHeaders& headers);
  ~RemoteContextScope();

  RemoteContextScope(const RemoteContextScope&)            = delete;
  RemoteContextScope& operator=(const RemoteContextScope&) = delete;

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  // how far past capture_time the shutter actually fired
  void ObserveFireLatenessMs(double lateness_ms);
  void SetDeviceCount(std::string_view state, std::uint64_t count);
  void RecordCaptureSend(bool delivered);
  void RecordHeartbeatExpired(std::uint64_t devices);
  void SetClockOffsetMs(double offset_ms);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const camsync::runtime::config::RuntimeConfig&, std::string_view) {
  return false;
}
inline bool InitializeMetrics(const camsync::runtime::config::RuntimeConfig&, std::string_view) {
  return false;
}
inline void ShutdownTracing() {}
inline void ShutdownMetrics() {}

inline TraceHeaders CurrentTraceHeaders() {
  return {};
}

inline RemoteContextScope::RemoteContextScope(const TraceHeaders&) {}
inline RemoteContextScope::~RemoteContextScope() {}

inline SpanScope::SpanScope(std::string_view) {}
inline SpanScope::~SpanScope() {}
inline SpanScope::SpanScope(SpanScope&&) noexcept            = default;
inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {}
inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {}
inline void SpanScope::SetAttribute(std::string_view, double) {}
inline void SpanScope::AddEvent(std::string_view) {}
inline void SpanScope::RecordException(std::string_view) {}

inline Metrics::Metrics() {}
inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}
inline void Metrics::RecordRequest(std::string_view, bool) {}
inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {}
inline void Metrics::ObserveFireLatenessMs(double) {}
inline void Metrics::SetDeviceCount(std::string_view, std::uint64_t) {}
inline void Metrics::RecordCaptureSend(bool) {}
inline void Metrics::RecordHeartbeatExpired(std::uint64_t) {}
inline void Metrics::SetClockOffsetMs(double) {}
#endif

} // namespace camsync::observability
