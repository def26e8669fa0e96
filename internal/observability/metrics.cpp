#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "config/config.pb.h"

namespace camsync::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {

using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
template <typename T>
using Instrument = opentelemetry::nostd::shared_ptr<T>;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string MetricsEndpoint(const camsync::runtime::config::ObservabilityConfig& config) {
  if (!config.otlp_endpoint().empty()) {
    return config.otlp_endpoint();
  }
  for (const char* name : {"OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    if (const char* endpoint = std::getenv(name)) {
      return endpoint;
    }
  }
  return config.transport() == camsync::runtime::config::OTLP_TRANSPORT_HTTP ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const camsync::runtime::config::ObservabilityConfig& config) {
  if (config.transport() == camsync::runtime::config::OTLP_TRANSPORT_HTTP) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = MetricsEndpoint(config);
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = MetricsEndpoint(config);
  options.use_ssl_credentials = false;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

} // namespace

/*
  Instruments:
    camsync.request.count / latency_ms     per RPC route
    camsync.capture.fire_lateness_ms       node: shutter time past capture_time
    camsync.capture.sends                  master: command sends by outcome
    camsync.fleet.devices                  master: devices per lifecycle state
    camsync.fleet.heartbeat_expired        master: devices dropped by the monitor
    camsync.clock.offset_ms                both: current clock offset estimate
*/
struct Metrics::Impl {
  Instrument<metrics_api::Meter> meter;

  Instrument<metrics_api::Counter<std::uint64_t>> request_count;
  Instrument<metrics_api::Histogram<double>>      request_latency_ms;
  Instrument<metrics_api::Histogram<double>>      fire_lateness_ms;
  Instrument<metrics_api::Counter<std::uint64_t>> capture_sends;
  Instrument<metrics_api::Counter<std::uint64_t>> heartbeat_expired;
  Instrument<metrics_api::ObservableInstrument>   device_gauge;
  Instrument<metrics_api::ObservableInstrument>   clock_offset_gauge;

  std::mutex                          device_mutex;
  std::map<std::string, std::int64_t> device_counts;
  std::atomic<double>                 clock_offset_ms{0.0};
};

bool InitializeMetrics(const camsync::runtime::config::RuntimeConfig& config, std::string_view service_name) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  const auto interval_ms = observability.metrics_export_interval_ms() > 0 ? observability.metrics_export_interval_ms() : 1000;
  reader_options.export_interval_millis = std::chrono::milliseconds(interval_ms);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(observability), reader_options);

  resource::ResourceAttributes attrs = {{"service.name", std::string(service_name)}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attrs));
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter("camsync", "0.1.0");
  auto& meter  = impl_->meter;

  impl_->request_count      = meter->CreateUInt64Counter("camsync.request.count", "Service requests", "1");
  impl_->request_latency_ms = meter->CreateDoubleHistogram("camsync.request.latency_ms", "Service request latency", "ms");
  impl_->fire_lateness_ms   = meter->CreateDoubleHistogram("camsync.capture.fire_lateness_ms", "Shutter fire time past the scheduled capture time", "ms");
  impl_->capture_sends      = meter->CreateUInt64Counter("camsync.capture.sends", "Capture commands sent to devices", "1");
  impl_->heartbeat_expired  = meter->CreateUInt64Counter("camsync.fleet.heartbeat_expired", "Devices marked offline by heartbeat timeout", "1");

  impl_->device_gauge = meter->CreateInt64ObservableGauge("camsync.fleet.devices", "Devices per lifecycle state", "1");
  impl_->device_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto*                       impl = static_cast<Impl*>(state);
        std::lock_guard<std::mutex> lock(impl->device_mutex);
        auto observer = opentelemetry::nostd::get<Instrument<metrics_api::ObserverResultT<std::int64_t>>>(result);
        for (const auto& [device_state, count] : impl->device_counts) {
          const std::initializer_list<AttributePair> attributes = {{"state", device_state}};
          observer->Observe(count, attributes);
        }
      },
      impl_.get());

  impl_->clock_offset_gauge = meter->CreateDoubleObservableGauge("camsync.clock.offset_ms", "Local clock offset from the time reference", "ms");
  impl_->clock_offset_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl     = static_cast<Impl*>(state);
        auto  observer = opentelemetry::nostd::get<Instrument<metrics_api::ObserverResultT<double>>>(result);
        observer->Observe(impl->clock_offset_ms.load());
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}, {"success", success}};
  impl_->request_count->Add(1, attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}};
  impl_->request_latency_ms->Record(latency_ms, attributes, opentelemetry::context::Context{});
}

void Metrics::ObserveFireLatenessMs(double lateness_ms) {
  impl_->fire_lateness_ms->Record(lateness_ms, opentelemetry::context::Context{});
}

void Metrics::SetDeviceCount(std::string_view state, std::uint64_t count) {
  std::lock_guard<std::mutex> lock(impl_->device_mutex);
  impl_->device_counts[std::string(state)] = static_cast<std::int64_t>(count);
}

void Metrics::RecordCaptureSend(bool delivered) {
  const std::initializer_list<AttributePair> attributes = {{"outcome", delivered ? "delivered" : "failed"}};
  impl_->capture_sends->Add(1, attributes);
}

void Metrics::RecordHeartbeatExpired(std::uint64_t devices) {
  if (devices > 0) {
    impl_->heartbeat_expired->Add(devices);
  }
}

void Metrics::SetClockOffsetMs(double offset_ms) {
  impl_->clock_offset_ms.store(offset_ms);
}

} // namespace camsync::observability

#endif
