#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/context/propagation/text_map_propagator.h>
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/samplers/parent_factory.h>
#include <opentelemetry/sdk/trace/samplers/trace_id_ratio_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/propagation/http_trace_context.h>
#include <opentelemetry/trace/provider.h>

#include <unistd.h>

#include <climits>
#include <cstdlib>
#include <string>
#include <utility>

#include "config/config.pb.h"

namespace camsync::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace trace_api   = opentelemetry::trace;
namespace sdktrace    = opentelemetry::sdk::trace;
namespace resource    = opentelemetry::sdk::resource;
namespace context_api = opentelemetry::context;

namespace {

std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::string TracesEndpoint(const camsync::runtime::config::ObservabilityConfig& config) {
  if (!config.otlp_endpoint().empty()) {
    return config.otlp_endpoint();
  }
  for (const char* name : {"OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    if (const char* endpoint = std::getenv(name)) {
      return endpoint;
    }
  }
  return config.transport() == camsync::runtime::config::OTLP_TRANSPORT_HTTP ? "http://localhost:4318/v1/traces" : "localhost:4317";
}

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const camsync::runtime::config::ObservabilityConfig& config) {
  if (config.transport() == camsync::runtime::config::OTLP_TRANSPORT_HTTP) {
    otlp::OtlpHttpExporterOptions options;
    options.url = TracesEndpoint(config);
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = TracesEndpoint(config);
  options.use_ssl_credentials = false;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

// every device in the fleet exports under the same service name
std::string HostName() {
  char name[HOST_NAME_MAX + 1] = {};
  if (::gethostname(name, sizeof(name) - 1) != 0) {
    return "unknown";
  }
  return name;
}

class HeaderCarrier : public context_api::propagation::TextMapCarrier {
 public:
  explicit HeaderCarrier(TraceHeaders* headers) : headers_(headers) {}

  opentelemetry::nostd::string_view Get(opentelemetry::nostd::string_view key) const noexcept override {
    auto it = headers_->find(std::string(key));
    if (it == headers_->end()) {
      return "";
    }
    return it->second;
  }

  void Set(opentelemetry::nostd::string_view key, opentelemetry::nostd::string_view value) noexcept override {
    (*headers_)[std::string(key)] = std::string(value);
  }

 private:
  TraceHeaders* headers_;
};

} // namespace

bool InitializeTracing(const camsync::runtime::config::RuntimeConfig& config, std::string_view service_name) {
  const auto& observability = config.observability();
  if (!observability.tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  auto processor = sdktrace::BatchSpanProcessorFactory::Create(MakeExporter(observability), sdktrace::BatchSpanProcessorOptions{});
  std::shared_ptr<sdktrace::Sampler> ratio = sdktrace::TraceIdRatioBasedSamplerFactory::Create(observability.trace_sample_ratio());
  auto sampler = sdktrace::ParentBasedSamplerFactory::Create(ratio);

  resource::ResourceAttributes attrs = {{"service.name", std::string(service_name)}, {"host.name", HostName()}};
  auto provider = sdktrace::TracerProviderFactory::Create(std::move(processor), resource::Resource::Create(attrs), std::move(sampler));

  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer("camsync", "0.1.0");
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  if (g_sdk_provider) {
    g_sdk_provider->ForceFlush();
    g_sdk_provider->Shutdown();
  }
  g_sdk_provider.reset();
  g_tracer = nullptr;
}

TraceHeaders CurrentTraceHeaders() {
  TraceHeaders headers;
  if (!g_tracer) {
    return headers;
  }
  HeaderCarrier                            carrier(&headers);
  trace_api::propagation::HttpTraceContext propagator;
  propagator.Inject(carrier, context_api::RuntimeContext::GetCurrent());
  return headers;
}

struct RemoteContextScope::Impl {
  opentelemetry::nostd::unique_ptr<context_api::Token> token;
};

RemoteContextScope::RemoteContextScope(const TraceHeaders& headers) : impl_(std::make_unique<Impl>()) {
  if (!g_tracer || headers.empty()) {
    return;
  }
  TraceHeaders                             copy = headers;
  HeaderCarrier                            carrier(&copy);
  trace_api::propagation::HttpTraceContext propagator;

  auto current   = context_api::RuntimeContext::GetCurrent();
  auto extracted = propagator.Extract(carrier, current);
  impl_->token   = context_api::RuntimeContext::Attach(extracted);
}

RemoteContextScope::~RemoteContextScope() = default;

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  if (!g_tracer) {
    return;
  }
  impl_->span  = g_tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(g_tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_ && impl_->span) {
    impl_->span->End();
  }
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(std::string(key), std::string(value));
  }
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(std::string(key), value);
  }
}

void SpanScope::SetAttribute(std::string_view key, double value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(std::string(key), value);
  }
}

void SpanScope::AddEvent(std::string_view name) {
  if (impl_ && impl_->span) {
    impl_->span->AddEvent(std::string(name));
  }
}

void SpanScope::RecordException(std::string_view description) {
  if (impl_ && impl_->span) {
    impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
    impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
  }
}

} // namespace camsync::observability

#endif
