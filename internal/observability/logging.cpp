#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <iomanip>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace camsync::observability {
namespace {

constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%n] [%^%l%$] [%t] %v";

std::mutex                         g_context_mutex;
std::map<std::string, std::string> g_context;

// environment wins over the file so a field device can be debugged without editing it
std::string FromEnvOr(const char* name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(name)) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

void AppendField(std::string& out, std::string_view key, std::string_view value) {
  if (!out.empty()) {
    out.push_back(' ');
  }
  out.append(key);
  out.push_back('=');
  if (value.empty() || value.find(' ') != std::string_view::npos) {
    out.push_back('"');
    out.append(value);
    out.push_back('"');
  } else {
    out.append(value);
  }
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

void AppendTraceContext(std::string& out) {
  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return;
  }
  auto context = span->GetContext();
  if (!context.IsValid()) {
    return;
  }

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  AppendField(out, "trace_id", HexId(trace_bytes, 16));
  AppendField(out, "span_id", HexId(span_bytes, 8));
}
#else
void AppendTraceContext(std::string&) {}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField DoubleField(std::string_view key, double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(3) << value;
  return {std::string(key), out.str()};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const camsync::runtime::config::RuntimeConfig& config, std::string_view logger_name) {
  const auto& logging = config.logging();

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!logging.file().empty()) {
    const std::size_t max_bytes = static_cast<std::size_t>(logging.max_file_size_mb()) * 1024 * 1024;
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logging.file(), max_bytes, logging.max_files()));
  }

  auto logger = std::make_shared<spdlog::logger>(std::string(logger_name), sinks.begin(), sinks.end());
  logger->set_pattern(FromEnvOr("CAMSYNC_LOG_PATTERN", logging.pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(FromEnvOr("CAMSYNC_LOG_LEVEL", logging.level(), "info")));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  SetLogContext("role", logger_name);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void SetLogContext(std::string_view key, std::string_view value) {
  std::lock_guard<std::mutex> lock(g_context_mutex);
  if (value.empty()) {
    g_context.erase(std::string(key));
    return;
  }
  g_context[std::string(key)] = std::string(value);
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto logger = spdlog::default_logger();
  // null once ShutdownLogging has dropped the registry
  if (!logger || !logger->should_log(level)) {
    return;
  }

  std::string suffix;
  for (const auto& field : fields) {
    AppendField(suffix, field.key, field.value);
  }
  {
    std::lock_guard<std::mutex> lock(g_context_mutex);
    for (const auto& [key, value] : g_context) {
      AppendField(suffix, key, value);
    }
  }
  AppendTraceContext(suffix);

  if (suffix.empty()) {
    logger->log(level, "{}", message);
  } else {
    logger->log(level, "{} {}", message, suffix);
  }
}

} // namespace camsync::observability
