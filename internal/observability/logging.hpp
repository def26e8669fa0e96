#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace camsync::runtime::config {
class RuntimeConfig;
}

namespace camsync::observability {

/*
  Structured logging on spdlog.

  Every line is "<message> key=value ..." followed by the process context
  fields (role, node_id once assigned) and, with ENABLE_OTEL, the active
  trace/span ids. Values containing spaces are quoted.
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

// stdout plus the optional rotating file from `logging.file`
void InitializeLogging(const camsync::runtime::config::RuntimeConfig& config, std::string_view logger_name);
void ShutdownLogging();

// Attaches key=value to every subsequent line; an empty value removes the key.
void SetLogContext(std::string_view key, std::string_view value);

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace camsync::observability

#define CAMSYNC_LOG_DEBUG(message, ...) ::camsync::observability::LogDebug((message), ##__VA_ARGS__)
#define CAMSYNC_LOG_INFO(message, ...) ::camsync::observability::LogInfo((message), ##__VA_ARGS__)
#define CAMSYNC_LOG_WARN(message, ...) ::camsync::observability::LogWarn((message), ##__VA_ARGS__)
#define CAMSYNC_LOG_ERROR(message, ...) ::camsync::observability::LogError((message), ##__VA_ARGS__)
