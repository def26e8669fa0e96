#pragma once

#include <string>

#include "config/config.pb.h"
#include "logging.hpp"
#include "spans.hpp"

namespace camsync::observability {

// Brings up tracing, metrics and logging for one process role and tears them
// down in reverse order when it goes out of scope.
class TelemetryScope {
 public:
  TelemetryScope(const camsync::runtime::config::RuntimeConfig& config, const std::string& role) {
    InitializeTracing(config, role);
    InitializeMetrics(config, role);
    InitializeLogging(config, role);
  }
  ~TelemetryScope() {
    ShutdownLogging();
    ShutdownMetrics();
    ShutdownTracing();
  }

  TelemetryScope(const TelemetryScope&)            = delete;
  TelemetryScope& operator=(const TelemetryScope&) = delete;
};

} // namespace camsync::observability
