#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/telemetry.hpp"
#include "internal/runtime/server.hpp"

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void RequestStop(int) {
  g_stop_requested = 1;
}

bool ParseArgs(int argc, char** argv, std::string* config_path) {
  if (argc == 2 && std::string(argv[1]) != "--help") {
    *config_path = argv[1];
    return true;
  }
  if (argc == 3 && std::string(argv[1]) == "--config") {
    *config_path = argv[2];
    return true;
  }
  return false;
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (!ParseArgs(argc, argv, &config_path)) {
    std::cerr << "usage: camsync-master [--config] <config.yaml>\n";
    return 1;
  }

  camsync::runtime::config::RuntimeConfig config;
  try {
    config = camsync::config::ConfigLoader::LoadFromYaml(config_path);
  } catch (const std::exception& e) {
    std::cerr << "camsync-master: " << e.what() << "\n";
    return 2;
  }

  camsync::observability::TelemetryScope telemetry(config, "camsync-master");
  using camsync::observability::StringField;

  try {
    auto app = camsync::factory::BuildMaster(config);
    camsync::runtime::Server server({app.bind_address, app.max_receive_bytes}, std::move(app.grpc_services));

    std::signal(SIGINT, RequestStop);
    std::signal(SIGTERM, RequestStop);

    // registry must be reachable before discovery starts advertising it
    server.Start();
    app.StartBackground();
    CAMSYNC_LOG_INFO("master up", {StringField("bind_address", app.bind_address)});

    while (!g_stop_requested) std::this_thread::sleep_for(std::chrono::milliseconds(500));

    CAMSYNC_LOG_INFO("master stopping");
    app.StopBackground();
    server.Stop();
  } catch (const std::exception& e) {
    CAMSYNC_LOG_ERROR("master failed", {StringField("error", e.what())});
    return 2;
  }
  return 0;
}
