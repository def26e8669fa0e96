#include "factory.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "internal/agent/capture_agent.hpp"
#include "internal/agent/grpc_registry_link.hpp"
#include "internal/agent/node_session.hpp"
#include "internal/agent/simulated_camera.hpp"
#include "internal/clock/clock_sync.hpp"
#include "internal/clock/clock_sync_worker.hpp"
#include "internal/clock/sntp_time_source.hpp"
#include "internal/discovery/discovery_responder.hpp"
#include "internal/discovery/udp_socket.hpp"
#include "internal/dispatch/capture_dispatcher.hpp"
#include "internal/fleet/fleet_registry.hpp"
#include "internal/fleet/grpc_node_transport.hpp"
#include "internal/fleet/heartbeat_monitor.hpp"
#include "internal/grpc/node_server.hpp"
#include "internal/grpc/operator_server.hpp"
#include "internal/grpc/registry_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/schedule/scheduled_capture.hpp"
#include "internal/service/node_service.hpp"
#include "internal/service/operator_service.hpp"
#include "internal/service/registry_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/storage/artifact_store.hpp"

namespace camsync::factory {

using namespace camsync;
using camsync::observability::StringField;
using std::chrono::milliseconds;
using std::chrono::seconds;

namespace {

std::shared_ptr<clock::ClockSync> BuildClock(const runtime::config::ClockConfig& config) {
  std::vector<std::shared_ptr<clock::TimeSource>> sources;
  for (const auto& server : config.ntp_servers()) {
    sources.push_back(std::make_shared<clock::SntpTimeSource>(server, milliseconds(config.query_timeout_ms())));
  }
  return std::make_shared<clock::ClockSync>(std::move(sources), static_cast<double>(config.max_age_sec()));
}

std::string BindAddress(const runtime::config::RuntimeConfig& config, uint32_t port) {
  if (!config.server().bind_address().empty()) {
    return config.server().bind_address();
  }
  return "0.0.0.0:" + std::to_string(port);
}

std::string AdvertisedIp(const runtime::config::RegistryConfig& config) {
  if (!config.advertised_ip().empty()) {
    return config.advertised_ip();
  }
  auto detected = discovery::DetectLocalIp();
  if (detected.ok()) {
    return detected.value();
  }
  CAMSYNC_LOG_WARN("cannot detect advertised ip, discovery answers with loopback", {StringField("error", detected.status().message)});
  return "127.0.0.1";
}

} // namespace

/*
    Master: registry, dispatch, artifact sink, discovery
*/
MasterApplication BuildMaster(const runtime::config::RuntimeConfig& config) {
  MasterApplication app;
  const auto&       registry_config = config.registry();

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto clock     = BuildClock(config.clock());
  auto scheduler = std::make_shared<schedule::ScheduledCapture>(clock);
  auto transport = std::make_shared<fleet::GrpcNodeTransport>(milliseconds(registry_config.probe_timeout_ms()),
                                                              milliseconds(registry_config.command_timeout_ms()));

  fleet::RegistryOptions options;
  options.heartbeat_timeout = seconds(registry_config.heartbeat_timeout_sec());
  auto registry             = std::make_shared<fleet::FleetRegistry>(options, transport);

  auto dispatcher = std::make_shared<dispatch::CaptureDispatcher>(registry, transport, scheduler);
  auto artifacts  = std::make_shared<storage::ArtifactStore>(registry_config.image_storage_path());

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.clock                 = clock;
  ctx.scheduler             = scheduler;
  ctx.registry              = registry;
  ctx.dispatcher            = dispatcher;
  ctx.artifacts             = artifacts;
  ctx.default_delay_seconds = registry_config.default_delay_seconds();

  app.grpc_services.push_back(std::make_unique<grpc::RegistryServer>(std::make_shared<service::RegistryService>(ctx)));
  app.grpc_services.push_back(std::make_unique<grpc::OperatorServer>(std::make_shared<service::OperatorService>(ctx)));
  app.bind_address = BindAddress(config, registry_config.advertised_port());
  app.max_receive_bytes = static_cast<size_t>(config.server().max_receive_message_mb()) << 20;

  // ------------------------------------------------------------------
  // Background workers
  // ------------------------------------------------------------------
  app.clock             = clock;
  app.registry          = registry;
  app.clock_worker      = std::make_shared<clock::ClockSyncWorker>(clock, seconds(config.clock().sync_interval_sec()));
  app.heartbeat_monitor = std::make_shared<fleet::HeartbeatMonitor>(registry, seconds(registry_config.monitor_interval_sec()));
  app.discovery         = std::make_shared<discovery::DiscoveryResponder>(static_cast<uint16_t>(registry_config.discovery_port()),
                                                                          AdvertisedIp(registry_config), registry_config.advertised_port());
  return app;
}

void MasterApplication::StartBackground() {
  if (!clock->Sync().ok()) {
    CAMSYNC_LOG_WARN("initial clock sync failed, capture times use local time until the next sync");
  }
  clock_worker->Start();
  heartbeat_monitor->Start();
  discovery->Start();
}

void MasterApplication::StopBackground() {
  discovery->Stop();
  heartbeat_monitor->Stop();
  clock_worker->Stop();
}

/*
    Node: capture agent plus its membership session
*/
NodeApplication BuildNode(const runtime::config::RuntimeConfig& config) {
  NodeApplication app;
  const auto&     node_config = config.node();

  auto clock     = BuildClock(config.clock());
  auto scheduler = std::make_shared<schedule::ScheduledCapture>(clock);
  auto camera    = std::make_shared<agent::SimulatedCamera>();

  agent::RegistryLinkTimeouts timeouts;
  timeouts.registration = milliseconds(node_config.register_timeout_ms());
  timeouts.heartbeat    = milliseconds(node_config.heartbeat_timeout_ms());
  timeouts.upload       = milliseconds(node_config.upload_timeout_ms());
  auto link             = std::make_shared<agent::GrpcRegistryLink>(timeouts);

  auto capture_agent = std::make_shared<agent::CaptureAgent>(scheduler, camera, link, node_config.image_storage_path());

  agent::SessionOptions options;
  options.node_id   = node_config.node_id();
  options.master    = fleet::Endpoint{node_config.master_ip(), node_config.master_port()};
  options.local_ip  = node_config.local_ip();
  options.node_port = node_config.node_port();
  options.state_file = node_config.state_file();
  options.discovery.port    = static_cast<uint16_t>(node_config.discovery_port());
  options.discovery.timeout = milliseconds(node_config.discovery_timeout_ms());
  options.discovery.broadcast_addresses.assign(node_config.broadcast_addresses().begin(), node_config.broadcast_addresses().end());
  options.heartbeat_interval = seconds(node_config.heartbeat_interval_sec());
  options.heartbeat_backoff  = seconds(node_config.heartbeat_backoff_sec());

  service::ServiceContext ctx;
  ctx.clock     = clock;
  ctx.scheduler = scheduler;
  ctx.agent     = capture_agent;

  app.grpc_services.push_back(std::make_unique<grpc::NodeServer>(std::make_shared<service::NodeService>(ctx)));
  app.bind_address = BindAddress(config, node_config.node_port());
  app.max_receive_bytes = static_cast<size_t>(config.server().max_receive_message_mb()) << 20;

  app.clock        = clock;
  app.agent        = capture_agent;
  app.session      = std::make_shared<agent::NodeSession>(std::move(options), clock, camera, link, capture_agent);
  app.clock_worker = std::make_shared<clock::ClockSyncWorker>(clock, seconds(config.clock().sync_interval_sec()));
  return app;
}

void NodeApplication::StartBackground() {
  session->Start();
  clock_worker->Start();
}

void NodeApplication::StopBackground() {
  clock_worker->Stop();
  session->Stop();
}

} // namespace camsync::factory
