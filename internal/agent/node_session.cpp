#include "node_session.hpp"

#include <optional>

#include "camera_backend.hpp"
#include "capture_agent.hpp"
#include "internal/clock/clock_sync.hpp"
#include "internal/discovery/udp_socket.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "node_state_store.hpp"
#include "registry_link.hpp"

namespace camsync::agent {

using camsync::observability::BoolField;
using camsync::observability::IntField;
using camsync::observability::StringField;

namespace {

constexpr const char* kFallbackLocalIp = "127.0.0.1";

v1::Capabilities FullCapabilities() {
  return fleet::NormalizeCapabilities(nullptr);
}

} // namespace

NodeSession::NodeSession(SessionOptions options, std::shared_ptr<clock::ClockSync> clock, std::shared_ptr<CameraBackend> camera,
                         std::shared_ptr<RegistryLink> link, std::shared_ptr<CaptureAgent> agent)
    : options_(std::move(options)), clock_(std::move(clock)), camera_(std::move(camera)), link_(std::move(link)), agent_(std::move(agent)),
      node_id_(options_.node_id),
      heartbeat_worker_("node-heartbeat", options_.heartbeat_interval, options_.heartbeat_backoff, [this] { return HeartbeatOnce(); }, true) {}

NodeSession::~NodeSession() {
  Stop();
}

void NodeSession::Start() {
  if (auto synced = clock_->Sync(); synced.ok()) {
    CAMSYNC_LOG_INFO("clock synchronized", {StringField("now", util::FormatLocalTime(clock_->SynchronizedTime()))});
  } else {
    CAMSYNC_LOG_WARN("clock sync failed, using local time", {StringField("error", synced.message)});
  }

  ResolveLocalIp();
  ResolveMaster();

  camera_->Initialize();

  AcquireNodeId();
  agent_->SetNodeId(node_id_);
  observability::SetLogContext("node_id", std::to_string(node_id_));

  if (!Announce()) {
    CAMSYNC_LOG_WARN("node_online not acknowledged, heartbeat loop will retry", {IntField("node_id", node_id_)});
  }

  heartbeat_worker_.Start();
  started_ = true;
  CAMSYNC_LOG_INFO("node session started", {IntField("node_id", node_id_), StringField("local_ip", options_.local_ip)});
}

void NodeSession::Stop() {
  if (!started_.exchange(false)) {
    return;
  }
  heartbeat_worker_.Stop();

  if (announced_) {
    v1::NodeOfflineRequest req;
    req.set_node_id(node_id_);
    req.set_local_ip(options_.local_ip);
    auto status = link_->NodeOffline(req);
    if (!status.ok()) {
      CAMSYNC_LOG_WARN("node_offline not delivered", {StringField("error", status.message)});
    }
    announced_ = false;
  }

  agent_->Drain();
  camera_->Shutdown();
  CAMSYNC_LOG_INFO("node session stopped", {IntField("node_id", node_id_)});
}

void NodeSession::ResolveLocalIp() {
  if (!options_.local_ip.empty()) {
    return;
  }
  auto detected = discovery::DetectLocalIp();
  if (detected.ok()) {
    options_.local_ip = detected.value();
    return;
  }
  CAMSYNC_LOG_WARN("local ip detection failed", {StringField("error", detected.status().message), StringField("using", kFallbackLocalIp)});
  options_.local_ip = kFallbackLocalIp;
}

void NodeSession::ResolveMaster() {
  if (options_.master.ip.empty()) {
    auto found = discovery::DiscoverMaster(options_.discovery, options_.local_ip);
    if (!found.ok()) {
      throw util::Unavailable("master discovery failed: " + found.status().message);
    }
    options_.master = found.value();
  }
  link_->SetMaster(options_.master);
}

void NodeSession::AcquireNodeId() {
  if (node_id_ > 0) {
    return;
  }

  std::optional<NodeStateStore> store;
  if (!options_.state_file.empty()) {
    store.emplace(options_.state_file);
    auto stored = store->LoadNodeId();
    if (!stored.ok()) {
      CAMSYNC_LOG_WARN("node state unreadable, registering for a new id", {StringField("error", stored.status().message)});
    } else if (stored.value() > 0) {
      node_id_ = stored.value();
      CAMSYNC_LOG_INFO("node id restored", {IntField("node_id", node_id_), StringField("state_file", options_.state_file)});
      return;
    }
  }

  v1::RegisterRequest req;
  req.set_local_ip(options_.local_ip);
  req.set_node_port(options_.node_port);
  *req.mutable_capabilities() = FullCapabilities();

  auto assigned = link_->Register(req);
  if (!assigned.ok()) {
    throw util::Unavailable("registration failed: " + assigned.status().message);
  }
  node_id_ = assigned.value();
  CAMSYNC_LOG_INFO("node id assigned", {IntField("node_id", node_id_)});

  if (store) {
    if (auto saved = store->Save(node_id_, options_.master); !saved.ok()) {
      CAMSYNC_LOG_WARN("node id not persisted, a restart will register again", {StringField("error", saved.message)});
    }
  }
}

bool NodeSession::Announce() {
  v1::NodeOnlineRequest req;
  req.set_node_id(node_id_);
  req.set_local_ip(options_.local_ip);
  req.set_node_port(options_.node_port);
  *req.mutable_capabilities() = FullCapabilities();

  auto status = link_->NodeOnline(req);
  if (!status.ok()) {
    CAMSYNC_LOG_WARN("node_online failed", {StringField("code", util::ToString(status.code)), StringField("error", status.message)});
    return false;
  }
  announced_ = true;
  return true;
}

bool NodeSession::HeartbeatOnce() {
  if (!announced_) {
    return Announce();
  }

  v1::HeartbeatRequest req;
  req.set_node_id(node_id_);
  req.set_status("online");
  req.set_timestamp(util::UnixSeconds());
  req.set_is_ready(camera_->IsReady());
  req.set_local_ip(options_.local_ip);

  auto status = link_->Heartbeat(req);
  if (status.ok()) {
    return true;
  }
  if (status.code == util::ErrorCode::Rejected) {
    announced_ = false;
  }
  CAMSYNC_LOG_DEBUG("heartbeat failed", {StringField("code", util::ToString(status.code)), BoolField("announced", announced_)});
  return false;
}

} // namespace camsync::agent
