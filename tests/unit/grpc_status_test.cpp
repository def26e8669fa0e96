#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "internal/agent/capture_agent.hpp"
#include "internal/agent/registry_link.hpp"
#include "internal/agent/simulated_camera.hpp"
#include "internal/clock/clock_sync.hpp"
#include "internal/dispatch/capture_dispatcher.hpp"
#include "internal/fleet/fleet_registry.hpp"
#include "internal/fleet/grpc_node_transport.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/node_server.hpp"
#include "internal/grpc/operator_server.hpp"
#include "internal/runtime/server.hpp"
#include "internal/schedule/scheduled_capture.hpp"
#include "internal/service/node_service.hpp"
#include "internal/service/operator_service.hpp"
#include "internal/service/service_context.hpp"

namespace {

namespace fs = std::filesystem;
namespace v1 = camsync::v1;

using camsync::util::ErrorCode;
using camsync::util::Result;
using camsync::util::Status;

// Master that is never reachable.
class UnreachableLink : public camsync::agent::RegistryLink {
 public:
  void SetMaster(const camsync::fleet::Endpoint&) override {}
  Result<int> Register(const v1::RegisterRequest&) override {
    return Result<int>::Err(ErrorCode::Unreachable, "no master");
  }
  Status NodeOnline(const v1::NodeOnlineRequest&) override {
    return Status::Err(ErrorCode::Unreachable, "no master");
  }
  Status NodeOffline(const v1::NodeOfflineRequest&) override {
    return Status::Err(ErrorCode::Unreachable, "no master");
  }
  Status Heartbeat(const v1::HeartbeatRequest&) override {
    return Status::Err(ErrorCode::Unreachable, "no master");
  }
  Result<v1::UploadCaptureResponse> Upload(const v1::UploadCaptureRequest&) override {
    return Result<v1::UploadCaptureResponse>::Err(ErrorCode::Unreachable, "no master");
  }
};

struct Node {
  fs::path                                         root;
  std::shared_ptr<camsync::agent::SimulatedCamera> camera = std::make_shared<camsync::agent::SimulatedCamera>();
  camsync::service::ServiceContext                 ctx;

  Node() {
    root      = fs::temp_directory_path() / "camsync_grpc_status_test";
    ctx.clock = std::make_shared<camsync::clock::ClockSync>(std::vector<std::shared_ptr<camsync::clock::TimeSource>>{});
    ctx.scheduler = std::make_shared<camsync::schedule::ScheduledCapture>(ctx.clock);
    ctx.agent = std::make_shared<camsync::agent::CaptureAgent>(ctx.scheduler, camera, std::make_shared<UnreachableLink>(), root.string());
    ctx.agent->SetNodeId(5);
  }

  ~Node() {
    ctx.agent->Drain();
    std::error_code ec;
    fs::remove_all(root, ec);
  }
};

void TestCaptureValidationMapsToInvalidArgument() {
  Node                        node;
  camsync::grpc::NodeServer   server(std::make_shared<camsync::service::NodeService>(node.ctx));

  v1::CaptureRequest  req;
  v1::CaptureResponse resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.Capture(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestCameraNotReadyMapsToFailedPrecondition() {
  Node                      node;
  camsync::grpc::NodeServer server(std::make_shared<camsync::service::NodeService>(node.ctx));

  v1::CaptureRequest req;
  req.set_session_id("capture_1");
  req.set_capture_time(node.ctx.clock->SynchronizedTime() + 1.0);
  v1::CaptureResponse   resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.Capture(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestNegativeDelayMapsToInvalidArgument() {
  camsync::service::ServiceContext ctx;
  ctx.clock      = std::make_shared<camsync::clock::ClockSync>(std::vector<std::shared_ptr<camsync::clock::TimeSource>>{});
  ctx.scheduler  = std::make_shared<camsync::schedule::ScheduledCapture>(ctx.clock);
  auto transport = std::make_shared<camsync::fleet::GrpcNodeTransport>(std::chrono::milliseconds(200), std::chrono::milliseconds(200));
  ctx.registry   = std::make_shared<camsync::fleet::FleetRegistry>(camsync::fleet::RegistryOptions{}, transport);
  ctx.dispatcher = std::make_shared<camsync::dispatch::CaptureDispatcher>(ctx.registry, transport, ctx.scheduler);

  camsync::grpc::OperatorServer server(std::make_shared<camsync::service::OperatorService>(ctx));

  v1::TriggerCaptureRequest req;
  req.set_delay_seconds(-2.0);
  v1::TriggerCaptureResponse resp;
  ::grpc::ServerContext      grpc_ctx;

  const auto status = server.TriggerCapture(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestExceptionMapping() {
  using camsync::grpc::ToStatus;
  assert(ToStatus(camsync::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(camsync::util::Unavailable("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);
}

void TestClientStatusMapping() {
  using camsync::grpc::FromGrpcStatus;
  assert(FromGrpcStatus(::grpc::Status(::grpc::StatusCode::DEADLINE_EXCEEDED, "slow")).code == ErrorCode::Timeout);
  assert(FromGrpcStatus(::grpc::Status(::grpc::StatusCode::UNAVAILABLE, "down")).code == ErrorCode::Unreachable);
  assert(FromGrpcStatus(::grpc::Status(::grpc::StatusCode::FAILED_PRECONDITION, "busy")).code == ErrorCode::Rejected);
  assert(FromGrpcStatus(::grpc::Status(::grpc::StatusCode::INVALID_ARGUMENT, "bad")).code == ErrorCode::Rejected);
  assert(FromGrpcStatus(::grpc::Status(::grpc::StatusCode::INTERNAL, "boom")).code == ErrorCode::InternalError);
}

void TestTransportAgainstLoopbackNode() {
  Node node;

  std::vector<std::unique_ptr<::grpc::Service>> services;
  services.push_back(std::make_unique<camsync::grpc::NodeServer>(std::make_shared<camsync::service::NodeService>(node.ctx)));
  camsync::runtime::Server server({"127.0.0.1:0"}, std::move(services));
  server.Start();
  assert(server.port() > 0);

  camsync::fleet::GrpcNodeTransport transport(std::chrono::milliseconds(2000), std::chrono::milliseconds(2000));
  const camsync::fleet::Endpoint    endpoint{"127.0.0.1", static_cast<uint32_t>(server.port())};

  auto ready = transport.Ready(endpoint);
  assert(ready.ok());
  assert(!ready->ready());
  assert(ready->node_id() == 5);

  v1::CaptureRequest command;
  command.set_session_id("capture_loopback");
  command.set_capture_time(node.ctx.clock->SynchronizedTime());

  auto refused = transport.Capture(endpoint, command);
  assert(!refused.ok());
  assert(refused.status().code == ErrorCode::Rejected);

  node.camera->Initialize();
  auto accepted = transport.Capture(endpoint, command);
  assert(accepted.ok());
  assert(accepted->session_id() == "capture_loopback");

  server.Stop();

  auto gone = transport.Ready(endpoint);
  assert(!gone.ok());
}

} // namespace

int main() {
  TestCaptureValidationMapsToInvalidArgument();
  TestCameraNotReadyMapsToFailedPrecondition();
  TestNegativeDelayMapsToInvalidArgument();
  TestExceptionMapping();
  TestClientStatusMapping();
  TestTransportAgainstLoopbackNode();

  std::cout << "camsync_unit_grpc_status: pass\n";
  return 0;
}
