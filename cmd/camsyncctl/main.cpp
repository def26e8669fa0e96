#include <grpcpp/grpcpp.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "camsync/v1.hpp"

using namespace camsync::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  camsyncctl <addr> cameras\n"
            << "  camsyncctl <addr> switch <node_id>\n"
            << "  camsyncctl <addr> ready\n"
            << "  camsyncctl <addr> capture [delay_seconds]\n"
            << "  camsyncctl <addr> node-status\n";
}

static const char* StateName(DeviceState state) {
  switch (state) {
    case DEVICE_STATE_OFFLINE:
      return "offline";
    case DEVICE_STATE_ONLINE:
      return "online";
    case DEVICE_STATE_READY:
      return "ready";
    case DEVICE_STATE_CAPTURING:
      return "capturing";
    case DEVICE_STATE_ERROR:
      return "error";
    default:
      return "unspecified";
  }
}

template <typename Map>
static void PrintBoolMap(const char* label, const Map& map) {
  for (const auto& [id, value] : map) {
    std::cout << label << "[" << id << "]=" << (value ? "true" : "false") << "\n";
  }
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel       = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto operator_stub = OperatorService::NewStub(channel);
  auto node_stub     = NodeService::NewStub(channel);

  grpc::ClientContext ctx;
  // readiness probes on the master fan out with their own deadlines
  ctx.set_deadline(std::chrono::system_clock::now() + std::chrono::seconds(30));

  // ------------------------------------------------------------
  if (cmd == "cameras") {
    GetCamerasResponse resp;
    auto               status = operator_stub->GetCameras(&ctx, GetCamerasRequest{}, &resp);
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    for (const auto& camera : resp.cameras()) {
      std::cout << "node=" << camera.node_id() << " addr=" << camera.ip_address() << ":" << camera.node_port() << " status=" << StateName(camera.status())
                << " ready=" << (camera.is_ready() ? "true" : "false") << " heartbeat_age=" << camera.heartbeat_age() << "s\n";
    }
    std::cout << "preview=" << resp.current_preview() << " online=" << resp.online_count() << " ready=" << resp.ready_count() << "\n";
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "switch") {
    if (argc < 4) return 1;

    SwitchCameraRequest req;
    req.set_node_id(std::atoi(argv[3]));

    SwitchCameraResponse resp;
    auto                 status = operator_stub->SwitchCamera(&ctx, req, &resp);
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }
    std::cout << (resp.success() ? "switched" : "rejected") << " preview=" << resp.current_node() << "\n";
    return resp.success() ? 0 : 3;
  }

  // ------------------------------------------------------------
  if (cmd == "ready") {
    CheckReadyResponse resp;
    auto               status = operator_stub->CheckReady(&ctx, CheckReadyRequest{}, &resp);
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }
    PrintBoolMap("ready", resp.ready_status());
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "capture") {
    TriggerCaptureRequest req;
    if (argc >= 4) {
      req.set_delay_seconds(std::stod(argv[3]));
    }

    TriggerCaptureResponse resp;
    auto                   status = operator_stub->TriggerCapture(&ctx, req, &resp);
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    if (!resp.success()) {
      std::cerr << "capture failed: " << resp.error() << "\n";
      PrintBoolMap("ready", resp.ready_status());
      return 3;
    }

    std::cout << "session=" << resp.session_id() << "\n"
              << "capture_time=" << resp.capture_time_formatted() << "\n";
    PrintBoolMap("sent", resp.send_results());
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "node-status") {
    StatusResponse resp;
    auto           status = node_stub->Status(&ctx, StatusRequest{}, &resp);
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }
    std::cout << "node=" << resp.node_id() << " status=" << resp.status() << " camera_ready=" << (resp.camera_ready() ? "true" : "false")
              << " time_synchronized=" << (resp.time_synchronized() ? "true" : "false") << " scheduled=" << resp.scheduled_captures() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
