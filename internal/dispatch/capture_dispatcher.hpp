#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace camsync::fleet {
class FleetRegistry;
class NodeTransport;
} // namespace camsync::fleet

namespace camsync::schedule {
class ScheduledCapture;
}

namespace camsync::dispatch {

struct DispatchResult {
  bool        success = false;
  std::string error;

  std::string session_id;
  double      capture_time = 0;
  std::string capture_time_formatted;

  std::vector<int>    ready_nodes;
  std::map<int, bool> send_results;
  std::map<int, bool> ready_status;
};

/*
  One coordinated capture: readiness snapshot, one shared capture instant,
  concurrent independent sends. Returns once every send has completed; it does
  not wait for the nodes to fire.
*/
class CaptureDispatcher {
 public:
  CaptureDispatcher(std::shared_ptr<fleet::FleetRegistry> registry, std::shared_ptr<fleet::NodeTransport> transport,
                    std::shared_ptr<schedule::ScheduledCapture> scheduler);

  // throws util::InvalidArgument for a negative delay
  DispatchResult TriggerCapture(double delay_seconds);

 private:
  std::shared_ptr<fleet::FleetRegistry>       registry_;
  std::shared_ptr<fleet::NodeTransport>       transport_;
  std::shared_ptr<schedule::ScheduledCapture> scheduler_;
};

} // namespace camsync::dispatch
