#pragma once

#include <memory>

namespace camsync::clock { class ClockSync; }
namespace camsync::schedule { class ScheduledCapture; }
namespace camsync::fleet { class FleetRegistry; }
namespace camsync::dispatch { class CaptureDispatcher; }
namespace camsync::storage { class ArtifactStore; }
namespace camsync::agent { class CaptureAgent; }

namespace camsync::service {

/*
  Dependency container shared by all services.
  The master fills the registry side, a node fills clock/scheduler/agent.
*/
struct ServiceContext {
  std::shared_ptr<camsync::clock::ClockSync> clock;
  std::shared_ptr<camsync::schedule::ScheduledCapture> scheduler;

  std::shared_ptr<camsync::fleet::FleetRegistry> registry;
  std::shared_ptr<camsync::dispatch::CaptureDispatcher> dispatcher;
  std::shared_ptr<camsync::storage::ArtifactStore> artifacts;

  std::shared_ptr<camsync::agent::CaptureAgent> agent;

  double default_delay_seconds = 0.5;
};

}
