#pragma once

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "camsync/v1/node_service.pb.h"

namespace camsync::schedule {
class ScheduledCapture;
}

namespace camsync::agent {

class CameraBackend;
class RegistryLink;

/*
  CaptureAgent

  Node-side half of the capture protocol. Accepts a command, acknowledges it
  immediately, and fires the camera on a worker at the shared capture instant.
  Each session is pending from acceptance until the fire (and best-effort
  upload) finishes, whatever the outcome.
*/
class CaptureAgent {
 public:
  CaptureAgent(std::shared_ptr<schedule::ScheduledCapture> scheduler, std::shared_ptr<CameraBackend> camera,
               std::shared_ptr<RegistryLink> link, std::string storage_root);
  ~CaptureAgent();

  // Throws util::InvalidArgument for a missing capture_time/session_id and
  // util::FailedPrecondition when the camera is not ready.
  v1::CaptureResponse HandleCapture(const v1::CaptureRequest& request);

  v1::ReadyResponse  Ready() const;
  v1::StatusResponse Status() const;

  size_t PendingCount() const;

  // blocks until every accepted session has fired
  void Drain();

  void SetNodeId(int node_id);
  int  node_id() const {
    return node_id_;
  }

  std::string StorageDir() const;

 private:
  void Fire(const std::string& session_id, double capture_time);
  void Upload(const std::string& session_id, const std::string& filename, const std::string& path);
  void ReapFinishedLocked();

  std::shared_ptr<schedule::ScheduledCapture> scheduler_;
  std::shared_ptr<CameraBackend>              camera_;
  std::shared_ptr<RegistryLink>               link_;
  std::string                                 storage_root_;
  std::atomic<int>                            node_id_{0};

  mutable std::mutex             mutex_;
  std::set<std::string>          pending_;
  std::vector<std::future<void>> workers_;
};

} // namespace camsync::agent
