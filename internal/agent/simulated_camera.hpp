#pragma once

#include <atomic>

#include "camera_backend.hpp"

namespace camsync::agent {

// Stand-in sensor for hosts without camera hardware; writes a placeholder file.
class SimulatedCamera final : public CameraBackend {
 public:
  void Initialize() override;
  bool IsReady() const override;
  util::Status Capture(const std::string& path) override;
  void Shutdown() override;

 private:
  std::atomic<bool> initialized_{false};
};

} // namespace camsync::agent
