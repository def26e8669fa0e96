#pragma once

#include <string>

#include "internal/util/result.hpp"

namespace camsync::agent {

/*
  Capture hardware seen by the agent.

  Initialize throws when the sensor cannot be acquired; that is a fatal
  startup failure. Capture reports per-shot failures as a Status.
*/
class CameraBackend {
 public:
  virtual ~CameraBackend() = default;

  virtual void Initialize() = 0;
  virtual bool IsReady() const = 0;

  // writes one still image to `path`
  virtual util::Status Capture(const std::string& path) = 0;

  virtual void Shutdown() = 0;
};

} // namespace camsync::agent
