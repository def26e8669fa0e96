#include "simulated_camera.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>

#include "internal/observability/logging.hpp"

namespace camsync::agent {

using camsync::observability::StringField;

void SimulatedCamera::Initialize() {
  initialized_ = true;
  CAMSYNC_LOG_WARN("camera running in simulation mode");
}

bool SimulatedCamera::IsReady() const {
  return initialized_;
}

util::Status SimulatedCamera::Capture(const std::string& path) {
  if (!initialized_) {
    return util::Status::Err(util::ErrorCode::Rejected, "camera not initialized");
  }

  std::error_code ec;
  const auto      parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return util::Status::Err(util::ErrorCode::IOError, "create " + parent.string() + ": " + ec.message());
    }
  }

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return util::Status::Err(util::ErrorCode::IOError, "open " + path);
  }
  // SOI, comment segment, EOI
  static constexpr unsigned char kHeader[] = {0xFF, 0xD8, 0xFF, 0xFE};
  static constexpr unsigned char kTrailer[] = {0xFF, 0xD9};
  const std::string               comment   = "camsync simulated frame " + std::filesystem::path(path).filename().string();
  const uint16_t                  length    = static_cast<uint16_t>(comment.size() + 2);

  out.write(reinterpret_cast<const char*>(kHeader), sizeof(kHeader));
  out.put(static_cast<char>(length >> 8));
  out.put(static_cast<char>(length & 0xFF));
  out.write(comment.data(), static_cast<std::streamsize>(comment.size()));
  out.write(reinterpret_cast<const char*>(kTrailer), sizeof(kTrailer));
  if (!out) {
    return util::Status::Err(util::ErrorCode::IOError, "write " + path);
  }

  CAMSYNC_LOG_DEBUG("simulated capture written", {StringField("path", path)});
  return util::Status::Ok();
}

void SimulatedCamera::Shutdown() {
  initialized_ = false;
}

} // namespace camsync::agent
