#include "artifact_store.hpp"

#include <fstream>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace camsync::storage {

ArtifactStore::ArtifactStore(std::filesystem::path root) : root_(std::move(root)) {
  std::filesystem::create_directories(root_);
}

bool ArtifactStore::IsSafeName(std::string_view filename) {
  if (filename.empty() || filename == "." || filename == "..") {
    return false;
  }
  if (filename.find('/') != std::string_view::npos || filename.find('\\') != std::string_view::npos) {
    return false;
  }
  return filename.find("..") == std::string_view::npos;
}

std::filesystem::path ArtifactStore::Save(const std::string& filename, std::string_view bytes) {
  if (!IsSafeName(filename)) {
    throw util::InvalidArgument("upload: invalid filename '" + filename + "'");
  }

  const auto final_path = root_ / filename;
  const auto tmp_path   = std::filesystem::path(final_path.string() + ".tmp");

  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("upload: cannot open " + tmp_path.string());
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
      throw std::runtime_error("upload: write failed for " + tmp_path.string());
    }
  }

  std::filesystem::rename(tmp_path, final_path);
  return final_path;
}

} // namespace camsync::storage
