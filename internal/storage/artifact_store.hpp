#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace camsync::storage {

/*
  Flat directory of uploaded capture artifacts on the master.
  Names are taken as-is from the uploader and must be a single path component.
*/
class ArtifactStore {
 public:
  // creates `root` when missing
  explicit ArtifactStore(std::filesystem::path root);

  // Atomic write (tmp + rename); returns the stored path. Throws
  // util::InvalidArgument for an unsafe name, std::runtime_error on I/O failure.
  std::filesystem::path Save(const std::string& filename, std::string_view bytes);

  const std::filesystem::path& root() const {
    return root_;
  }

  static bool IsSafeName(std::string_view filename);

 private:
  std::filesystem::path root_;
};

} // namespace camsync::storage
