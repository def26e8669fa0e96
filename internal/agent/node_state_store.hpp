#pragma once

#include <filesystem>

#include "internal/fleet/device.hpp"
#include "internal/util/result.hpp"

namespace camsync::agent {

/*
  Keeps the id a master assigned to this node, so that a restart announces
  itself with node_online under the same id instead of registering anew.
  Stored as JSON of runtime.config.NodeState.
*/
class NodeStateStore {
 public:
  explicit NodeStateStore(std::filesystem::path path);

  // 0 when no state file exists yet
  util::Result<int> LoadNodeId() const;

  util::Status Save(int node_id, const fleet::Endpoint& master) const;

  const std::filesystem::path& path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;
};

} // namespace camsync::agent
