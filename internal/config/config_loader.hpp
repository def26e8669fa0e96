#pragma once

#include <string>

#include "config/config.pb.h"

namespace camsync::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unset or zero fields are
  filled with the deployment defaults afterwards.
*/
class ConfigLoader {
 public:
  static camsync::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(camsync::runtime::config::RuntimeConfig* config);
};

} // namespace camsync::config
