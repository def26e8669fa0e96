#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace camsync::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("8080" for a string field must not become a number)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

void ConfigLoader::ApplyDefaults(camsync::runtime::config::RuntimeConfig* config) {
  auto* server = config->mutable_server();
  if (server->max_receive_message_mb() == 0) server->set_max_receive_message_mb(64);

  auto* logging = config->mutable_logging();
  if (logging->level().empty()) logging->set_level("info");
  if (logging->max_file_size_mb() == 0) logging->set_max_file_size_mb(10);
  if (logging->max_files() == 0) logging->set_max_files(3);

  auto* observability = config->mutable_observability();
  if (observability->trace_sample_ratio() <= 0 || observability->trace_sample_ratio() > 1) observability->set_trace_sample_ratio(1.0);

  auto* clock = config->mutable_clock();
  if (clock->ntp_servers_size() == 0) {
    for (const char* server : {"pool.ntp.org", "time.nist.gov", "time.google.com", "cn.pool.ntp.org"}) {
      clock->add_ntp_servers(server);
    }
  }
  if (clock->sync_interval_sec() == 0) clock->set_sync_interval_sec(300);
  if (clock->max_age_sec() == 0) clock->set_max_age_sec(300);
  if (clock->query_timeout_ms() == 0) clock->set_query_timeout_ms(5000);

  auto* registry = config->mutable_registry();
  if (registry->advertised_port() == 0) registry->set_advertised_port(8080);
  if (registry->discovery_port() == 0) registry->set_discovery_port(8085);
  if (registry->heartbeat_timeout_sec() == 0) registry->set_heartbeat_timeout_sec(30);
  if (registry->monitor_interval_sec() == 0) registry->set_monitor_interval_sec(10);
  if (registry->probe_timeout_ms() == 0) registry->set_probe_timeout_ms(5000);
  if (registry->command_timeout_ms() == 0) registry->set_command_timeout_ms(10000);
  if (registry->image_storage_path().empty()) registry->set_image_storage_path("/opt/camera_images");
  if (registry->default_delay_seconds() <= 0) registry->set_default_delay_seconds(0.5);

  auto* node = config->mutable_node();
  if (node->master_port() == 0) node->set_master_port(8080);
  if (node->node_port() == 0) node->set_node_port(8084);
  if (node->discovery_port() == 0) node->set_discovery_port(8085);
  if (node->discovery_timeout_ms() == 0) node->set_discovery_timeout_ms(5000);
  if (node->broadcast_addresses_size() == 0) {
    for (const char* address : {"192.168.1.255", "192.168.0.255", "10.0.0.255", "172.16.255.255"}) {
      node->add_broadcast_addresses(address);
    }
  }
  if (node->heartbeat_interval_sec() == 0) node->set_heartbeat_interval_sec(10);
  if (node->heartbeat_backoff_sec() == 0) node->set_heartbeat_backoff_sec(5);
  if (node->image_storage_path().empty()) node->set_image_storage_path("/tmp/camera_images");
  if (node->state_file().empty()) node->set_state_file(node->image_storage_path() + "/node_state.json");
  if (node->upload_timeout_ms() == 0) node->set_upload_timeout_ms(30000);
  if (node->heartbeat_timeout_ms() == 0) node->set_heartbeat_timeout_ms(5000);
  if (node->register_timeout_ms() == 0) node->set_register_timeout_ms(10000);
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

camsync::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  camsync::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(&config);
  return config;
}

} // namespace camsync::config
