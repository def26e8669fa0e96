#include "node_state_store.hpp"

#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <iterator>
#include <system_error>

#include "config/config.pb.h"

namespace camsync::agent {

using util::ErrorCode;

NodeStateStore::NodeStateStore(std::filesystem::path path) : path_(std::move(path)) {}

util::Result<int> NodeStateStore::LoadNodeId() const {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    return util::Result<int>::Ok(0);
  }

  std::ifstream in(path_);
  if (!in) {
    return util::Result<int>::Err(ErrorCode::IOError, "cannot open " + path_.string());
  }
  const std::string json((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  runtime::config::NodeState state;
  auto parsed = google::protobuf::util::JsonStringToMessage(json, &state, options);
  if (!parsed.ok()) {
    return util::Result<int>::Err(ErrorCode::InvalidResponse, path_.string() + ": " + std::string(parsed.message()));
  }
  if (state.node_id() < 0) {
    return util::Result<int>::Err(ErrorCode::InvalidResponse, path_.string() + ": negative node_id");
  }
  return util::Result<int>::Ok(state.node_id());
}

util::Status NodeStateStore::Save(int node_id, const fleet::Endpoint& master) const {
  runtime::config::NodeState state;
  state.set_node_id(node_id);
  state.set_master_ip(master.ip);
  state.set_master_port(master.port);

  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
  std::string json;
  auto        printed = google::protobuf::util::MessageToJsonString(state, &json, options);
  if (!printed.ok()) {
    return util::Status::Err(ErrorCode::InternalError, std::string(printed.message()));
  }

  std::error_code ec;
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      return util::Status::Err(ErrorCode::IOError, "cannot create " + path_.parent_path().string() + ": " + ec.message());
    }
  }

  const auto tmp_path = std::filesystem::path(path_.string() + ".tmp");
  {
    std::ofstream out(tmp_path, std::ios::trunc);
    out << json << '\n';
    out.flush();
    if (!out) {
      return util::Status::Err(ErrorCode::IOError, "write failed for " + tmp_path.string());
    }
  }
  std::filesystem::rename(tmp_path, path_, ec);
  if (ec) {
    return util::Status::Err(ErrorCode::IOError, "cannot replace " + path_.string() + ": " + ec.message());
  }
  return util::Status::Ok();
}

} // namespace camsync::agent
