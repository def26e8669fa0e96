#include "server.hpp"

#include <climits>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace camsync::runtime {

using camsync::observability::IntField;
using camsync::observability::StringField;

Server::Server(ServerOptions options, std::vector<std::unique_ptr<::grpc::Service>> services)
    : options_(std::move(options)), services_(std::move(services)) {}

Server::~Server() {
  Stop();
}

void Server::Start() {
  if (listener_) return;

  ::grpc::ServerBuilder builder;
  builder.AddListeningPort(options_.bind_address, ::grpc::InsecureServerCredentials(), &bound_port_);
  if (options_.max_receive_bytes > 0) {
    const auto limit = options_.max_receive_bytes > static_cast<std::size_t>(INT_MAX) ? INT_MAX : static_cast<int>(options_.max_receive_bytes);
    builder.SetMaxReceiveMessageSize(limit);
  }
  for (auto& service : services_) builder.RegisterService(service.get());

  listener_ = builder.BuildAndStart();
  if (!listener_ || bound_port_ == 0) {
    listener_.reset();
    bound_port_ = 0;
    throw std::runtime_error("cannot listen on " + options_.bind_address);
  }

  CAMSYNC_LOG_INFO("listening", {StringField("bind_address", options_.bind_address), IntField("port", bound_port_),
                                 IntField("services", static_cast<int64_t>(services_.size()))});
}

void Server::Wait() {
  if (listener_) listener_->Wait();
}

void Server::Stop() {
  if (!listener_) return;
  listener_->Shutdown();
  listener_.reset();
  CAMSYNC_LOG_INFO("listener stopped", {StringField("bind_address", options_.bind_address)});
}

} // namespace camsync::runtime
