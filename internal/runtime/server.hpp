#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace camsync::runtime {

struct ServerOptions {
  std::string bind_address;
  // 0 keeps the gRPC default (4 MiB)
  std::size_t max_receive_bytes = 0;
};

/*
  Owns the gRPC listener for one process role. Services are handed over at
  construction and registered on Start; port 0 binds an ephemeral port that
  port() reports afterwards.
*/
class Server {
 public:
  Server(ServerOptions options, std::vector<std::unique_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  // throws std::runtime_error when the address cannot be bound
  void Start();
  void Wait();
  void Stop();

  bool running() const {
    return listener_ != nullptr;
  }
  int port() const {
    return bound_port_;
  }

 private:
  ServerOptions                                 options_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server>               listener_;
  int                                           bound_port_ = 0;
};

} // namespace camsync::runtime
