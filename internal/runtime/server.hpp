#pragma once

#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

#include "internal/observability/logging.hpp"

namespace rfshared::runtime {

class Server {
 public:
  Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services, observability::LoggerPtr logger);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();
  void Stop();

  // Actual port after Start(); differs from the bind address when it asked for port 0.
  int port() const {
    return selected_port_;
  }

 private:
  std::string                                 bind_address_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  observability::LoggerPtr                    logger_;
  std::unique_ptr<::grpc::Server>               grpc_server_;
  int                                         selected_port_ = 0;
};

} // namespace rfshared::runtime
