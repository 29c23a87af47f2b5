#include "server.hpp"

#include <chrono>
#include <stdexcept>

namespace rfshared::runtime {

using observability::IntField;
using observability::StringField;

Server::Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services, observability::LoggerPtr logger)
    : bind_address_(std::move(bind_address)), services_(std::move(services)), logger_(std::move(logger)) {
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  ::grpc::ServerBuilder builder;

  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials(), &selected_port_);

  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();

  if (!grpc_server_) {
    throw std::runtime_error("Failed to start gRPC server on " + bind_address_);
  }

  logger_->Info("rf-broker listening", {StringField("bind_address", bind_address_), IntField("port", selected_port_)});
}

void Server::Wait() {
  if (grpc_server_) grpc_server_->Wait();
}

void Server::Stop() {
  if (grpc_server_) {
    // push streams poll for cancellation, so give them a moment to drain
    grpc_server_->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(1));
    grpc_server_.reset();
  }
}

} // namespace rfshared::runtime
