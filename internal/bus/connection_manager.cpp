#include "connection_manager.hpp"

#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace rfshared::bus {

const char* ToString(ConnectionManager::State state) {
  switch (state) {
    case ConnectionManager::State::kDisconnected:
      return "disconnected";
    case ConnectionManager::State::kConnected:
      return "connected";
    case ConnectionManager::State::kClosed:
      return "closed";
  }
  return "unknown";
}

ConnectionManager::ConnectionManager(transport::TransportPtr transport) : transport_(std::move(transport)) {
  if (!transport_) {
    throw std::invalid_argument("connection manager: transport is required");
  }
}

ConnectionManager::~ConnectionManager() {
  Close();
}

void ConnectionManager::Connect(const transport::ConnectOptions& options, bool jetstream) {
  std::lock_guard lock(mutex_);

  if (state_ != State::kDisconnected) {
    throw util::ConnectionStateError(std::string("connect: connection is ") + ToString(state_));
  }

  auto connection = transport_->Connect(options);

  std::shared_ptr<transport::StreamContext> context;
  if (jetstream) {
    context = connection->JetStream();
  }

  connection_ = std::move(connection);
  jetstream_  = std::move(context);
  state_      = State::kConnected;
}

void ConnectionManager::Close() {
  std::unique_ptr<transport::Connection> connection;
  {
    std::lock_guard lock(mutex_);
    if (state_ != State::kConnected) return;

    state_ = State::kClosed;
    jetstream_.reset();
    connection = std::move(connection_);
  }

  connection->Close();
}

ConnectionManager::State ConnectionManager::state() const {
  std::lock_guard lock(mutex_);
  return state_;
}

bool ConnectionManager::IsConnected() const {
  std::lock_guard lock(mutex_);
  return state_ == State::kConnected && connection_->IsConnected();
}

void ConnectionManager::RequireConnected(const char* op) const {
  if (state_ != State::kConnected) {
    throw util::ConnectionStateError(std::string(op) + ": not connected (connection is " + ToString(state_) + "); call Connect() first");
  }
}

transport::Connection& ConnectionManager::connection() {
  std::lock_guard lock(mutex_);
  RequireConnected("connection");
  return *connection_;
}

std::shared_ptr<transport::StreamContext> ConnectionManager::JetStream() {
  std::lock_guard lock(mutex_);
  RequireConnected("stream context");

  if (!jetstream_) {
    jetstream_ = connection_->JetStream();
  }
  return jetstream_;
}

} // namespace rfshared::bus
