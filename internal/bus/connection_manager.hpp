#pragma once

#include <memory>
#include <mutex>

#include "internal/transport/transport.hpp"

namespace rfshared::bus {

/*
  Lifecycle of one broker connection.

    Disconnected --Connect--> Connected --Close--> Closed

  Closed is terminal. A failed Connect leaves the manager Disconnected so
  the caller may retry. Owned by exactly one Consumer or Producer.
*/
class ConnectionManager {
 public:
  enum class State { kDisconnected, kConnected, kClosed };

  explicit ConnectionManager(transport::TransportPtr transport);
  ~ConnectionManager();

  ConnectionManager(const ConnectionManager&)            = delete;
  ConnectionManager& operator=(const ConnectionManager&) = delete;

  /*
    Transport failures propagate unchanged. Throws util::ConnectionStateError
    when already connected or closed. With `jetstream` the persistent-stream
    context is acquired right away instead of on first use.
  */
  void Connect(const transport::ConnectOptions& options, bool jetstream = false);

  // Idempotent; a never-connected manager stays Disconnected.
  void Close();

  State state() const;
  bool  IsConnected() const;

  // Throws util::ConnectionStateError unless connected.
  transport::Connection& connection();

  // Cached after the first call. Throws util::ConnectionStateError unless connected.
  std::shared_ptr<transport::StreamContext> JetStream();

 private:
  void RequireConnected(const char* op) const;

  transport::TransportPtr transport_;

  mutable std::mutex                        mutex_;
  State                                     state_ = State::kDisconnected;
  std::unique_ptr<transport::Connection>    connection_;
  std::shared_ptr<transport::StreamContext> jetstream_;
};

const char* ToString(ConnectionManager::State state);

} // namespace rfshared::bus
