#pragma once

#include <memory>
#include <string>

#include "internal/broker/memory_broker.hpp"
#include "internal/transport/transport.hpp"

namespace rfshared::transport {

/*
  Transport over an in-process MemoryBroker.

  Server URLs use the "memory" scheme ("memory://local", or
  "memory://token@local" to carry credentials). Every connection shares the
  broker; closing a connection cancels its push subscriptions and turns its
  pull subscriptions into errors.
*/
class MemoryTransport final : public Transport {
 public:
  explicit MemoryTransport(std::shared_ptr<broker::MemoryBroker> broker);

  std::unique_ptr<Connection> Connect(const ConnectOptions& options) override;

  std::string Name() const override {
    return "memory";
  }

  const std::shared_ptr<broker::MemoryBroker>& broker() const {
    return broker_;
  }

 private:
  std::shared_ptr<broker::MemoryBroker> broker_;
};

} // namespace rfshared::transport
