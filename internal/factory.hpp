#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/broker/memory_broker.hpp"
#include "internal/observability/logging.hpp"
#include "internal/transport/transport.hpp"

namespace rfshared::factory {

/*
  BrokerApp

  Everything rf-broker serves. Lives for the lifetime of the process.
*/
struct BrokerApp {
  std::shared_ptr<broker::MemoryBroker>       broker;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Composition roots. These are the only places that know concrete
  transport and broker types.
*/

// Broker with every configured stream created.
std::shared_ptr<broker::MemoryBroker> BuildBroker(const rfshared::runtime::config::BrokerConfig& config, observability::LoggerPtr logger);

BrokerApp Build(const rfshared::runtime::config::RuntimeConfig& config, observability::LoggerPtr logger);

/*
  Transport named by `connection.transport` ("grpc" when empty). The memory
  transport attaches to `broker`, or to a broker built from `broker_config`
  when none is given.
*/
transport::TransportPtr MakeTransport(const rfshared::runtime::config::ConnectionConfig& connection,
                                      const rfshared::runtime::config::BrokerConfig&     broker_config,
                                      observability::LoggerPtr                           logger,
                                      std::shared_ptr<broker::MemoryBroker>              broker = nullptr);

} // namespace rfshared::factory
