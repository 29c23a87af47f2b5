#include "factory.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

#include "internal/grpc/bus_server.hpp"
#include "internal/service/bus_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/transport/grpc/grpc_transport.hpp"
#include "internal/transport/memory/memory_transport.hpp"

namespace rfshared::factory {

using namespace rfshared::runtime::config;

std::shared_ptr<broker::MemoryBroker> BuildBroker(const BrokerConfig& config, observability::LoggerPtr logger) {
  broker::BrokerOptions options;
  options.user     = config.auth().user();
  options.password = config.auth().password();
  options.token    = config.auth().token();
  if (config.ack_wait_ms() > 0) {
    options.ack_wait = std::chrono::milliseconds(config.ack_wait_ms());
  }

  auto broker = std::make_shared<broker::MemoryBroker>(options, std::move(logger));

  for (const auto& stream : config.streams()) {
    broker::StreamOptions stream_options;
    stream_options.name = stream.name();
    stream_options.subjects.assign(stream.subjects().begin(), stream.subjects().end());
    stream_options.max_msgs = stream.max_msgs();
    broker->AddStream(stream_options);
  }

  return broker;
}

BrokerApp Build(const RuntimeConfig& config, observability::LoggerPtr logger) {
  BrokerApp app;
  app.broker = BuildBroker(config.broker(), logger);

  service::ServiceContext ctx;
  ctx.broker = app.broker;
  ctx.logger = logger;

  auto bus_service = std::make_shared<service::BusService>(ctx);
  app.grpc_services.push_back(std::make_unique<rfshared::grpc::BusServer>(bus_service));

  return app;
}

transport::TransportPtr MakeTransport(const ConnectionConfig& connection, const BrokerConfig& broker_config,
                                      observability::LoggerPtr logger, std::shared_ptr<broker::MemoryBroker> broker) {
  const auto& name = connection.transport();

  if (name.empty() || name == "grpc") {
    return std::make_shared<transport::GrpcTransport>(std::move(logger));
  }

  if (name == "memory") {
    if (!broker) {
      broker = BuildBroker(broker_config, logger);
    }
    return std::make_shared<transport::MemoryTransport>(std::move(broker));
  }

  throw std::runtime_error("Unsupported transport: " + name);
}

} // namespace rfshared::factory
