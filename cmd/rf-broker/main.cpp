#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using rfshared::observability::IntField;
using rfshared::observability::StringField;
using rfshared::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: rf-broker <config.yaml> OR rf-broker --config <config.yaml>" << std::endl;
    return 1;
  }

  auto logger = rfshared::observability::MakeLogger("rf-broker");

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = rfshared::config::ConfigLoader::LoadFromYaml(config_path);
    logger      = rfshared::observability::MakeLogger("rf-broker", config.logging());

    // ------------------------------------------------------------
    // Build broker + gRPC adapter
    // ------------------------------------------------------------
    auto app = rfshared::factory::Build(config, logger);

    auto bind_address = config.broker().bind_address();
    if (bind_address.empty()) bind_address = "0.0.0.0:4222";

    Server server(bind_address, std::move(app.grpc_services), logger);

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    logger->Info("rf-broker started", {StringField("bind_address", bind_address),
                                       IntField("streams", config.broker().streams_size())});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    logger->Info("Shutting down rf-broker");
    server.Stop();
  } catch (const std::exception& e) {
    logger->Critical("Fatal error", {StringField("error", e.what())});
    return 2;
  }

  return 0;
}
