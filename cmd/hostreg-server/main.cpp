#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/registry_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using hostreg::runtime::Server;

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
    std::cerr << "Usage: hostreg-server <config.yaml> OR hostreg-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = hostreg::config::ConfigLoader::LoadFromYaml(config_path);

    hostreg::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = hostreg::factory::Build(config);

    std::vector<std::unique_ptr<::grpc::Service>> services;
    services.push_back(std::make_unique<hostreg::grpc::RegistryServer>(app.registry_service));

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    HOSTREG_LOG_INFO("hostreg started", {hostreg::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    HOSTREG_LOG_INFO("Shutting down hostreg");

    server.Stop();
    hostreg::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    HOSTREG_LOG_ERROR("Fatal error", {hostreg::observability::StringField("error", e.what())});
    hostreg::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
