#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using satp::runtime::Server;

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
    std::cerr << "Usage: satp-gateway <config.yaml> OR satp-gateway --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = satp::config::ConfigLoader::LoadFromYaml(config_path);

    satp::observability::InitializeTracing(config);
    satp::observability::InitializeMetrics(config);
    satp::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = satp::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    SATP_LOG_INFO("SATP gateway started", {satp::observability::StringField("gateway_id", config.gateway().id()),
                                           satp::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    SATP_LOG_INFO("Shutting down SATP gateway");

    server.Stop();
    app.manager->Shutdown();
    satp::observability::ShutdownLogging();
    satp::observability::ShutdownMetrics();
    satp::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    SATP_LOG_ERROR("Fatal error", {satp::observability::StringField("error", e.what())});
    satp::observability::ShutdownLogging();
    satp::observability::ShutdownMetrics();
    satp::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
