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

using reel::runtime::Server;

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
    std::cerr << "Usage: reel-orchestrator <config.yaml> OR reel-orchestrator --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = reel::config::ConfigLoader::LoadFromYaml(config_path);

    reel::observability::InitializeTracing(config);
    reel::observability::InitializeMetrics(config);
    reel::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = reel::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services),
                  static_cast<int>(config.server().max_message_bytes()));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    REEL_LOG_INFO("Reel orchestrator started", {reel::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    REEL_LOG_INFO("Shutting down reel orchestrator");

    server.Stop();
    app.Shutdown();
    reel::observability::ShutdownLogging();
    reel::observability::ShutdownMetrics();
    reel::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    REEL_LOG_ERROR("Fatal error", {reel::observability::StringField("error", e.what())});
    reel::observability::ShutdownLogging();
    reel::observability::ShutdownMetrics();
    reel::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
