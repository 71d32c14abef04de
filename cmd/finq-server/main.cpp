#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/application.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using finq::runtime::Server;

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
    std::cerr << "Usage: finq-server <config.yaml> OR finq-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = finq::config::ConfigLoader::LoadFromYaml(config_path);

    finq::observability::InitializeTracing(config);
    finq::observability::InitializeMetrics(config);
    finq::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = finq::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    FINQ_LOG_INFO("finq started", {finq::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    FINQ_LOG_INFO("Shutting down finq");

    server.Stop();
    app.runtime.sweeper->Stop();
    app.runtime.queue->Shutdown();

    finq::observability::ShutdownLogging();
    finq::observability::ShutdownMetrics();
    finq::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    FINQ_LOG_ERROR("Fatal error", {finq::observability::StringField("error", e.what())});
    finq::observability::ShutdownLogging();
    finq::observability::ShutdownMetrics();
    finq::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
