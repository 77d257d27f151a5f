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

using cirrus::runtime::Server;

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
    std::cerr << "Usage: cirrus-reader <config.yaml> OR cirrus-reader --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = cirrus::config::ConfigLoader::LoadFromYaml(config_path);

    cirrus::observability::InitializeTracing(config);
    cirrus::observability::InitializeMetrics(config);
    cirrus::observability::InitializeLogging(config, "cirrus-reader");

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = cirrus::factory::Build(config, cirrus::http::ServiceRole::Reader);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    cirrus::runtime::ServerOptions options;
    options.bind_address   = config.server().bind_address();
    options.worker_threads = config.server().worker_threads();
    options.max_body_bytes = config.limits().max_body_bytes();
    Server server(options, app.gateway);

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    CIRRUS_LOG_INFO("web-reader-start", {cirrus::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    CIRRUS_LOG_INFO("Shutting down web reader");

    server.Stop();
    cirrus::observability::ShutdownLogging();
    cirrus::observability::ShutdownMetrics();
    cirrus::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    CIRRUS_LOG_ERROR("Fatal error", {cirrus::observability::StringField("error", e.what())});
    cirrus::observability::ShutdownLogging();
    cirrus::observability::ShutdownMetrics();
    cirrus::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
