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

using workgraph::runtime::Server;

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
    std::cerr << "Usage: workgraph-server <config.yaml> OR workgraph-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = workgraph::config::ConfigLoader::LoadFromYaml(config_path);

    workgraph::observability::InitializeTracing(config);
    workgraph::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = workgraph::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), workgraph::runtime::BuildGrpcServices(app));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    WORKGRAPH_LOG_INFO("workgraph started", {workgraph::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    WORKGRAPH_LOG_INFO("Shutting down workgraph");

    server.Stop();
    workgraph::observability::ShutdownLogging();
    workgraph::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    WORKGRAPH_LOG_ERROR("Fatal error", {workgraph::observability::StringField("error", e.what())});
    workgraph::observability::ShutdownLogging();
    workgraph::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
