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

using relations::runtime::Server;

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
  } else if (argc != 1) {
    std::cerr << "Usage: relations-engine [<config.yaml> | --config <config.yaml>]" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path.empty() ? relations::config::ConfigLoader::Defaults()
                                      : relations::config::ConfigLoader::LoadFromYaml(config_path);

    relations::observability::InitializeTracing(config);
    relations::observability::InitializeMetrics(config);
    relations::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = relations::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    RELATIONS_LOG_INFO("Relations engine started",
                       {relations::observability::StringField("bind_address", config.server().bind_address()),
                        relations::observability::StringField("server_name", config.server().server_name())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    RELATIONS_LOG_INFO("Shutting down relations engine");

    server.Stop();
    relations::observability::ShutdownLogging();
    relations::observability::ShutdownMetrics();
    relations::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    RELATIONS_LOG_ERROR("Fatal error", {relations::observability::StringField("error", e.what())});
    relations::observability::ShutdownLogging();
    relations::observability::ShutdownMetrics();
    relations::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
