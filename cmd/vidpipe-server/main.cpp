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

using vidpipe::factory::Build;
using vidpipe::runtime::Server;

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
    std::cerr << "Usage: vidpipe-server <config.yaml> OR vidpipe-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = vidpipe::config::ConfigLoader::LoadFromYaml(config_path);

    vidpipe::observability::InitializeTracing(config);
    vidpipe::observability::InitializeMetrics(config);
    vidpipe::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server and background workers
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services), config.server().max_message_bytes());

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    app.StartBackground();
    VIDPIPE_LOG_INFO("vidpipe started", {vidpipe::observability::StringField("bind_address", config.server().bind_address()),
                                         vidpipe::observability::IntField("workers", config.workers().threads())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    VIDPIPE_LOG_INFO("Shutting down vidpipe");

    server.Stop();
    app.StopBackground();
    vidpipe::observability::ShutdownLogging();
    vidpipe::observability::ShutdownMetrics();
    vidpipe::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    VIDPIPE_LOG_ERROR("Fatal error", {vidpipe::observability::StringField("error", e.what())});
    vidpipe::observability::ShutdownLogging();
    vidpipe::observability::ShutdownMetrics();
    vidpipe::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
