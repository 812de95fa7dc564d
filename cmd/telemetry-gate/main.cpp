#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/config/runtime_options.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using telemetry::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void StopWorkers(telemetry::factory::Application& app) {
  // reverse start order: the notifier drains last
  for (auto it = app.background_workers.rbegin(); it != app.background_workers.rend(); ++it) {
    (*it)->Stop();
  }
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: telemetry-gate <config.yaml> OR telemetry-gate --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config  = telemetry::config::ConfigLoader::LoadFromYaml(config_path);
    auto options = telemetry::config::ResolveOptions(config);

    telemetry::observability::InitializeTracing(config);
    telemetry::observability::InitializeMetrics(config);
    telemetry::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = telemetry::factory::Build(config);

    for (auto& worker : app.background_workers) {
      worker->Start();
    }

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(options.bind_address, std::move(app.grpc_services), options.max_receive_message_bytes);

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    try {
      server.Start();
    } catch (const std::exception&) {
      StopWorkers(app);
      throw;
    }
    TELEMETRY_LOG_INFO("Telemetry gate started", {telemetry::observability::StringField("bind_address", options.bind_address)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    TELEMETRY_LOG_INFO("Shutting down telemetry gate");

    server.Stop();
    StopWorkers(app);

    telemetry::observability::ShutdownLogging();
    telemetry::observability::ShutdownMetrics();
    telemetry::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    TELEMETRY_LOG_ERROR("Fatal error", {telemetry::observability::StringField("error", e.what())});
    telemetry::observability::ShutdownLogging();
    telemetry::observability::ShutdownMetrics();
    telemetry::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
