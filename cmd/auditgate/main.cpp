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

using auditgate::factory::Build;
using auditgate::runtime::Server;

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
    std::cerr << "Usage: auditgate <config.yaml> OR auditgate --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = auditgate::config::ConfigLoader::LoadFromYaml(config_path);

    auditgate::observability::InitializeTracing(config);
    auditgate::observability::InitializeMetrics(config);
    auditgate::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), auditgate::runtime::BuildGrpcServices(app));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    AUDITGATE_LOG_INFO("auditgate started", {auditgate::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    AUDITGATE_LOG_INFO("Shutting down auditgate");

    server.Stop();
    app.recorder->Stop();
    auditgate::observability::ShutdownLogging();
    auditgate::observability::ShutdownMetrics();
    auditgate::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    AUDITGATE_LOG_ERROR("Fatal error", {auditgate::observability::StringField("error", e.what())});
    auditgate::observability::ShutdownLogging();
    auditgate::observability::ShutdownMetrics();
    auditgate::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
