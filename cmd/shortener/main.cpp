#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using shortener::factory::Build;
using shortener::runtime::Server;

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
    std::cerr << "Usage: shortener <config.yaml> OR shortener --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = shortener::config::ConfigLoader::LoadFromYaml(config_path);

    shortener::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    SHORTENER_LOG_INFO("Shortener started",
                       {shortener::observability::StringField("bind_address", config.server().bind_address()),
                        shortener::observability::IntField("port", server.SelectedPort()),
                        shortener::observability::StringField("public_base_url", config.server().public_base_url())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    SHORTENER_LOG_INFO("Shutting down shortener");

    server.Stop();
    shortener::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    SHORTENER_LOG_ERROR("Fatal error", {shortener::observability::StringField("error", e.what())});
    shortener::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
