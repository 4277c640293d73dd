#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using mintgate::factory::Build;
using mintgate::runtime::Server;

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
    std::cerr << "Usage: mintgate <config.yaml> OR mintgate --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = mintgate::config::ConfigLoader::LoadFromYaml(config_path);

    mintgate::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), config.server().worker_threads(), std::move(app.endpoints));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    MINTGATE_LOG_INFO("mintgate started", {mintgate::observability::StringField("bind_address", config.server().bind_address()),
                                           mintgate::observability::IntField("port", server.Port()),
                                           mintgate::observability::StringField("path", config.server().payment_path())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    MINTGATE_LOG_INFO("Shutting down mintgate");

    server.Stop();
    mintgate::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    MINTGATE_LOG_ERROR("Fatal error", {mintgate::observability::StringField("error", e.what())});
    mintgate::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
