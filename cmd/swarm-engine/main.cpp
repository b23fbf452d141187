#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/coordinator_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/runtime/server.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using swarm::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

namespace {

// retention runs once a minute
constexpr auto kRetentionInterval = std::chrono::seconds(60);

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: swarm-engine <config.yaml> OR swarm-engine --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = swarm::config::ConfigLoader::LoadFromYaml(config_path);

    swarm::observability::InitializeLogging(config);
    swarm::observability::InitializeMetrics(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = swarm::factory::Build(config);

    std::vector<std::unique_ptr<grpc::Service>> services;
    services.push_back(std::make_unique<swarm::grpc::CoordinatorServer>(app.coordinator));

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    SWARM_LOG_INFO("swarm engine started", {swarm::observability::StringField("bind_address", config.server().bind_address())});

    auto next_retention = std::chrono::steady_clock::now() + kRetentionInterval;
    while (g_running) {
      std::this_thread::sleep_for(std::chrono::seconds(1));
      if (std::chrono::steady_clock::now() >= next_retention) {
        try {
          app.coordinator->RunRetention(swarm::util::NowMillis());
        } catch (const swarm::util::StoreError& e) {
          SWARM_LOG_ERROR("retention failed", {swarm::observability::StringField("error", e.what())});
        }
        next_retention = std::chrono::steady_clock::now() + kRetentionInterval;
      }
    }

    SWARM_LOG_INFO("shutting down swarm engine");

    server.Stop();
    app.coordinator->CloseAll();
    swarm::observability::ShutdownMetrics();
    swarm::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    SWARM_LOG_ERROR("fatal error", {swarm::observability::StringField("error", e.what())});
    swarm::observability::ShutdownMetrics();
    swarm::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
