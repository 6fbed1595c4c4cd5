#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

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
    std::cerr << "Usage: trust-memory <config.yaml> OR trust-memory --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = trustmem::config::ConfigLoader::LoadFromYaml(config_path);

    trustmem::observability::InitializeLogging(config);
    trustmem::observability::InitializeMetrics(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = trustmem::factory::Build(config);

    // Register signal handlers before starting background work.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.bank->Start();
    app.scheduler->Start();

    const auto stats = app.bank->Stats();
    TRUSTMEM_LOG_INFO("trust memory started", {trustmem::observability::IntField("live", static_cast<int64_t>(stats.live_artifacts())),
                                               trustmem::observability::IntField("archived", static_cast<int64_t>(stats.archived_artifacts())),
                                               trustmem::observability::IntField("policies", static_cast<int64_t>(app.policies.size()))});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    TRUSTMEM_LOG_INFO("shutting down trust memory");

    app.scheduler->Stop();
    app.bank->Stop();
    trustmem::observability::ShutdownMetrics();
    trustmem::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    TRUSTMEM_LOG_ERROR("fatal error", {trustmem::observability::StringField("error", e.what())});
    trustmem::observability::ShutdownMetrics();
    trustmem::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
