#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/worker/ingest_worker_pool.hpp"
#include "internal/worker/retention_loop.hpp"

using modstore::factory::BuildRuntime;
using modstore::worker::IngestWorkerPool;
using modstore::worker::RetentionLoop;

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
    std::cerr << "Usage: modstore-worker <config.yaml> OR modstore-worker --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = modstore::config::ConfigLoader::LoadFromYaml(config_path);

    modstore::observability::InitializeTracing(config);
    modstore::observability::InitializeMetrics(config);
    modstore::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build runtime (dependency graph)
    // ------------------------------------------------------------
    auto rt = BuildRuntime(config);
    if (!rt.source) {
      throw std::runtime_error("source.directory is required");
    }

    modstore::worker::WorkerPoolOptions pool_options;
    if (config.workers().threads() > 0) pool_options.threads = config.workers().threads();
    if (config.workers().batch_size() > 0) pool_options.batch_size = config.workers().batch_size();
    if (config.workers().poll_interval_ms() > 0) {
      pool_options.poll_interval = std::chrono::milliseconds(config.workers().poll_interval_ms());
    }

    IngestWorkerPool pool(rt.queue, rt.coordinator, rt.source, pool_options);

    std::unique_ptr<RetentionLoop> retention;
    if (config.retention().enabled()) {
      const auto& r     = config.retention();
      const auto  limit = r.batch_limit() > 0 ? r.batch_limit() : 100;
      const auto  every = std::chrono::seconds(r.interval_sec() > 0 ? r.interval_sec() : 3600);
      retention         = std::make_unique<RetentionLoop>(rt.sweeper, limit, every);
    }

    // Register signal handlers before starting workers to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    pool.Start();
    if (retention) retention->Start();
    MODSTORE_LOG_INFO("modstore worker started",
                      {modstore::observability::StringField("app_version", config.ingest().app_version()),
                       modstore::observability::BoolField("retention", retention != nullptr)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    MODSTORE_LOG_INFO("Shutting down modstore worker");

    if (retention) retention->Stop();
    pool.Stop();
    modstore::observability::ShutdownLogging();
    modstore::observability::ShutdownMetrics();
    modstore::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    MODSTORE_LOG_ERROR("Fatal error", {modstore::observability::ErrorField(e.what())});
    modstore::observability::ShutdownLogging();
    modstore::observability::ShutdownMetrics();
    modstore::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
