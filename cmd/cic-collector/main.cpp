#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

using cic::observability::IntField;
using cic::observability::StringField;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void Usage() {
  std::cerr << "Usage: cic-collector [--config <config.yaml>] [--interval <seconds>]" << std::endl;
}

int main(int argc, char** argv) {
  std::string config_path;
  uint32_t    interval = 0;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--interval" && i + 1 < argc) {
      try {
        const long value = std::stol(argv[++i]);
        if (value <= 0) throw std::out_of_range("interval");
        interval = static_cast<uint32_t>(value);
      } catch (const std::exception&) {
        std::cerr << "invalid interval: " << argv[i] << std::endl;
        return 1;
      }
    } else {
      Usage();
      return 1;
    }
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path.empty() ? cic::config::ConfigLoader::Defaults() : cic::config::ConfigLoader::LoadFromYaml(config_path);
    if (interval > 0) {
      config.mutable_collector()->set_interval_sec(interval);
      config.mutable_collector()->mutable_tiers()->set_fast_sec(interval);
    }

    cic::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = cic::factory::Build(config);

    // history stays as-is when the sweep fails; collection still starts
    cic::factory::PruneHistory(app, config);

    // Register signal handlers before starting the worker to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.orchestrator->Start();
    CIC_LOG_INFO("CIC collector started",
                 {StringField("database", config.database().path()), IntField("interval_sec", config.collector().interval_sec())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    CIC_LOG_INFO("Shutting down collector");

    app.orchestrator->Stop();
    cic::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    CIC_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    cic::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
