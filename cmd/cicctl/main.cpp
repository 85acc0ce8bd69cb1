#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/sources.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

using cic::runtime::config::RuntimeConfig;

namespace sources = cic::model::sources;

static void Usage() {
  std::cout << "Usage:\n"
            << "  cicctl [--config <config.yaml>] collect\n"
            << "  cicctl [--config <config.yaml>] db [stats|prune|path]\n"
            << "  cicctl [--config <config.yaml>] snapshot\n";
}

static std::string FormatAge(double unix_seconds) {
  const auto age = cic::util::SecondsBetween(cic::util::FromUnixSeconds(unix_seconds), cic::util::Now());
  if (age < 60) return std::to_string(static_cast<int64_t>(age)) + "s ago";
  if (age < 3600) return std::to_string(static_cast<int64_t>(age / 60)) + "m ago";
  return std::to_string(static_cast<int64_t>(age / 3600)) + "h ago";
}

static void PrintStats(cic::store::MetricsStore& store) {
  std::cout << std::left << std::setw(18) << "table" << std::setw(10) << "rows"
            << "newest\n";
  for (const auto& stat : store.Stats()) {
    std::cout << std::left << std::setw(18) << stat.table << std::setw(10) << stat.rows << (stat.newest ? FormatAge(*stat.newest) : "-") << "\n";
  }
}

static void PrintTrend(const char* label, const cic::trend::TrendSample& sample) {
  std::cout << "  " << std::left << std::setw(6) << label;
  if (sample.current) {
    std::cout << std::fixed << std::setprecision(1) << *sample.current << "% ";
  } else {
    std::cout << "--    ";
  }
  std::cout << cic::trend::ToString(sample.arrow) << "\n";
}

static void PrintSnapshot(const cic::runtime::Snapshot& snap) {
  std::cout << "Server\n";
  if (const auto* health = snap.Get<cic::model::ServerHealth>(sources::kServerHealth)) {
    std::cout << "  uptime " << health->uptime << ", load " << health->load_avg[0] << " " << health->load_avg[1] << " " << health->load_avg[2] << "\n";
  }
  PrintTrend("cpu", snap.server_trends.cpu);
  PrintTrend("mem", snap.server_trends.mem);
  PrintTrend("disk", snap.server_trends.disk);

  std::cout << "Agents (tokens/hour)\n";
  for (const auto& [agent, rate] : snap.tokens_per_hour) {
    std::cout << "  " << std::left << std::setw(20) << agent << rate;
    auto it = snap.token_trends.find(agent);
    if (it != snap.token_trends.end()) std::cout << " " << cic::trend::ToString(it->second);
    std::cout << "\n";
  }

  if (const auto* intel = snap.Get<cic::model::ThreatIntel>(sources::kGlacialEnrichment)) {
    std::cout << "Attackers\n";
    for (const auto& a : intel->attackers) {
      std::cout << "  " << std::left << std::setw(16) << a.ip << std::setw(6) << a.failed_attempts << std::setw(4) << a.country_code << a.hostname
                << (a.open_ports.empty() ? "" : " [" + a.open_ports + "]") << "\n";
    }
  }

  std::cout << "Errors\n";
  for (const auto& e : snap.errors) {
    std::cout << "  " << e.time << " " << e.type << " " << e.message << "\n";
  }

  std::cout << "Actions\n";
  for (const auto& a : snap.actions) {
    std::cout << "  [" << a.severity << "] " << a.text << "\n";
  }
}

int main(int argc, char** argv) {
  int         next = 1;
  std::string config_path;
  if (argc >= 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
    next        = 3;
  }

  if (next >= argc) {
    Usage();
    return 1;
  }

  const std::string cmd = argv[next];

  try {
    RuntimeConfig config = config_path.empty() ? cic::config::ConfigLoader::Defaults() : cic::config::ConfigLoader::LoadFromYaml(config_path);
    if (config.logging().level().empty()) config.mutable_logging()->set_level("warn");
    cic::observability::InitializeLogging(config);

    // ------------------------------------------------------------

    if (cmd == "db") {
      const std::string sub = next + 1 < argc ? argv[next + 1] : "stats";

      if (sub == "path") {
        std::cout << config.database().path() << "\n";
        return 0;
      }

      auto app = cic::factory::OpenStore(config);

      if (sub == "stats") {
        std::cout << "database: " << config.database().path() << "\n";
        PrintStats(*app.store);
        return 0;
      }

      if (sub == "prune") {
        const auto deleted = app.store->Prune(std::chrono::seconds(config.database().retention_sec()), cic::util::Now());
        std::cout << "pruned " << deleted << " rows\n";
        return 0;
      }

      Usage();
      return 1;
    }

    // ------------------------------------------------------------

    if (cmd == "collect" || cmd == "snapshot") {
      auto app    = cic::factory::Build(config);
      auto report = app.orchestrator->RunCycle(true);

      std::cout << "collected " << report.collected.size() << " probes, " << report.failed.size() << " failed in " << report.duration.count() << " ms\n";
      for (const auto& failure : report.failed) {
        std::cout << "  " << failure.name << ": " << cic::probe::ToString(failure.code) << " " << failure.message << "\n";
      }

      if (cmd == "collect") {
        PrintStats(*app.store);
      } else if (auto snap = app.orchestrator->Snapshot()) {
        PrintSnapshot(*snap);
      }
      return 0;
    }
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 2;
  }

  Usage();
  return 1;
}
