#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/probe/probe_registry.hpp"
#include "internal/util/errors.hpp"

namespace {

using cic::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "cic_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestDefaultsFillEveryZeroField() {
  setenv("HOME", "/home/tester", 1);

  auto config = ConfigLoader::Defaults();
  assert(config.collector().interval_sec() == 30);
  assert(config.collector().tiers().fast_sec() == 30);
  assert(config.collector().tiers().medium_sec() == 120);
  assert(config.collector().tiers().slow_sec() == 300);
  assert(config.collector().tiers().glacial_sec() == 900);
  assert(config.collector().probe_timeout_ms() == 10000);
  assert(config.collector().security_probe_timeout_ms() == 15000);

  assert(config.database().path() == "/home/tester/.cic/metrics.db");
  assert(config.database().retention_sec() == 30ull * 24 * 3600);

  assert(config.enrichment().max_targets() == 5);
  assert(config.enrichment().dns_ttl_sec() == 24 * 3600);
  assert(config.enrichment().geo_ttl_sec() == 7 * 24 * 3600);
  assert(config.enrichment().scan_ttl_sec() == 6 * 3600);
  assert(config.enrichment().geo_min_interval_ms() == 1000);
  assert(config.enrichment().geo_endpoint() == "http://ip-api.com/json/");

  assert(config.agent_service().cli() == "openclaw");
  assert(config.agent_service().auth_log_path() == "/var/log/auth.log");
  assert(config.logging().file().empty());
}

void TestYamlOverridesAndPartialSections() {
  const auto yaml_path = WriteYaml("overrides",
                                   R"(collector:
  interval_sec: 10
  tiers:
    slow_sec: 600
database:
  path: "/var/lib/cic/metrics.db"
enrichment:
  max_targets: 3
agent_service:
  cli: "/opt/openclaw/bin/openclaw"
logging:
  level: debug
  file: "~/.cic/collector.log"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.collector().interval_sec() == 10);
  assert(config.collector().tiers().slow_sec() == 600);
  assert(config.collector().tiers().fast_sec() == 30);
  assert(config.database().path() == "/var/lib/cic/metrics.db");
  assert(config.enrichment().max_targets() == 3);
  assert(config.enrichment().dns_ttl_sec() == 24 * 3600);
  assert(config.agent_service().cli() == "/opt/openclaw/bin/openclaw");
  assert(config.logging().level() == "debug");
  assert(config.logging().file() == "/home/tester/.cic/collector.log");

  assert(cic::probe::TierTtl(config.collector(), cic::model::Tier::kSlow) == std::chrono::seconds(600));
  assert(cic::probe::TierTtl(config.collector(), cic::model::Tier::kMedium) == std::chrono::seconds(120));
}

void TestEmptyFileMeansDefaults() {
  const auto yaml_path = WriteYaml("empty", "");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.collector().interval_sec() == 30);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  path: "C:\\cic\\\"quoted\"\\metrics.db"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().path() == "C:\\cic\\\"quoted\"\\metrics.db");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(collector:
  interval_sec: 30
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const cic::util::ConfigError&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsConfigError() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/cic/config.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestHomeExpansion() {
  setenv("HOME", "/home/tester", 1);
  assert(ConfigLoader::ExpandHome("~/.cic/metrics.db") == "/home/tester/.cic/metrics.db");
  assert(ConfigLoader::ExpandHome("~other/x") == "~other/x");
  assert(ConfigLoader::ExpandHome("/abs/path") == "/abs/path");
}

} // namespace

int main() {
  TestDefaultsFillEveryZeroField();
  TestYamlOverridesAndPartialSections();
  TestEmptyFileMeansDefaults();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsConfigError();
  TestHomeExpansion();

  std::cout << "cic_unit_config_loader: pass\n";
  return 0;
}
