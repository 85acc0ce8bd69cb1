#include "internal/factory.hpp"

#include <sqlite3.h>

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace std::chrono_literals;

cic::runtime::config::RuntimeConfig ConfigFor(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "cic_factory_tests";
  std::filesystem::create_directories(dir);
  setenv("HOME", dir.c_str(), 1);

  const auto path = dir / (test_name + ".db");
  for (const char* suffix : {"", "-wal", "-shm"}) std::filesystem::remove(path.string() + suffix);

  auto config = cic::config::ConfigLoader::Defaults();
  config.mutable_database()->set_path(path.string());
  return config;
}

void TestPruneWhileAnotherWriterHoldsTheLock() {
  const auto config = ConfigFor("locked_prune");
  auto       app    = cic::factory::OpenStore(config);

  sqlite3* other = nullptr;
  assert(sqlite3_open(config.database().path().c_str(), &other) == SQLITE_OK);
  assert(sqlite3_exec(other, "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr) == SQLITE_OK);

  // waits out the busy timeout, then reports failure instead of throwing
  const auto pruned = cic::factory::PruneHistory(app, config);
  assert(!pruned);

  assert(sqlite3_exec(other, "COMMIT;", nullptr, nullptr, nullptr) == SQLITE_OK);
  sqlite3_close(other);

  cic::model::ServerHealth health;
  health.cpu_percent = 12.5;
  app.store->RecordServer(health, cic::util::Now() - 40 * 24h);
  app.store->RecordServer(health, cic::util::Now());

  const auto retried = cic::factory::PruneHistory(app, config);
  assert(retried && *retried == 1);
}

void TestOpenStoreCreatesTheDatabaseDirectory() {
  auto       config = ConfigFor("nested_dir");
  const auto nested = std::filesystem::temp_directory_path() / "cic_factory_tests" / "nested" / "deeper";
  std::filesystem::remove_all(nested.parent_path());
  config.mutable_database()->set_path((nested / "metrics.db").string());

  auto app = cic::factory::OpenStore(config);
  assert(std::filesystem::exists(nested / "metrics.db"));

  const auto pruned = cic::factory::PruneHistory(app, config);
  assert(pruned && *pruned == 0);
}

} // namespace

int main() {
  TestPruneWhileAnotherWriterHoldsTheLock();
  TestOpenStoreCreatesTheDatabaseDirectory();

  std::cout << "cic_unit_factory: pass\n";
  return 0;
}
