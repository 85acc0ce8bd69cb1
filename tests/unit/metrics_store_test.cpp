#include "internal/store/metrics_store.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_metrics_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"

namespace {

using namespace std::chrono_literals;

using cic::db::sqlite::SqliteDB;
using cic::db::sqlite::SqliteMetricsRepository;
using cic::store::MetricsStore;

struct Fixture {
  std::shared_ptr<SqliteDB>                db;
  std::shared_ptr<SqliteMetricsRepository> repo;
  std::shared_ptr<MetricsStore>            store;
};

Fixture Open(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "cic_metrics_store_tests";
  std::filesystem::create_directories(dir);

  const auto path = dir / (test_name + ".db");
  for (const char* suffix : {"", "-wal", "-shm"}) std::filesystem::remove(path.string() + suffix);

  Fixture f;
  f.db = std::make_shared<SqliteDB>(path.string());
  cic::db::sqlite::BootstrapSchema(*f.db);
  f.repo  = std::make_shared<SqliteMetricsRepository>(f.db);
  f.store = std::make_shared<MetricsStore>(f.repo);
  f.store->Initialize(cic::db::sqlite::kSchemaVersion);
  return f;
}

int64_t Rows(MetricsStore& store, const std::string& table) {
  for (const auto& stat : store.Stats()) {
    if (stat.table == table) return stat.rows;
  }
  assert(false && "unknown table");
  return -1;
}

void TestSchemaVersionSeededOnceAndMismatchTolerated() {
  auto f = Open("schema_version");

  {
    auto tx = f.repo->BeginRead();
    assert(f.repo->GetSchemaVersion(*tx) == cic::db::sqlite::kSchemaVersion);
    tx->Commit();
  }

  // bootstrap is idempotent
  cic::db::sqlite::BootstrapSchema(*f.db);

  // a different expected version only logs; the stored marker is kept
  f.store->Initialize(cic::db::sqlite::kSchemaVersion + 1);
  auto tx = f.repo->BeginRead();
  assert(f.repo->GetSchemaVersion(*tx) == cic::db::sqlite::kSchemaVersion);
  tx->Commit();
}

void TestRecordServerAndReadBack() {
  auto       f   = Open("record_server");
  const auto now = cic::util::Now();

  cic::model::ServerHealth health;
  health.cpu_percent = 42.0;
  health.mem_used_mb = 2048;
  health.load_avg    = {0.5, 0.6, 0.7};
  f.store->RecordServer(health, now);

  auto tx     = f.repo->BeginRead();
  auto latest = f.repo->LatestServerSample(*tx);
  tx->Commit();

  assert(latest.has_value());
  assert(latest->cpu_percent == 42.0);
  assert(latest->mem_used_mb == 2048);
  assert(latest->load_15m == 0.7);
  assert(std::abs(latest->timestamp - cic::util::ToUnixSeconds(now)) < 1e-3);
}

void TestEmptyBundlesWriteNothing() {
  auto       f   = Open("empty_bundles");
  const auto now = cic::util::Now();

  f.store->RecordAgents({}, now);
  f.store->RecordCron({}, now);

  assert(Rows(*f.store, "agent_metrics") == 0);
  assert(Rows(*f.store, "cron_metrics") == 0);
}

void TestSecurityWritesOnePortRowPerPort() {
  auto       f   = Open("security_ports");
  const auto now = cic::util::Now();

  cic::model::SecurityStatus sec;
  sec.ssh_intrusions  = 7;
  sec.listening_ports = 2;
  sec.ports           = {{22, "ssh", "open"}, {443, "https", "open"}};
  f.store->RecordSecurity(sec, now);

  assert(Rows(*f.store, "security_metrics") == 1);
  assert(Rows(*f.store, "port_scans") == 2);
}

void TestRecordDispatchesByBundleType() {
  auto       f   = Open("dispatch");
  const auto now = cic::util::Now();

  cic::model::AgentFleet fleet;
  fleet.agents.push_back({});
  fleet.agents.back().name        = "main";
  fleet.agents.back().tokens_used = 1000;

  cic::model::NetworkActivity net;
  net.active_connections = 3;

  assert(f.store->Record("agents_data", fleet, now));
  assert(f.store->Record("network_activity", net, now));
  assert(!f.store->Record("channels_status", cic::model::ChannelList{}, now));

  assert(Rows(*f.store, "agent_metrics") == 1);
  assert(Rows(*f.store, "network_metrics") == 1);
}

void TestPruneRemovesOnlyOldRows() {
  auto       f   = Open("prune");
  const auto now = cic::util::Now();

  cic::model::ServerHealth health;
  f.store->RecordServer(health, now - 40 * 24h);
  f.store->RecordServer(health, now - 1h);

  {
    auto tx = f.repo->Begin();
    assert(f.repo->UpsertDns(*tx, {"203.0.113.9", "old.example", cic::util::ToUnixSeconds(now - 40 * 24h)}));
    assert(f.repo->UpsertDns(*tx, {"198.51.100.7", "new.example", cic::util::ToUnixSeconds(now)}));
    tx->Commit();
  }

  const auto deleted = f.store->Prune(30 * 24h, now);
  assert(deleted == 2);
  assert(Rows(*f.store, "server_metrics") == 1);
  assert(Rows(*f.store, "dns_cache") == 1);

  assert(f.store->Prune(30 * 24h, now) == 0);
}

} // namespace

int main() {
  TestSchemaVersionSeededOnceAndMismatchTolerated();
  TestRecordServerAndReadBack();
  TestEmptyBundlesWriteNothing();
  TestSecurityWritesOnePortRowPerPort();
  TestRecordDispatchesByBundleType();
  TestPruneRemovesOnlyOldRows();

  std::cout << "cic_unit_metrics_store: pass\n";
  return 0;
}
