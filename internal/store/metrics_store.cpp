#include "metrics_store.hpp"

#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace cic::store {

using cic::observability::IntField;
using cic::observability::StringField;

namespace {

void Check(const db::Result& r, std::string_view what) {
  if (!r) {
    throw util::StorageError(std::string(what) + ": " + std::string(db::ToString(r.code)) + ": " + r.message);
  }
}

} // namespace

MetricsStore::MetricsStore(std::shared_ptr<db::MetricsRepository> repository) : repository_(std::move(repository)) {
}

void MetricsStore::Initialize(int expected_version) {
  auto tx     = repository_->Begin();
  auto stored = repository_->GetSchemaVersion(*tx);

  if (!stored) {
    Check(repository_->SetSchemaVersion(*tx, expected_version), "seed schema version");
    tx->Commit();
    CIC_LOG_INFO("Initialized metrics schema", {IntField("version", expected_version)});
    return;
  }

  tx->Commit();

  if (*stored != expected_version) {
    CIC_LOG_WARN("Metrics schema version mismatch", {IntField("stored", *stored), IntField("expected", expected_version)});
  }
}

// ------------------------------------------------------------------
// Record
// ------------------------------------------------------------------

void MetricsStore::RecordServer(const model::ServerHealth& health, util::TimePoint ts) {
  db::model::ServerSampleRecord row;
  row.timestamp     = util::ToUnixSeconds(ts);
  row.cpu_percent   = health.cpu_percent;
  row.mem_used_mb   = health.mem_used_mb;
  row.mem_total_mb  = health.mem_total_mb;
  row.disk_used_gb  = health.disk_used_gb;
  row.disk_total_gb = health.disk_total_gb;
  row.load_1m       = health.load_avg[0];
  row.load_5m       = health.load_avg[1];
  row.load_15m      = health.load_avg[2];

  auto tx = repository_->Begin();
  Check(repository_->InsertServerSample(*tx, row), "insert server sample");
  tx->Commit();
}

void MetricsStore::RecordAgents(const model::AgentFleet& fleet, util::TimePoint ts) {
  if (fleet.agents.empty()) return;

  const double stamp = util::ToUnixSeconds(ts);

  auto tx = repository_->Begin();
  for (const auto& agent : fleet.agents) {
    db::model::AgentSampleRecord row;
    row.timestamp     = stamp;
    row.agent_name    = agent.name.empty() ? "unknown" : agent.name;
    row.tokens_used   = agent.tokens_used;
    row.sessions      = agent.sessions;
    row.storage_bytes = agent.storage_bytes;
    row.model         = agent.model;
    Check(repository_->InsertAgentSample(*tx, row), "insert agent sample");
  }
  tx->Commit();
}

void MetricsStore::RecordCron(const model::CronJobs& cron, util::TimePoint ts) {
  if (cron.jobs.empty()) return;

  const double stamp = util::ToUnixSeconds(ts);

  auto tx = repository_->Begin();
  for (const auto& job : cron.jobs) {
    db::model::CronSampleRecord row;
    row.timestamp = stamp;
    row.job_name  = job.name.empty() ? "unknown" : job.name;
    row.status    = job.status;
    row.last_run  = job.last_run;
    row.next_run  = job.next_run;
    Check(repository_->InsertCronSample(*tx, row), "insert cron sample");
  }
  tx->Commit();
}

void MetricsStore::RecordSecurity(const model::SecurityStatus& security, util::TimePoint ts) {
  const double stamp = util::ToUnixSeconds(ts);

  db::model::SecuritySampleRecord row;
  row.timestamp          = stamp;
  row.ssh_intrusions     = security.ssh_intrusions;
  row.ports_open         = security.listening_ports;
  row.ufw_active         = security.ufw_active;
  row.fail2ban_active    = security.fail2ban_active;
  row.root_login_enabled = security.root_login_enabled;

  auto tx = repository_->Begin();
  Check(repository_->InsertSecuritySample(*tx, row), "insert security sample");

  for (const auto& port : security.ports) {
    db::model::PortScanRecord scan;
    scan.timestamp = stamp;
    scan.port      = port.port;
    scan.service   = port.service;
    scan.state     = port.state;
    Check(repository_->InsertPortScan(*tx, scan), "insert port scan");
  }
  tx->Commit();
}

void MetricsStore::RecordNetwork(const model::NetworkActivity& network, util::TimePoint ts) {
  db::model::NetworkSampleRecord row;
  row.timestamp          = util::ToUnixSeconds(ts);
  row.active_connections = network.active_connections;
  row.unique_ips         = network.unique_ips;

  auto tx = repository_->Begin();
  Check(repository_->InsertNetworkSample(*tx, row), "insert network sample");
  tx->Commit();
}

bool MetricsStore::Record(std::string_view probe_name, const model::Bundle& bundle, util::TimePoint ts) {
  if (const auto* health = std::get_if<model::ServerHealth>(&bundle)) {
    RecordServer(*health, ts);
  } else if (const auto* fleet = std::get_if<model::AgentFleet>(&bundle)) {
    RecordAgents(*fleet, ts);
  } else if (const auto* cron = std::get_if<model::CronJobs>(&bundle)) {
    RecordCron(*cron, ts);
  } else if (const auto* security = std::get_if<model::SecurityStatus>(&bundle)) {
    RecordSecurity(*security, ts);
  } else if (const auto* network = std::get_if<model::NetworkActivity>(&bundle)) {
    RecordNetwork(*network, ts);
  } else {
    return false;
  }

  CIC_LOG_DEBUG("Recorded probe sample", {StringField("probe", probe_name)});
  return true;
}

// ------------------------------------------------------------------
// Maintenance
// ------------------------------------------------------------------

int64_t MetricsStore::Prune(std::chrono::seconds max_age, util::TimePoint now) {
  const double cutoff  = util::ToUnixSeconds(now - max_age);
  int64_t      deleted = 0;

  auto tx = repository_->Begin();
  Check(repository_->DeleteOlderThan(*tx, cutoff, deleted), "prune");
  tx->Commit();

  CIC_LOG_INFO("Pruned metrics", {IntField("rows", deleted), IntField("max_age_sec", max_age.count())});
  return deleted;
}

std::vector<db::TableStat> MetricsStore::Stats() {
  auto tx    = repository_->BeginRead();
  auto stats = repository_->Stats(*tx);
  tx->Commit();
  return stats;
}

} // namespace cic::store
