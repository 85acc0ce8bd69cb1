#pragma once

#include <memory>

#include "internal/db/api/metrics_repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace cic::db::sqlite {

class SqliteMetricsRepository final : public db::MetricsRepository {
public:
  explicit SqliteMetricsRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;

  std::optional<int> GetSchemaVersion(Transaction&) override;
  Result SetSchemaVersion(Transaction&, int version) override;

  Result InsertServerSample(Transaction&, const model::ServerSampleRecord&) override;
  Result InsertAgentSample(Transaction&, const model::AgentSampleRecord&) override;
  Result InsertCronSample(Transaction&, const model::CronSampleRecord&) override;
  Result InsertSecuritySample(Transaction&, const model::SecuritySampleRecord&) override;
  Result InsertPortScan(Transaction&, const model::PortScanRecord&) override;
  Result InsertNetworkSample(Transaction&, const model::NetworkSampleRecord&) override;

  std::optional<model::ServerSampleRecord> LatestServerSample(Transaction&) override;
  std::optional<model::ServerSampleRecord> ServerSampleAtOrBefore(Transaction&, double cutoff) override;
  std::vector<std::string> AgentNamesSince(Transaction&, double since) override;
  std::optional<model::AgentSampleRecord> EarliestAgentSampleSince(Transaction&, const std::string& agent, double since) override;
  std::optional<model::AgentSampleRecord> LatestAgentSample(Transaction&, const std::string& agent) override;
  std::optional<model::AgentSampleRecord> AgentSampleAtOrBefore(Transaction&, const std::string& agent, double cutoff) override;

  std::optional<model::DnsRecord> GetDns(Transaction&, const std::string& ip) override;
  Result UpsertDns(Transaction&, const model::DnsRecord&) override;
  std::optional<model::GeoRecord> GetGeo(Transaction&, const std::string& ip) override;
  Result UpsertGeo(Transaction&, const model::GeoRecord&) override;
  std::optional<model::AttackerScanRecord> GetAttackerScan(Transaction&, const std::string& ip) override;
  Result UpsertAttackerScan(Transaction&, const model::AttackerScanRecord&) override;

  Result DeleteOlderThan(Transaction&, double cutoff, int64_t& deleted) override;
  std::vector<TableStat> Stats(Transaction&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
