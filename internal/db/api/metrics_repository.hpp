#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/lookup_records.hpp"
#include "internal/db/model/metric_records.hpp"

namespace cic::db {

struct TableStat {
  std::string           table;
  int64_t               rows = 0;
  std::optional<double> newest; // absent for empty tables and lookup caches
};

/*
  Repository abstraction over the metrics database.

  - All reads and writes require a Transaction
  - Reads inside a transaction see its writes
  - Time-series tables are append-only; lookup tables are upserted

  The DB is the source of truth for history; the in-memory cache only holds
  the latest value per probe.
*/

class MetricsRepository {
 public:
  virtual ~MetricsRepository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual std::unique_ptr<Transaction> BeginRead() = 0;

  // ---------------------------------------------------------------------
  // Schema marker
  // ---------------------------------------------------------------------

  virtual std::optional<int> GetSchemaVersion(Transaction&) = 0;

  virtual Result SetSchemaVersion(Transaction&, int version) = 0;

  // ---------------------------------------------------------------------
  // Time series (append)
  // ---------------------------------------------------------------------

  virtual Result InsertServerSample(Transaction&, const model::ServerSampleRecord&) = 0;

  virtual Result InsertAgentSample(Transaction&, const model::AgentSampleRecord&) = 0;

  virtual Result InsertCronSample(Transaction&, const model::CronSampleRecord&) = 0;

  virtual Result InsertSecuritySample(Transaction&, const model::SecuritySampleRecord&) = 0;

  virtual Result InsertPortScan(Transaction&, const model::PortScanRecord&) = 0;

  virtual Result InsertNetworkSample(Transaction&, const model::NetworkSampleRecord&) = 0;

  // ---------------------------------------------------------------------
  // Time series (query)
  // ---------------------------------------------------------------------

  virtual std::optional<model::ServerSampleRecord> LatestServerSample(Transaction&) = 0;

  // Most recent sample with timestamp <= cutoff.
  virtual std::optional<model::ServerSampleRecord> ServerSampleAtOrBefore(Transaction&, double cutoff) = 0;

  // Distinct agents with at least one sample with timestamp >= since.
  virtual std::vector<std::string> AgentNamesSince(Transaction&, double since) = 0;

  virtual std::optional<model::AgentSampleRecord> EarliestAgentSampleSince(Transaction&, const std::string& agent, double since) = 0;

  virtual std::optional<model::AgentSampleRecord> LatestAgentSample(Transaction&, const std::string& agent) = 0;

  virtual std::optional<model::AgentSampleRecord> AgentSampleAtOrBefore(Transaction&, const std::string& agent, double cutoff) = 0;

  // ---------------------------------------------------------------------
  // Lookup caches
  // ---------------------------------------------------------------------

  virtual std::optional<model::DnsRecord> GetDns(Transaction&, const std::string& ip) = 0;

  virtual Result UpsertDns(Transaction&, const model::DnsRecord&) = 0;

  virtual std::optional<model::GeoRecord> GetGeo(Transaction&, const std::string& ip) = 0;

  virtual Result UpsertGeo(Transaction&, const model::GeoRecord&) = 0;

  virtual std::optional<model::AttackerScanRecord> GetAttackerScan(Transaction&, const std::string& ip) = 0;

  virtual Result UpsertAttackerScan(Transaction&, const model::AttackerScanRecord&) = 0;

  // ---------------------------------------------------------------------
  // Maintenance
  // ---------------------------------------------------------------------

  // Deletes time-series rows with timestamp < cutoff and lookup rows
  // resolved/scanned before cutoff. `deleted` receives the row count.
  virtual Result DeleteOlderThan(Transaction&, double cutoff, int64_t& deleted) = 0;

  virtual std::vector<TableStat> Stats(Transaction&) = 0;
};

} // namespace cic::db
