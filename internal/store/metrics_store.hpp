#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#include "internal/db/api/metrics_repository.hpp"
#include "internal/model/bundles.hpp"
#include "internal/util/time.hpp"

namespace cic::store {

/*
  MetricsStore

  Persists probe bundles as time-series rows and maintains the database:
    - one write transaction per Record* call
    - empty bundles write nothing
    - a failed repository Result is thrown as util::StorageError

  Thread-safe; the repository serializes transactions.
*/
class MetricsStore {
 public:
  explicit MetricsStore(std::shared_ptr<db::MetricsRepository> repository);

  // Seeds the schema marker on a fresh database. A marker that differs from
  // the compiled-in version is logged and otherwise left alone.
  void Initialize(int expected_version);

  void RecordServer(const model::ServerHealth& health, util::TimePoint ts);
  void RecordAgents(const model::AgentFleet& fleet, util::TimePoint ts);
  void RecordCron(const model::CronJobs& cron, util::TimePoint ts);
  void RecordSecurity(const model::SecurityStatus& security, util::TimePoint ts);
  void RecordNetwork(const model::NetworkActivity& network, util::TimePoint ts);

  // Dispatches on the bundle type. Returns false for bundles that have no
  // time-series table.
  bool Record(std::string_view probe_name, const model::Bundle& bundle, util::TimePoint ts);

  // Deletes rows older than now - max_age. Returns the number of rows removed.
  int64_t Prune(std::chrono::seconds max_age, util::TimePoint now);

  std::vector<db::TableStat> Stats();

  std::shared_ptr<db::MetricsRepository> Repository() const {
    return repository_;
  }

 private:
  std::shared_ptr<db::MetricsRepository> repository_;
};

} // namespace cic::store
