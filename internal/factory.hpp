#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include "config/config.pb.h"
#include "internal/cache/tiered_cache.hpp"
#include "internal/db/api/metrics_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/runtime/refresh_orchestrator.hpp"
#include "internal/scheduler/collection_scheduler.hpp"
#include "internal/store/metrics_store.hpp"
#include "internal/trend/trend_engine.hpp"

namespace cic::factory {

/*
  Application

  Owns all long-lived singletons of the collector.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::sqlite::SqliteDB>   database;
  std::shared_ptr<db::MetricsRepository>  repository;
  std::shared_ptr<store::MetricsStore>    store;
  std::shared_ptr<cache::TieredCache>     cache;
  std::shared_ptr<trend::TrendEngine>     trends;

  std::shared_ptr<scheduler::CollectionScheduler> scheduler;
  std::shared_ptr<runtime::RefreshOrchestrator>   orchestrator;
};

/*
  OpenStore

  Opens (creating the directory if needed) and bootstraps the metrics
  database. Throws util::StorageError when it cannot.
*/
Application OpenStore(const cic::runtime::config::RuntimeConfig& config);

/*
  PruneHistory

  Retention sweep over the store opened by OpenStore/Build, using
  database.retention_sec. A storage failure (locked database, full disk) is
  logged and yields nullopt; it never stops the caller.
*/
std::optional<int64_t> PruneHistory(const Application& app, const cic::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root: storage, lookups, probes, scheduler and orchestrator.
  This is the ONLY place that knows concrete DB and fetcher types.
  The orchestrator is returned stopped.
*/
Application Build(const cic::runtime::config::RuntimeConfig& config);

} // namespace cic::factory
