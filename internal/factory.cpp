#include "factory.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <system_error>

#include "internal/db/sqlite/sqlite_metrics_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/lookup/attacker_scanner.hpp"
#include "internal/lookup/dns_resolver.hpp"
#include "internal/lookup/geo_locator.hpp"
#include "internal/lookup/rate_limiter.hpp"
#include "internal/model/tier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/probe/probe_registry.hpp"
#include "internal/scheduler/glacial_enrichment.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace cic::factory {

using cic::observability::IntField;
using cic::observability::StringField;
using cic::runtime::config::RuntimeConfig;

namespace {

void EnsureParentDirectory(const std::string& path) {
  const auto parent = std::filesystem::path(path).parent_path();
  if (parent.empty()) return;

  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    throw util::StorageError("cannot create database directory " + parent.string() + ": " + ec.message());
  }
}

std::shared_ptr<scheduler::GlacialEnrichment> BuildEnrichment(const RuntimeConfig& config, const std::shared_ptr<db::MetricsRepository>& repository) {
  using std::chrono::milliseconds;
  using std::chrono::seconds;

  const auto& e = config.enrichment();

  auto limiter = std::make_shared<lookup::RateLimiter>(milliseconds(e.geo_min_interval_ms()));

  auto dns = std::make_shared<lookup::DnsResolver>(repository, seconds(e.dns_ttl_sec()), lookup::DnsResolver::CommandFetcher(milliseconds(e.dns_timeout_ms())));
  auto geo = std::make_shared<lookup::GeoLocator>(repository, limiter, seconds(e.geo_ttl_sec()),
                                                  lookup::GeoLocator::HttpFetcher(e.geo_endpoint(), milliseconds(e.geo_timeout_ms())));
  auto scanner = std::make_shared<lookup::AttackerScanner>(repository, seconds(e.scan_ttl_sec()),
                                                           lookup::AttackerScanner::CommandFetcher(milliseconds(e.scan_timeout_ms())));

  return std::make_shared<scheduler::GlacialEnrichment>(std::move(dns), std::move(geo), std::move(scanner), e.max_targets());
}

} // namespace

Application OpenStore(const RuntimeConfig& config) {
  Application app;

  const auto& path = config.database().path();
  EnsureParentDirectory(path);

  app.database = std::make_shared<db::sqlite::SqliteDB>(path);
  db::sqlite::BootstrapSchema(*app.database);

  app.repository = std::make_shared<db::sqlite::SqliteMetricsRepository>(app.database);
  app.store      = std::make_shared<store::MetricsStore>(app.repository);
  app.store->Initialize(db::sqlite::kSchemaVersion);

  CIC_LOG_INFO("Metrics database ready", {StringField("path", path), IntField("schema_version", db::sqlite::kSchemaVersion)});
  return app;
}

std::optional<int64_t> PruneHistory(const Application& app, const RuntimeConfig& config) {
  try {
    return app.store->Prune(std::chrono::seconds(config.database().retention_sec()), util::Now());
  } catch (const util::StorageError& e) {
    CIC_LOG_WARN("Prune failed", {StringField("path", config.database().path()), StringField("error", e.what())});
    return std::nullopt;
  }
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  Application app = OpenStore(config);

  app.cache  = std::make_shared<cache::TieredCache>();
  app.trends = std::make_shared<trend::TrendEngine>(app.repository);

  // ------------------------------------------------------------------
  // Probes + enrichment
  // ------------------------------------------------------------------
  auto probes     = probe::BuildDefaultProbes(config);
  auto enrichment = BuildEnrichment(config, app.repository);

  CIC_LOG_INFO("Probes registered", {IntField("count", static_cast<int64_t>(probes.size()))});

  // ------------------------------------------------------------------
  // Scheduler + orchestrator
  // ------------------------------------------------------------------
  const auto glacial_ttl = probe::TierTtl(config.collector(), model::Tier::kGlacial);

  app.scheduler    = std::make_shared<scheduler::CollectionScheduler>(std::move(probes), app.cache, app.store, std::move(enrichment), glacial_ttl);
  app.orchestrator = std::make_shared<runtime::RefreshOrchestrator>(app.scheduler, app.cache, app.trends,
                                                                    std::chrono::seconds(config.collector().interval_sec()));
  return app;
}

} // namespace cic::factory
