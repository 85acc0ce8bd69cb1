#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "glacial_enrichment.hpp"
#include "internal/cache/tiered_cache.hpp"
#include "internal/probe/probe.hpp"
#include "internal/store/metrics_store.hpp"
#include "internal/util/time.hpp"

namespace cic::scheduler {

struct ProbeFailure {
  std::string           name;
  probe::ProbeErrorCode code = probe::ProbeErrorCode::kException;
  std::string           message;
};

struct CycleReport {
  std::vector<std::string>  collected;
  std::vector<ProbeFailure> failed;
  bool                      enrichment_ran = false;
  std::chrono::milliseconds duration{0};
};

/*
  CollectionScheduler

  One cycle:
    1. select due probes (TTL expired, never collected, or force_all)
    2. run each on its own thread; wait for each until its own deadline
    3. successes replace their cache entry and are recorded in the store;
       failures keep the previous entry and are retried when next due
    4. if the glacial tier is due, enrich the failed SSH sources

  CollectOnce is not reentrant; the orchestrator never overlaps cycles.
  A probe that misses its deadline is reported as kTimeout and left to
  finish on its own thread; its result is discarded.
*/
class CollectionScheduler {
 public:
  CollectionScheduler(std::vector<std::shared_ptr<probe::Probe>> probes,
                      std::shared_ptr<cache::TieredCache>        cache,
                      std::shared_ptr<store::MetricsStore>       store,
                      std::shared_ptr<GlacialEnrichment>         enrichment,
                      std::chrono::seconds                       glacial_ttl);

  std::vector<std::shared_ptr<probe::Probe>> DueProbes(util::TimePoint now, bool force_all) const;

  CycleReport CollectOnce(bool force_all);
  CycleReport CollectOnce(bool force_all, util::TimePoint now);

  const std::vector<std::shared_ptr<probe::Probe>>& Probes() const {
    return probes_;
  }

 private:
  bool RunEnrichment(bool force_all, util::TimePoint now);

  std::vector<std::shared_ptr<probe::Probe>> probes_;
  std::shared_ptr<cache::TieredCache>        cache_;
  std::shared_ptr<store::MetricsStore>       store_; // may be null
  std::shared_ptr<GlacialEnrichment>         enrichment_; // may be null
  std::chrono::seconds                       glacial_ttl_;
};

} // namespace cic::scheduler
