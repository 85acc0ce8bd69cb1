#include "collection_scheduler.hpp"

#include <future>
#include <thread>

#include "internal/model/sources.hpp"
#include "internal/observability/logging.hpp"

namespace cic::scheduler {

using cic::observability::IntField;
using cic::observability::StringField;
using probe::ProbeErrorCode;
using probe::ProbeResult;

namespace {

struct Launched {
  std::shared_ptr<probe::Probe>           probe;
  std::future<ProbeResult>                result;
  std::chrono::steady_clock::time_point   deadline;
};

Launched Launch(std::shared_ptr<probe::Probe> probe) {
  auto promise = std::make_shared<std::promise<ProbeResult>>();

  Launched launched;
  launched.probe    = probe;
  launched.result   = promise->get_future();
  launched.deadline = std::chrono::steady_clock::now() + probe->Descriptor().timeout;

  std::thread([probe = std::move(probe), promise] {
    try {
      promise->set_value(probe->Collect());
    } catch (const std::exception& e) {
      promise->set_value(ProbeResult::Err(ProbeErrorCode::kException, e.what()));
    }
  }).detach();

  return launched;
}

} // namespace

CollectionScheduler::CollectionScheduler(std::vector<std::shared_ptr<probe::Probe>> probes,
                                         std::shared_ptr<cache::TieredCache>        cache,
                                         std::shared_ptr<store::MetricsStore>       store,
                                         std::shared_ptr<GlacialEnrichment>         enrichment,
                                         std::chrono::seconds                       glacial_ttl)
    : probes_(std::move(probes)),
      cache_(std::move(cache)),
      store_(std::move(store)),
      enrichment_(std::move(enrichment)),
      glacial_ttl_(glacial_ttl) {
}

// ------------------------------------------------------------------
// Due check
// ------------------------------------------------------------------

std::vector<std::shared_ptr<probe::Probe>> CollectionScheduler::DueProbes(util::TimePoint now, bool force_all) const {
  std::vector<std::shared_ptr<probe::Probe>> due;
  for (const auto& p : probes_) {
    const auto& d = p->Descriptor();
    if (force_all || cache_->IsDue(d.name, d.ttl, now)) due.push_back(p);
  }
  return due;
}

// ------------------------------------------------------------------
// Cycle
// ------------------------------------------------------------------

CycleReport CollectionScheduler::CollectOnce(bool force_all) {
  return CollectOnce(force_all, util::Now());
}

CycleReport CollectionScheduler::CollectOnce(bool force_all, util::TimePoint now) {
  const auto started = std::chrono::steady_clock::now();

  CycleReport report;

  std::vector<Launched> batch;
  for (auto& p : DueProbes(now, force_all)) batch.push_back(Launch(std::move(p)));

  for (auto& launched : batch) {
    const auto& name = launched.probe->Descriptor().name;

    ProbeResult result;
    if (launched.result.wait_until(launched.deadline) == std::future_status::ready) {
      result = launched.result.get();
    } else {
      result = ProbeResult::Err(ProbeErrorCode::kTimeout, "no result before deadline");
    }

    if (!result) {
      if (result.code == ProbeErrorCode::kOk) result.code = ProbeErrorCode::kMalformedOutput;
      CIC_LOG_WARN("Probe failed", {StringField("probe", name), StringField("code", probe::ToString(result.code)), StringField("error", result.message)});
      report.failed.push_back({name, result.code, result.message});
      continue;
    }

    cache_->Put(name, *result.bundle, now);
    report.collected.push_back(name);

    if (!store_) continue;
    try {
      store_->Record(name, *result.bundle, now);
    } catch (const std::exception& e) {
      CIC_LOG_WARN("Failed to record metrics", {StringField("probe", name), StringField("error", e.what())});
    }
  }

  report.enrichment_ran = RunEnrichment(force_all, now);
  report.duration       = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

  CIC_LOG_INFO("Collection cycle complete",
               {IntField("collected", static_cast<int64_t>(report.collected.size())), IntField("failed", static_cast<int64_t>(report.failed.size())),
                observability::BoolField("enriched", report.enrichment_ran), IntField("duration_ms", report.duration.count())});
  return report;
}

bool CollectionScheduler::RunEnrichment(bool force_all, util::TimePoint now) {
  const std::string key = model::sources::kGlacialEnrichment;

  if (!enrichment_) return false;
  if (!force_all && !cache_->IsDue(key, glacial_ttl_, now)) return false;

  auto        summary_entry = cache_->Get(model::sources::kSshLoginSummary);
  const auto* summary       = summary_entry ? std::get_if<model::SshLoginSummary>(summary_entry->bundle.get()) : nullptr;
  if (!summary) {
    CIC_LOG_DEBUG("Skipping glacial enrichment without a login summary");
    return false;
  }

  try {
    cache_->Put(key, enrichment_->Run(*summary, now), now);
  } catch (const std::exception& e) {
    CIC_LOG_WARN("Glacial enrichment failed", {StringField("error", e.what())});
    return false;
  }
  return true;
}

} // namespace cic::scheduler
