#include "refresh_orchestrator.hpp"

#include "internal/observability/logging.hpp"

namespace cic::runtime {

using cic::observability::IntField;
using cic::observability::StringField;

RefreshOrchestrator::RefreshOrchestrator(std::shared_ptr<scheduler::CollectionScheduler> scheduler,
                                         std::shared_ptr<cache::TieredCache>             cache,
                                         std::shared_ptr<trend::TrendEngine>             trends,
                                         std::chrono::seconds                            interval)
    : scheduler_(std::move(scheduler)), cache_(std::move(cache)), trends_(std::move(trends)), interval_(interval) {
  if (interval_.count() <= 0) interval_ = std::chrono::seconds(1);
}

RefreshOrchestrator::~RefreshOrchestrator() {
  Stop();
}

void RefreshOrchestrator::Start() {
  if (running_.exchange(true)) return;
  force_  = true;
  thread_ = std::thread(&RefreshOrchestrator::Loop, this);
  CIC_LOG_INFO("Refresh orchestrator started", {IntField("interval_sec", interval_.count())});
}

void RefreshOrchestrator::Stop() {
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    if (!running_.exchange(false) && !thread_.joinable()) return;
  }
  wake_cv_.notify_all();
  if (thread_.joinable()) thread_.join();
  CIC_LOG_INFO("Refresh orchestrator stopped", {IntField("cycles", static_cast<int64_t>(cycles_.load()))});
}

void RefreshOrchestrator::ForceRefresh() {
  force_ = true;
}

// ------------------------------------------------------------------
// Snapshot
// ------------------------------------------------------------------

std::shared_ptr<const Snapshot> RefreshOrchestrator::Snapshot() const {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  return snapshot_;
}

std::optional<std::chrono::seconds> RefreshOrchestrator::LastRefreshAge(util::TimePoint now) const {
  auto current = Snapshot();
  if (!current) return std::nullopt;
  if (now <= current->published_at) return std::chrono::seconds(0);
  return std::chrono::duration_cast<std::chrono::seconds>(now - current->published_at);
}

void RefreshOrchestrator::Publish(util::TimePoint now) {
  auto next = std::make_shared<const runtime::Snapshot>(BuildSnapshot(*cache_, trends_.get(), now));

  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  snapshot_ = std::move(next);
}

// ------------------------------------------------------------------
// Cycle
// ------------------------------------------------------------------

scheduler::CycleReport RefreshOrchestrator::RunCycle(bool force_all) {
  std::lock_guard<std::mutex> lock(cycle_mutex_);

  auto report = scheduler_->CollectOnce(force_all);
  Publish(util::Now());
  cycles_.fetch_add(1);
  return report;
}

void RefreshOrchestrator::Loop() {
  using Steady = std::chrono::steady_clock;

  auto next_tick = Steady::now();

  while (running_) {
    try {
      RunCycle(force_.exchange(false));
    } catch (const std::exception& e) {
      CIC_LOG_ERROR("Refresh cycle failed", {StringField("error", e.what())});
    }

    next_tick += interval_;
    const auto now = Steady::now();
    if (next_tick <= now) {
      uint64_t missed = 0;
      while (next_tick <= now) {
        next_tick += interval_;
        ++missed;
      }
      skipped_.fetch_add(missed);
      CIC_LOG_DEBUG("Skipped refresh ticks", {IntField("missed", static_cast<int64_t>(missed))});
    }

    std::unique_lock<std::mutex> lock(wake_mutex_);
    wake_cv_.wait_until(lock, next_tick, [this] { return !running_.load(); });
  }
}

} // namespace cic::runtime
