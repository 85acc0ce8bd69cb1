#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "internal/cache/tiered_cache.hpp"
#include "internal/scheduler/collection_scheduler.hpp"
#include "internal/trend/trend_engine.hpp"
#include "snapshot.hpp"

namespace cic::runtime {

/*
  RefreshOrchestrator

  Owns the background worker that drives collection:
    - one cycle per interval; ticks missed while a cycle runs are dropped
    - after every cycle a fresh Snapshot is published under snapshot_mutex_
    - ForceRefresh() marks the next cycle as force-all

  Stop() lets the in-flight cycle finish and then joins the worker.
*/
class RefreshOrchestrator {
 public:
  RefreshOrchestrator(std::shared_ptr<scheduler::CollectionScheduler> scheduler,
                      std::shared_ptr<cache::TieredCache>             cache,
                      std::shared_ptr<trend::TrendEngine>             trends,
                      std::chrono::seconds                            interval);

  ~RefreshOrchestrator();

  RefreshOrchestrator(const RefreshOrchestrator&)            = delete;
  RefreshOrchestrator& operator=(const RefreshOrchestrator&) = delete;

  // The first cycle runs immediately and collects everything.
  void Start();
  void Stop();

  // Runs one cycle on the calling thread and publishes its snapshot.
  scheduler::CycleReport RunCycle(bool force_all);

  void ForceRefresh();

  // Latest published snapshot; null before the first cycle completes.
  std::shared_ptr<const runtime::Snapshot> Snapshot() const;

  // Time since the last publish; empty before the first one.
  std::optional<std::chrono::seconds> LastRefreshAge(util::TimePoint now) const;

  uint64_t CyclesCompleted() const {
    return cycles_.load();
  }

  uint64_t TicksSkipped() const {
    return skipped_.load();
  }

 private:
  void Loop();
  void Publish(util::TimePoint now);

  std::shared_ptr<scheduler::CollectionScheduler> scheduler_;
  std::shared_ptr<cache::TieredCache>             cache_;
  std::shared_ptr<trend::TrendEngine>             trends_; // may be null
  std::chrono::seconds                            interval_;

  mutable std::mutex                       snapshot_mutex_;
  std::shared_ptr<const runtime::Snapshot> snapshot_;

  std::mutex cycle_mutex_;

  std::mutex              wake_mutex_;
  std::condition_variable wake_cv_;

  std::atomic<bool>     running_{false};
  std::atomic<bool>     force_{false};
  std::atomic<uint64_t> cycles_{0};
  std::atomic<uint64_t> skipped_{0};
  std::thread           thread_;
};

} // namespace cic::runtime
