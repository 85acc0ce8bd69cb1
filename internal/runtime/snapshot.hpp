#pragma once

#include <map>
#include <string>
#include <variant>
#include <vector>

#include "internal/cache/tiered_cache.hpp"
#include "internal/model/bundles.hpp"
#include "internal/trend/trend_engine.hpp"
#include "internal/util/time.hpp"

namespace cic::runtime {

struct ActionItem {
  std::string severity; // error | warn
  std::string text;
};

/*
  Published view of the monitor state.

  Built once per refresh cycle and never mutated afterwards; the renderer
  holds a shared_ptr<const Snapshot> for as long as it needs it.
*/
struct Snapshot {
  std::map<std::string, cache::CacheEntry> entries;

  trend::ServerTrends     server_trends;
  trend::TokensPerHour    tokens_per_hour;
  trend::AgentTokenTrends token_trends;

  std::vector<model::LogEvent> errors;
  std::vector<ActionItem>      actions;

  util::TimePoint published_at{};

  // Typed view of one entry; null when absent or of another type.
  template <typename T>
  const T* Get(const std::string& name) const {
    auto it = entries.find(name);
    if (it == entries.end() || !it->second.bundle) return nullptr;
    return std::get_if<T>(it->second.bundle.get());
  }
};

// Cron jobs in error, failed SSH sources with at least 5 attempts, and
// error-level agent service log events.
std::vector<model::LogEvent> DeriveErrors(const Snapshot& snapshot);

std::vector<ActionItem> DeriveActions(const Snapshot& snapshot);

// Copies the cache, queries the trend engine (when given) and derives the
// summaries. Trend queries may throw util::StorageError.
Snapshot BuildSnapshot(const cache::TieredCache& cache, const trend::TrendEngine* trends, util::TimePoint now);

} // namespace cic::runtime
