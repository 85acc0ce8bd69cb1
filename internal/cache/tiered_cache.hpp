#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>

#include "internal/model/bundles.hpp"
#include "internal/util/time.hpp"

namespace cic::cache {

struct CacheEntry {
  std::shared_ptr<const model::Bundle> bundle;
  util::TimePoint                      collected_at{};
};

/*
  Latest value per probe.

  Thread-safe. Bundles are immutable once stored; Put swaps the entry so a
  reader holds either the old or the new bundle, never a partial one.
  Stale entries keep being served until replaced.
*/
class TieredCache {
 public:
  std::optional<CacheEntry> Get(const std::string& name) const;

  // Bundle of the entry, or `fallback` when nothing was ever stored.
  model::Bundle GetOr(const std::string& name, const model::Bundle& fallback) const;

  void Put(const std::string& name, model::Bundle bundle, util::TimePoint collected_at);

  // True when the entry is absent or now - collected_at >= ttl.
  bool IsDue(const std::string& name, std::chrono::seconds ttl, util::TimePoint now) const;

  std::map<std::string, CacheEntry> Entries() const;

 private:
  mutable std::shared_mutex         mutex_;
  std::map<std::string, CacheEntry> entries_;
};

} // namespace cic::cache
