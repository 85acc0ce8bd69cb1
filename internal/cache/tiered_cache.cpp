#include "tiered_cache.hpp"

#include <mutex>

namespace cic::cache {

// ------------------------------------------------------------
// Get
// ------------------------------------------------------------

std::optional<CacheEntry> TieredCache::Get(const std::string& name) const {
  std::shared_lock lock(mutex_);

  auto it = entries_.find(name);
  if (it == entries_.end()) return std::nullopt;

  return it->second;
}

model::Bundle TieredCache::GetOr(const std::string& name, const model::Bundle& fallback) const {
  std::shared_lock lock(mutex_);

  auto it = entries_.find(name);
  if (it == entries_.end()) return fallback;

  return *it->second.bundle;
}

// ------------------------------------------------------------
// Put
// ------------------------------------------------------------

void TieredCache::Put(const std::string& name, model::Bundle bundle, util::TimePoint collected_at) {
  CacheEntry entry;
  entry.bundle       = std::make_shared<const model::Bundle>(std::move(bundle));
  entry.collected_at = collected_at;

  std::unique_lock lock(mutex_);
  entries_[name] = std::move(entry);
}

// ------------------------------------------------------------
// Freshness
// ------------------------------------------------------------

bool TieredCache::IsDue(const std::string& name, std::chrono::seconds ttl, util::TimePoint now) const {
  std::shared_lock lock(mutex_);

  auto it = entries_.find(name);
  if (it == entries_.end()) return true;

  return now - it->second.collected_at >= ttl;
}

std::map<std::string, CacheEntry> TieredCache::Entries() const {
  std::shared_lock lock(mutex_);
  return entries_;
}

} // namespace cic::cache
