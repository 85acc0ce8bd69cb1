#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "internal/lookup/attacker_scanner.hpp"
#include "internal/lookup/dns_resolver.hpp"
#include "internal/lookup/geo_locator.hpp"
#include "internal/model/bundles.hpp"
#include "internal/util/time.hpp"

namespace cic::scheduler {

/*
  Slowest-tier pass over the failed SSH sources.

  Targets are the top `max_targets` failed-login IPs by count (ties by IP).
  Per target the lookups run in order DNS -> geolocation -> scan, each
  behind its own TTL cache; targets are processed one at a time so the
  geolocation rate limit holds.
*/
class GlacialEnrichment {
 public:
  GlacialEnrichment(std::shared_ptr<lookup::DnsResolver>     dns,
                    std::shared_ptr<lookup::GeoLocator>      geo,
                    std::shared_ptr<lookup::AttackerScanner> scanner,
                    std::size_t                              max_targets);

  static std::vector<model::LoginSource> SelectTargets(const model::SshLoginSummary& summary, std::size_t max_targets);

  model::ThreatIntel Run(const model::SshLoginSummary& summary, util::TimePoint now);

 private:
  std::shared_ptr<lookup::DnsResolver>     dns_;
  std::shared_ptr<lookup::GeoLocator>      geo_;
  std::shared_ptr<lookup::AttackerScanner> scanner_;
  std::size_t                              max_targets_;
};

} // namespace cic::scheduler
