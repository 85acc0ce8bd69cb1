#include "glacial_enrichment.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace cic::scheduler {

using cic::observability::IntField;
using cic::observability::StringField;

GlacialEnrichment::GlacialEnrichment(std::shared_ptr<lookup::DnsResolver>     dns,
                                     std::shared_ptr<lookup::GeoLocator>      geo,
                                     std::shared_ptr<lookup::AttackerScanner> scanner,
                                     std::size_t                              max_targets)
    : dns_(std::move(dns)), geo_(std::move(geo)), scanner_(std::move(scanner)), max_targets_(max_targets) {
}

std::vector<model::LoginSource> GlacialEnrichment::SelectTargets(const model::SshLoginSummary& summary, std::size_t max_targets) {
  std::vector<model::LoginSource> targets;
  for (const auto& source : summary.failed) {
    if (!source.ip.empty()) targets.push_back(source);
  }

  std::sort(targets.begin(), targets.end(), [](const model::LoginSource& a, const model::LoginSource& b) {
    if (a.count != b.count) return a.count > b.count;
    return a.ip < b.ip;
  });

  if (targets.size() > max_targets) targets.resize(max_targets);
  return targets;
}

model::ThreatIntel GlacialEnrichment::Run(const model::SshLoginSummary& summary, util::TimePoint now) {
  model::ThreatIntel intel;

  const auto targets = SelectTargets(summary, max_targets_);
  if (targets.empty()) return intel;

  CIC_LOG_INFO("Enriching failed SSH sources", {IntField("targets", static_cast<int64_t>(targets.size()))});

  for (const auto& target : targets) {
    model::AttackerProfile profile;
    profile.ip              = target.ip;
    profile.failed_attempts = target.count;

    try {
      profile.hostname = dns_->Resolve(target.ip, now);

      auto geo             = geo_->Locate(target.ip, now);
      profile.country_code = geo.country_code;
      profile.city         = geo.city;
      profile.isp          = geo.isp;

      auto scan          = scanner_->Scan(target.ip, now);
      profile.open_ports = scan.open_ports;
      profile.os_guess   = scan.os_guess;

      CIC_LOG_INFO("Enriched attacker",
                   {StringField("ip", target.ip), StringField("hostname", profile.hostname), StringField("country", profile.country_code),
                    StringField("ports", profile.open_ports.empty() ? "none" : profile.open_ports)});
    } catch (const std::exception& e) {
      CIC_LOG_WARN("Enrichment failed", {StringField("ip", target.ip), StringField("error", e.what())});
    }

    intel.attackers.push_back(std::move(profile));
  }

  return intel;
}

} // namespace cic::scheduler
