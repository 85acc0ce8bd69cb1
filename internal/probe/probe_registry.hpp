#pragma once

#include <chrono>
#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/model/tier.hpp"
#include "probe.hpp"
#include "probe_settings.hpp"

namespace cic::probe {

// TTL of a tier after config overrides.
std::chrono::seconds TierTtl(const cic::runtime::config::CollectorConfig& collector, model::Tier tier);

ProbeSettings SettingsFromConfig(const cic::runtime::config::RuntimeConfig& config);

/*
  The default probe set:
    fast:    server_health, top_processes
    medium:  cron_jobs, activity_log, openclaw_logs, network_activity
    slow:    agents_data, openclaw_status, security_status,
             ssh_login_summary, channels_status, update_status
  The glacial tier is the scheduler's enrichment pass, not a probe.
*/
std::vector<std::shared_ptr<Probe>> BuildDefaultProbes(const cic::runtime::config::RuntimeConfig& config);

} // namespace cic::probe
