#include "probe_registry.hpp"

#include <algorithm>
#include <cstdlib>

#include "agent_probes.hpp"
#include "host_probes.hpp"
#include "internal/model/sources.hpp"

namespace cic::probe {

using cic::runtime::config::CollectorConfig;
using cic::runtime::config::RuntimeConfig;

namespace sources = model::sources;

std::chrono::seconds TierTtl(const CollectorConfig& collector, model::Tier tier) {
  uint32_t seconds = 0;
  switch (tier) {
    case model::Tier::kFast:
      seconds = collector.tiers().fast_sec();
      break;
    case model::Tier::kMedium:
      seconds = collector.tiers().medium_sec();
      break;
    case model::Tier::kSlow:
      seconds = collector.tiers().slow_sec();
      break;
    case model::Tier::kGlacial:
      seconds = collector.tiers().glacial_sec();
      break;
  }
  return seconds == 0 ? model::DefaultTtl(tier) : std::chrono::seconds(seconds);
}

ProbeSettings SettingsFromConfig(const RuntimeConfig& config) {
  ProbeSettings settings;
  settings.cli           = config.agent_service().cli();
  settings.log_dir       = config.agent_service().log_dir();
  settings.auth_log_path = config.agent_service().auth_log_path();
  settings.login_top_n   = std::max<std::size_t>(3, config.enrichment().max_targets());

  if (const char* home = std::getenv("HOME")) settings.home = home;
  return settings;
}

std::vector<std::shared_ptr<Probe>> BuildDefaultProbes(const RuntimeConfig& config) {
  const auto& collector = config.collector();
  const auto  settings  = SettingsFromConfig(config);

  auto describe = [&](const char* name, model::Tier tier) {
    ProbeDescriptor d;
    d.name    = name;
    d.tier    = tier;
    d.ttl     = TierTtl(collector, tier);
    d.timeout = std::chrono::milliseconds(collector.probe_timeout_ms());
    return d;
  };

  auto security    = describe(sources::kSecurityStatus, model::Tier::kSlow);
  security.timeout = std::chrono::milliseconds(collector.security_probe_timeout_ms());

  std::vector<std::shared_ptr<Probe>> probes;

  // fast
  probes.push_back(std::make_shared<ServerHealthProbe>(describe(sources::kServerHealth, model::Tier::kFast)));
  probes.push_back(std::make_shared<TopProcessesProbe>(describe(sources::kTopProcesses, model::Tier::kFast), settings.top_processes));

  // medium
  probes.push_back(std::make_shared<CronJobsProbe>(describe(sources::kCronJobs, model::Tier::kMedium), settings));
  probes.push_back(std::make_shared<ActivityLogProbe>(describe(sources::kActivityLog, model::Tier::kMedium), settings));
  probes.push_back(std::make_shared<ServiceLogsProbe>(describe(sources::kOpenclawLogs, model::Tier::kMedium), settings));
  probes.push_back(std::make_shared<NetworkActivityProbe>(describe(sources::kNetworkActivity, model::Tier::kMedium)));

  // slow
  probes.push_back(std::make_shared<AgentsProbe>(describe(sources::kAgentsData, model::Tier::kSlow), settings));
  probes.push_back(std::make_shared<ServiceStatusProbe>(describe(sources::kOpenclawStatus, model::Tier::kSlow), settings));
  probes.push_back(std::make_shared<SecurityProbe>(security, settings));
  probes.push_back(std::make_shared<SshLoginSummaryProbe>(describe(sources::kSshLoginSummary, model::Tier::kSlow), settings));
  probes.push_back(std::make_shared<ChannelsProbe>(describe(sources::kChannelsStatus, model::Tier::kSlow), settings));
  probes.push_back(std::make_shared<UpdateStatusProbe>(describe(sources::kUpdateStatus, model::Tier::kSlow), settings));

  return probes;
}

} // namespace cic::probe
