#pragma once

#include "probe.hpp"
#include "probe_settings.hpp"

namespace cic::probe {

/*
  Probes over the agent orchestration service, driven through its CLI
  (`settings.cli`) and its log directory.
*/

class AgentServiceProbe : public ProbeBase {
 public:
  AgentServiceProbe(ProbeDescriptor descriptor, ProbeSettings settings)
      : ProbeBase(std::move(descriptor)), settings_(std::move(settings)) {
  }

 protected:
  ProbeSettings settings_;
};

// Agents with workspace storage and per-session token totals.
class AgentsProbe final : public AgentServiceProbe {
 public:
  using AgentServiceProbe::AgentServiceProbe;

  ProbeResult Collect() override;
};

class ServiceStatusProbe final : public AgentServiceProbe {
 public:
  using AgentServiceProbe::AgentServiceProbe;

  ProbeResult Collect() override;
};

class CronJobsProbe final : public AgentServiceProbe {
 public:
  using AgentServiceProbe::AgentServiceProbe;

  ProbeResult Collect() override;
};

// Tail of *.log in the log directory, falling back to `<cli> logs`.
class ServiceLogsProbe final : public AgentServiceProbe {
 public:
  using AgentServiceProbe::AgentServiceProbe;

  ProbeResult Collect() override;
};

class ChannelsProbe final : public AgentServiceProbe {
 public:
  using AgentServiceProbe::AgentServiceProbe;

  ProbeResult Collect() override;
};

class UpdateStatusProbe final : public AgentServiceProbe {
 public:
  using AgentServiceProbe::AgentServiceProbe;

  ProbeResult Collect() override;
};

} // namespace cic::probe
