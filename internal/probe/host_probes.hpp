#pragma once

#include <mutex>
#include <optional>

#include "parsers.hpp"
#include "probe.hpp"
#include "probe_settings.hpp"

namespace cic::probe {

/*
  Probes over the local host: /proc, coreutils, ss, nmap and the auth log.
*/

// free, df, uptime and a CPU delta against the previous /proc/stat sample.
// The first collection reports 0% CPU.
class ServerHealthProbe final : public ProbeBase {
 public:
  using ProbeBase::ProbeBase;

  ProbeResult Collect() override;

 private:
  std::mutex                      cpu_mutex_;
  std::optional<parse::CpuSample> previous_cpu_;
};

class TopProcessesProbe final : public ProbeBase {
 public:
  TopProcessesProbe(ProbeDescriptor descriptor, std::size_t limit) : ProbeBase(std::move(descriptor)), limit_(limit) {
  }

  ProbeResult Collect() override;

 private:
  std::size_t limit_;
};

class NetworkActivityProbe final : public ProbeBase {
 public:
  using ProbeBase::ProbeBase;

  ProbeResult Collect() override;
};

// Intrusion count, listening ports (nmap, falling back to ss), firewall,
// fail2ban and sshd root login.
class SecurityProbe final : public ProbeBase {
 public:
  SecurityProbe(ProbeDescriptor descriptor, ProbeSettings settings)
      : ProbeBase(std::move(descriptor)), settings_(std::move(settings)) {
  }

  ProbeResult Collect() override;

 private:
  ProbeSettings settings_;
};

class SshLoginSummaryProbe final : public ProbeBase {
 public:
  SshLoginSummaryProbe(ProbeDescriptor descriptor, ProbeSettings settings)
      : ProbeBase(std::move(descriptor)), settings_(std::move(settings)) {
  }

  ProbeResult Collect() override;

 private:
  ProbeSettings settings_;
};

// SSH sessions from the auth log merged with the agent service event feed.
class ActivityLogProbe final : public ProbeBase {
 public:
  ActivityLogProbe(ProbeDescriptor descriptor, ProbeSettings settings)
      : ProbeBase(std::move(descriptor)), settings_(std::move(settings)) {
  }

  ProbeResult Collect() override;

 private:
  ProbeSettings settings_;
};

} // namespace cic::probe
