#include "host_probes.hpp"

#include "command_runner.hpp"
#include "internal/util/time.hpp"

namespace cic::probe {

namespace {

constexpr std::size_t kAuthEventLimit   = 10;
constexpr std::size_t kSystemEventLimit = 20;

std::optional<std::string> FirstLine(const std::string& path) {
  auto contents = ReadTextFile(path);
  if (!contents) return std::nullopt;
  return contents->substr(0, contents->find('\n'));
}

} // namespace

// ------------------------------------------------------------------
// Server health
// ------------------------------------------------------------------

ProbeResult ServerHealthProbe::Collect() {
  const auto timeout = descriptor_.timeout;

  model::ServerHealth health;

  auto free = RunCommand({"free", "-m"}, timeout);
  if (!free.Ok()) return CommandFailure(free, "free");
  if (!parse::ParseFree(free.out, health)) {
    return ProbeResult::Err(ProbeErrorCode::kMalformedOutput, "free: no Mem: row");
  }

  auto df = RunCommand({"df", "-h", "/"}, timeout);
  if (df.Ok()) parse::ParseDf(df.out, health);

  auto uptime = RunCommand({"uptime"}, timeout);
  if (uptime.Ok()) parse::ParseUptime(uptime.out, health);

  if (auto line = FirstLine("/proc/stat")) {
    if (auto sample = parse::ParseProcStat(*line)) {
      std::lock_guard lock(cpu_mutex_);
      if (previous_cpu_) health.cpu_percent = parse::CpuPercent(*previous_cpu_, *sample);
      previous_cpu_ = *sample;
    }
  }

  return ProbeResult::Ok(std::move(health));
}

// ------------------------------------------------------------------
// Processes / network
// ------------------------------------------------------------------

ProbeResult TopProcessesProbe::Collect() {
  auto ps = RunCommand({"ps", "aux", "--sort=-%cpu"}, descriptor_.timeout);
  if (!ps.Ok()) return CommandFailure(ps, "ps");

  return ProbeResult::Ok(parse::ParsePsAux(ps.out, limit_));
}

ProbeResult NetworkActivityProbe::Collect() {
  auto ss = RunCommand({"ss", "-tnp"}, descriptor_.timeout);
  if (!ss.Ok()) return CommandFailure(ss, "ss");

  return ProbeResult::Ok(parse::ParseSsConnections(ss.out));
}

// ------------------------------------------------------------------
// Security
// ------------------------------------------------------------------

ProbeResult SecurityProbe::Collect() {
  const auto timeout = descriptor_.timeout;

  model::SecurityStatus status;

  if (auto auth = ReadTextFile(settings_.auth_log_path)) {
    status.ssh_intrusions = parse::CountIntrusions(*auth);
  }

  auto nmap = RunCommand({"nmap", "-sT", "localhost"}, timeout);
  if (nmap.Ok() && nmap.out.find("open") != std::string::npos) {
    status.ports = parse::ParseNmapPorts(nmap.out);
  } else {
    auto ss = RunCommand({"ss", "-tlnp"}, timeout);
    if (!ss.Ok()) return CommandFailure(ss, "ss -tlnp");
    status.ports = parse::ParseSsListening(ss.out);
  }
  status.listening_ports = static_cast<int64_t>(status.ports.size());

  auto ufw = RunCommand({"ufw", "status"}, timeout);
  status.ufw_active = ufw.Ok() && ufw.out.find("Status: active") != std::string::npos;

  auto fail2ban          = RunCommand({"systemctl", "is-active", "fail2ban"}, timeout);
  status.fail2ban_active = fail2ban.out.rfind("active", 0) == 0;

  // sshd defaults to permitting root login when the directive is absent
  status.root_login_enabled = true;
  if (auto sshd = ReadTextFile("/etc/ssh/sshd_config")) {
    std::size_t pos = 0;
    while (pos < sshd->size()) {
      auto        end  = sshd->find('\n', pos);
      std::string line = sshd->substr(pos, end == std::string::npos ? std::string::npos : end - pos);
      pos              = end == std::string::npos ? sshd->size() : end + 1;

      if (line.rfind("PermitRootLogin", 0) == 0) {
        status.root_login_enabled = line.find("no") == std::string::npos;
        break;
      }
    }
  }

  return ProbeResult::Ok(std::move(status));
}

// ------------------------------------------------------------------
// Auth log
// ------------------------------------------------------------------

ProbeResult SshLoginSummaryProbe::Collect() {
  auto auth = ReadTextFile(settings_.auth_log_path);
  if (!auth) return ProbeResult::Err(ProbeErrorCode::kUnavailable, "cannot read " + settings_.auth_log_path);

  return ProbeResult::Ok(parse::ParseSshLogins(*auth, settings_.login_top_n));
}

ProbeResult ActivityLogProbe::Collect() {
  model::EventLog log;
  bool            any_source = false;

  if (auto auth = ReadTextFile(settings_.auth_log_path)) {
    any_source = true;
    log.events = parse::ParseAuthEvents(*auth, kAuthEventLimit);
  }

  const auto limit = std::to_string(kSystemEventLimit);

  auto events = RunCommand({settings_.cli, "system", "events", "--limit", limit, "--json"}, descriptor_.timeout);
  if (!events.Ok() || events.out.empty()) {
    events = RunCommand({settings_.cli, "system", "events", "--limit", limit}, descriptor_.timeout);
  }

  if (events.Ok()) {
    any_source = true;
    for (auto& ev : parse::ParseSystemEvents(events.out, util::LocalHourMinute(util::Now()), kSystemEventLimit)) {
      log.events.push_back(std::move(ev));
    }
  }

  if (!any_source) return CommandFailure(events, settings_.cli + " system events");

  if (log.events.size() > settings_.event_limit) log.events.resize(settings_.event_limit);
  return ProbeResult::Ok(std::move(log));
}

} // namespace cic::probe
