#include "agent_probes.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string_view>
#include <vector>

#include "command_runner.hpp"
#include "internal/util/time.hpp"
#include "parsers.hpp"

namespace cic::probe {

namespace fs = std::filesystem;

namespace {

std::string FirstLineOf(const std::string& text) {
  return text.substr(0, text.find('\n'));
}

std::string ExpandWorkspace(const std::string& path, const std::string& home) {
  if (home.empty() || path.empty() || path[0] != '~') return path;
  return home + path.substr(1);
}

// Last `n` lines of every *.log file, in name order, with tail-style headers.
std::string TailLogDir(const std::string& dir, std::size_t n) {
  std::error_code ec;
  if (dir.empty() || !fs::is_directory(dir, ec)) return {};

  std::vector<fs::path> files;
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    if (entry.is_regular_file(ec) && entry.path().extension() == ".log") files.push_back(entry.path());
  }
  std::sort(files.begin(), files.end());

  std::string out;
  for (const auto& file : files) {
    auto contents = ReadTextFile(file.string());
    if (!contents || contents->empty()) continue;

    std::vector<std::string_view> lines;
    std::string_view              rest(*contents);
    while (!rest.empty()) {
      auto nl = rest.find('\n');
      lines.push_back(rest.substr(0, nl));
      rest.remove_prefix(nl == std::string_view::npos ? rest.size() : nl + 1);
    }

    out += "==> " + file.string() + " <==\n";
    for (std::size_t i = lines.size() > n ? lines.size() - n : 0; i < lines.size(); ++i) {
      out.append(lines[i]);
      out += '\n';
    }
  }
  return out;
}

} // namespace

// ------------------------------------------------------------------
// Agents
// ------------------------------------------------------------------

ProbeResult AgentsProbe::Collect() {
  const auto timeout = descriptor_.timeout;

  auto list = RunCommand({settings_.cli, "agents", "list"}, timeout);
  if (!list.Ok()) return CommandFailure(list, settings_.cli + " agents list");

  auto fleet = parse::ParseAgentsList(list.out);

  for (auto& agent : fleet.agents) {
    if (agent.workspace.empty()) continue;

    auto du = RunCommand({"du", "-sh", ExpandWorkspace(agent.workspace, settings_.home)}, timeout);
    if (!du.Ok() || du.out.empty()) continue;

    agent.storage_bytes = parse::SizeToBytes(du.out.substr(0, du.out.find_first_of(" \t")));
  }

  auto status = RunCommand({settings_.cli, "status"}, timeout);
  if (status.Ok()) parse::ApplySessionTokens(status.out, fleet);

  return ProbeResult::Ok(std::move(fleet));
}

ProbeResult ServiceStatusProbe::Collect() {
  const auto timeout = descriptor_.timeout;

  auto status = RunCommand({settings_.cli, "status", "--json"}, timeout);
  if (!status.Ok() || status.out.empty()) status = RunCommand({settings_.cli, "status"}, timeout);
  if (!status.Ok()) return CommandFailure(status, settings_.cli + " status");

  auto result = parse::ParseServiceStatus(status.out);

  auto gateway = RunCommand({settings_.cli, "gateway", "status"}, timeout);
  if (gateway.Ok()) {
    std::string lower = gateway.out;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    result.gateway_status = lower.find("running") != std::string::npos ? "running" : "stopped";
  }

  auto version = RunCommand({settings_.cli, "--version"}, timeout);
  if (version.Ok() && !version.out.empty()) result.version = FirstLineOf(version.out);

  return ProbeResult::Ok(std::move(result));
}

// ------------------------------------------------------------------
// Cron / logs
// ------------------------------------------------------------------

ProbeResult CronJobsProbe::Collect() {
  auto cron = RunCommand({settings_.cli, "cron", "list"}, descriptor_.timeout);
  if (!cron.Ok()) return CommandFailure(cron, settings_.cli + " cron list");

  return ProbeResult::Ok(parse::ParseCronList(cron.out));
}

ProbeResult ServiceLogsProbe::Collect() {
  const auto now_hhmm = util::LocalHourMinute(util::Now());

  auto tail = TailLogDir(settings_.log_dir, settings_.log_lines);
  if (!tail.empty()) return ProbeResult::Ok(parse::ParseServiceLogs(tail, now_hhmm, settings_.log_lines));

  auto logs = RunCommand({settings_.cli, "logs"}, descriptor_.timeout);
  if (!logs.Ok()) return CommandFailure(logs, settings_.cli + " logs");

  return ProbeResult::Ok(parse::ParseServiceLogs(logs.out, now_hhmm, settings_.log_lines));
}

// ------------------------------------------------------------------
// Channels / updates
// ------------------------------------------------------------------

ProbeResult ChannelsProbe::Collect() {
  auto status = RunCommand({settings_.cli, "status"}, descriptor_.timeout);
  if (!status.Ok()) return CommandFailure(status, settings_.cli + " status");

  return ProbeResult::Ok(parse::ParseChannels(status.out));
}

ProbeResult UpdateStatusProbe::Collect() {
  const auto timeout = descriptor_.timeout;

  auto status = RunCommand({settings_.cli, "status"}, timeout);
  if (!status.Ok()) return CommandFailure(status, settings_.cli + " status");

  auto update = parse::ParseUpdateStatus(status.out);
  if (update.current.empty()) {
    auto version = RunCommand({settings_.cli, "--version"}, timeout);
    if (version.Ok() && !version.out.empty()) update.current = FirstLineOf(version.out);
  }

  return ProbeResult::Ok(std::move(update));
}

} // namespace cic::probe
