#include "parsers.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <deque>
#include <map>
#include <regex>
#include <sstream>

namespace cic::probe::parse {

namespace {

const std::regex kSyslogStamp(R"(^(\w+\s+\d+\s+\d+:\d+:\d+))");
const std::regex kFromIp(R"(from\s+(\d+\.\d+\.\d+\.\d+))");

std::vector<std::string> SplitLines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream       in(text);
  std::string              line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    lines.push_back(std::move(line));
  }
  return lines;
}

std::vector<std::string> SplitWs(std::string_view text) {
  std::vector<std::string> parts;
  std::size_t              i = 0;
  while (i < text.size()) {
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
    std::size_t start = i;
    while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) ++i;
    if (i > start) parts.emplace_back(text.substr(start, i - start));
  }
  return parts;
}

std::string Trim(std::string_view text) {
  std::size_t b = 0;
  std::size_t e = text.size();
  while (b < e && std::isspace(static_cast<unsigned char>(text[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(text[e - 1]))) --e;
  return std::string(text.substr(b, e - b));
}

std::string ToLower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool Contains(std::string_view haystack, std::string_view needle) {
  return haystack.find(needle) != std::string_view::npos;
}

bool StartsWith(std::string_view text, std::string_view prefix) {
  return text.substr(0, prefix.size()) == prefix;
}

std::optional<double> ToDouble(std::string_view text) {
  const std::string s(text);
  if (s.empty()) return std::nullopt;
  char*        end   = nullptr;
  const double value = std::strtod(s.c_str(), &end);
  if (end != s.c_str() + s.size()) return std::nullopt;
  return value;
}

std::optional<int64_t> ToInt(std::string_view text) {
  const std::string s(text);
  if (s.empty()) return std::nullopt;
  char*           end   = nullptr;
  const long long value = std::strtoll(s.c_str(), &end, 10);
  if (end != s.c_str() + s.size()) return std::nullopt;
  return static_cast<int64_t>(value);
}

// Byte-offset slice clamped to the line.
std::string Slice(const std::string& line, std::size_t start, std::size_t end) {
  if (start >= line.size() || end <= start) return {};
  return line.substr(start, std::min(end, line.size()) - start);
}

std::string SyslogStamp(const std::string& line) {
  std::smatch m;
  if (std::regex_search(line, m, kSyslogStamp)) return m[1].str();
  return {};
}

// Splits a numeric size into value and upper-cased unit letter.
std::pair<std::optional<double>, char> SplitSize(std::string_view text) {
  std::string s = Trim(text);
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  if (!s.empty() && s.back() == 'B') s.pop_back();
  if (s.size() > 1 && s.back() == 'I') s.pop_back();

  if (!s.empty() && std::isalpha(static_cast<unsigned char>(s.back()))) {
    const char unit = s.back();
    s.pop_back();
    return {ToDouble(s), unit};
  }
  return {ToDouble(s), '\0'};
}

std::string StructString(const google::protobuf::Struct& s, const std::string& key) {
  auto it = s.fields().find(key);
  if (it == s.fields().end()) return {};

  const auto& v = it->second;
  if (v.kind_case() == google::protobuf::Value::kStringValue) return v.string_value();
  if (v.kind_case() == google::protobuf::Value::kNumberValue) {
    std::ostringstream os;
    os << v.number_value();
    return os.str();
  }
  return {};
}

struct SourceTally {
  int64_t     count = 0;
  std::string last_seen;
};

std::vector<model::LoginSource> TopSources(const std::deque<std::string>& lines, std::size_t top_n) {
  std::map<std::string, SourceTally> tallies;

  for (const auto& line : lines) {
    std::smatch m;
    if (!std::regex_search(line, m, kFromIp)) continue;

    auto& tally = tallies[m[1].str()];
    tally.count += 1;
    tally.last_seen = SyslogStamp(line);
  }

  std::vector<model::LoginSource> sources;
  sources.reserve(tallies.size());
  for (const auto& [ip, tally] : tallies) {
    sources.push_back({ip, tally.count, tally.last_seen});
  }

  std::stable_sort(sources.begin(), sources.end(), [](const model::LoginSource& a, const model::LoginSource& b) {
    if (a.count != b.count) return a.count > b.count;
    return a.ip < b.ip;
  });

  if (sources.size() > top_n) sources.resize(top_n);
  return sources;
}

} // namespace

// ------------------------------------------------------------------
// Sizes
// ------------------------------------------------------------------

double SizeToGb(std::string_view text) {
  auto [value, unit] = SplitSize(text);
  if (!value) return 0.0;

  switch (unit) {
    case 'K':
      return *value / 1024.0 / 1024.0;
    case 'M':
      return *value / 1024.0;
    case 'G':
      return *value;
    case 'T':
      return *value * 1024.0;
    case 'P':
      return *value * 1024.0 * 1024.0;
    case '\0':
      return *value / (1024.0 * 1024.0 * 1024.0);
    default:
      return 0.0;
  }
}

int64_t SizeToBytes(std::string_view text) {
  auto [value, unit] = SplitSize(text);
  if (!value) return 0;

  double multiplier = 1.0;
  switch (unit) {
    case 'K':
      multiplier = 1024.0;
      break;
    case 'M':
      multiplier = 1024.0 * 1024.0;
      break;
    case 'G':
      multiplier = 1024.0 * 1024.0 * 1024.0;
      break;
    case 'T':
      multiplier = 1024.0 * 1024.0 * 1024.0 * 1024.0;
      break;
    case '\0':
      break;
    default:
      return 0;
  }
  return static_cast<int64_t>(*value * multiplier);
}

// ------------------------------------------------------------------
// Host
// ------------------------------------------------------------------

bool ParseFree(const std::string& out, model::ServerHealth& health) {
  for (const auto& line : SplitLines(out)) {
    if (!StartsWith(line, "Mem:")) continue;

    auto parts = SplitWs(line);
    if (parts.size() < 3) return false;

    auto total = ToDouble(parts[1]);
    auto used  = ToDouble(parts[2]);
    if (!total || !used) return false;

    health.mem_total_mb = *total;
    health.mem_used_mb  = *used;
    health.mem_percent  = *total > 0 ? (*used / *total) * 100.0 : 0.0;
    return true;
  }
  return false;
}

bool ParseDf(const std::string& out, model::ServerHealth& health) {
  auto lines = SplitLines(out);
  if (lines.size() < 2) return false;

  // long device names wrap the row onto a second line
  std::string row;
  for (std::size_t i = 1; i < lines.size(); ++i) row += lines[i] + " ";

  auto parts = SplitWs(row);
  if (parts.size() < 5) return false;

  health.disk_total_gb = SizeToGb(parts[1]);
  health.disk_used_gb  = SizeToGb(parts[2]);

  std::string pct = parts[4];
  if (!pct.empty() && pct.back() == '%') pct.pop_back();
  if (auto v = ToDouble(pct)) health.disk_percent = *v;

  return true;
}

bool ParseUptime(const std::string& out, model::ServerHealth& health) {
  static const std::regex kLoad(R"(load averages?:\s*([\d.]+),?\s*([\d.]+),?\s*([\d.]+))");
  static const std::regex kUpUsers(R"(up\s+(.+?),\s+\d+\s+users?)");
  static const std::regex kUpLoad(R"(up\s+(.+?),\s+load)");

  bool        parsed = false;
  std::smatch m;

  if (std::regex_search(out, m, kLoad)) {
    for (std::size_t i = 0; i < 3; ++i) {
      health.load_avg[i] = ToDouble(m[i + 1].str()).value_or(0.0);
    }
    parsed = true;
  }

  if (std::regex_search(out, m, kUpUsers) || std::regex_search(out, m, kUpLoad)) {
    health.uptime = Trim(m[1].str());
  }

  return parsed;
}

std::optional<CpuSample> ParseProcStat(const std::string& first_line) {
  auto parts = SplitWs(first_line);
  if (parts.size() < 8 || parts[0] != "cpu") return std::nullopt;

  CpuSample sample{};
  for (std::size_t i = 0; i < sample.size(); ++i) {
    auto v = ToInt(parts[i + 1]);
    if (!v || *v < 0) return std::nullopt;
    sample[i] = static_cast<uint64_t>(*v);
  }
  return sample;
}

double CpuPercent(const CpuSample& previous, const CpuSample& current) {
  uint64_t total_prev = 0;
  uint64_t total_now  = 0;
  for (std::size_t i = 0; i < current.size(); ++i) {
    total_prev += previous[i];
    total_now += current[i];
  }
  if (total_now <= total_prev) return 0.0;

  const uint64_t idle_prev = previous[3] + previous[4];
  const uint64_t idle_now  = current[3] + current[4];

  const double total_diff = static_cast<double>(total_now - total_prev);
  const double idle_diff  = idle_now >= idle_prev ? static_cast<double>(idle_now - idle_prev) : 0.0;

  return std::clamp((total_diff - idle_diff) / total_diff * 100.0, 0.0, 100.0);
}

model::ProcessList ParsePsAux(const std::string& out, std::size_t limit) {
  model::ProcessList list;

  auto lines = SplitLines(out);
  for (std::size_t i = 1; i < lines.size() && list.processes.size() < limit; ++i) {
    auto parts = SplitWs(lines[i]);
    if (parts.size() < 11) continue;

    model::ProcessInfo p;
    p.user = parts[0].substr(0, 8);
    p.pid  = parts[1];
    p.cpu  = ToDouble(parts[2]).value_or(0.0);
    p.mem  = ToDouble(parts[3]).value_or(0.0);

    const std::string& binary = parts[10];
    const auto         slash  = binary.rfind('/');
    p.command                 = (slash == std::string::npos ? binary : binary.substr(slash + 1)).substr(0, 20);

    list.processes.push_back(std::move(p));
  }
  return list;
}

model::NetworkActivity ParseSsConnections(const std::string& out) {
  model::NetworkActivity activity;

  auto lines = SplitLines(out);
  for (std::size_t i = 1; i < lines.size(); ++i) {
    auto parts = SplitWs(lines[i]);
    if (parts.size() < 5) continue;

    const std::string& peer = parts[4];
    const auto         colon = peer.rfind(':');
    std::string        ip    = colon == std::string::npos ? peer : peer.substr(0, colon);

    if (ip == "127.0.0.1" || ip == "::1" || ip == "[::1]" || ip == "*" || ip == "0.0.0.0") continue;

    if (!ip.empty() && ip.front() == '[') ip.erase(0, 1);
    if (!ip.empty() && ip.back() == ']') ip.pop_back();
    if (StartsWith(ip, "::ffff:")) ip.erase(0, 7);
    if (ip == "127.0.0.1" || ip.empty()) continue;

    activity.peer_ips[ip] += 1;
  }

  for (const auto& [ip, count] : activity.peer_ips) activity.active_connections += count;
  activity.unique_ips = static_cast<int64_t>(activity.peer_ips.size());
  return activity;
}

std::vector<model::PortInfo> ParseNmapPorts(const std::string& out) {
  std::vector<model::PortInfo> ports;

  for (const auto& raw : SplitLines(out)) {
    const std::string line = Trim(raw);
    if (!Contains(line, "/tcp") || !Contains(line, "open")) continue;

    auto parts = SplitWs(line);
    if (parts.size() < 2) continue;

    auto port = ToInt(parts[0].substr(0, parts[0].find('/')));
    if (!port) continue;

    model::PortInfo info;
    info.port    = static_cast<int>(*port);
    info.state   = parts[1];
    info.service = parts.size() > 2 ? parts[2] : "unknown";
    ports.push_back(std::move(info));
  }
  return ports;
}

std::vector<model::PortInfo> ParseSsListening(const std::string& out) {
  static const std::regex kProcess(R"re("([^"]+)")re");

  std::vector<model::PortInfo> ports;

  auto lines = SplitLines(out);
  for (std::size_t i = 1; i < lines.size(); ++i) {
    auto parts = SplitWs(lines[i]);
    if (parts.size() < 4) continue;

    const std::string& local = parts[3];
    const auto         colon = local.rfind(':');
    auto               port  = ToInt(colon == std::string::npos ? local : local.substr(colon + 1));
    if (!port) continue;

    std::string process;
    for (const auto& p : parts) {
      if (!Contains(p, "users:")) continue;
      std::smatch m;
      if (std::regex_search(p, m, kProcess)) process = m[1].str();
      break;
    }

    model::PortInfo info;
    info.port    = static_cast<int>(*port);
    info.state   = "open";
    info.service = process.empty() ? "port-" + std::to_string(*port) : process;
    ports.push_back(std::move(info));
  }
  return ports;
}

// ------------------------------------------------------------------
// Auth log
// ------------------------------------------------------------------

int64_t CountIntrusions(const std::string& auth_log) {
  int64_t count = 0;
  for (const auto& line : SplitLines(auth_log)) {
    if (Contains(line, "Failed password") || Contains(line, "Invalid user")) ++count;
  }
  return count;
}

model::SshLoginSummary ParseSshLogins(const std::string& auth_log, std::size_t top_n, std::size_t window) {
  std::deque<std::string> accepted;
  std::deque<std::string> failed;

  for (auto& line : SplitLines(auth_log)) {
    if (Trim(line).empty()) continue;

    if (Contains(line, "Accepted")) {
      accepted.push_back(line);
      if (accepted.size() > window) accepted.pop_front();
    }
    if (Contains(line, "Failed password") || Contains(line, "Invalid user")) {
      failed.push_back(std::move(line));
      if (failed.size() > window) failed.pop_front();
    }
  }

  model::SshLoginSummary summary;
  summary.accepted = TopSources(accepted, top_n);
  summary.failed   = TopSources(failed, top_n);
  return summary;
}

std::vector<model::LogEvent> ParseAuthEvents(const std::string& auth_log, std::size_t limit) {
  std::deque<std::string> tail;
  for (auto& line : SplitLines(auth_log)) {
    if (Trim(line).empty()) continue;
    if (!Contains(line, "Accepted") && !Contains(line, "session opened")) continue;

    tail.push_back(std::move(line));
    if (tail.size() > limit) tail.pop_front();
  }

  std::vector<model::LogEvent> events;
  for (const auto& line : tail) {
    model::LogEvent ev;
    const auto      stamp = SyslogStamp(line);
    ev.time               = stamp.empty() ? "unknown" : stamp;
    ev.message            = stamp.empty() ? line : Trim(std::string_view(line).substr(stamp.size()));
    ev.type               = "ssh";
    ev.level              = "info";
    events.push_back(std::move(ev));
  }
  return events;
}

// ------------------------------------------------------------------
// Agent service CLI
// ------------------------------------------------------------------

model::AgentFleet ParseAgentsList(const std::string& out) {
  model::AgentFleet fleet;
  model::AgentInfo* current = nullptr;

  for (const auto& raw : SplitLines(out)) {
    const std::string line = Trim(raw);

    if (StartsWith(line, "- ")) {
      // "- main (default) (galactic)"
      const std::string rest = line.substr(2);

      model::AgentInfo agent;
      agent.name       = Trim(rest.substr(0, rest.find('(')));
      agent.is_default = Contains(rest, "(default)");
      fleet.agents.push_back(std::move(agent));
      current = &fleet.agents.back();
    } else if (current && StartsWith(line, "Model:")) {
      std::string model = Trim(line.substr(6));
      for (std::string_view prefix : {"anthropic/", "claude-"}) {
        auto pos = model.find(prefix);
        if (pos != std::string::npos) model.erase(pos, prefix.size());
      }
      current->model = model;
    } else if (current && StartsWith(line, "Workspace:")) {
      current->workspace = Trim(line.substr(10));
    }
  }
  return fleet;
}

void ApplySessionTokens(const std::string& status_out, model::AgentFleet& fleet) {
  static const std::regex kTokens(R"((\d+)k/(\d+)k\s*\((\d+)%\))");

  auto lines = SplitLines(status_out);
  for (auto& agent : fleet.agents) {
    const std::string marker = "agent:" + agent.name + ":";

    int64_t total_k  = 0;
    int64_t sessions = 0;
    for (const auto& line : lines) {
      if (!Contains(line, marker)) continue;
      ++sessions;

      std::smatch m;
      if (std::regex_search(line, m, kTokens)) total_k += ToInt(m[1].str()).value_or(0);
    }

    agent.tokens_used = total_k * 1000;
    agent.sessions    = sessions;
  }
}

model::ServiceStatus ParseServiceStatus(const std::string& out) {
  static const std::regex kNumber(R"((\d+))");

  model::ServiceStatus status;

  google::protobuf::Struct doc;
  if (google::protobuf::util::JsonStringToMessage(out, &doc).ok()) {
    auto sessions = StructString(doc, "sessions");
    if (sessions.empty()) sessions = StructString(doc, "active_sessions");
    if (auto v = ToDouble(sessions)) status.sessions = static_cast<int64_t>(*v);

    auto model = StructString(doc, "model");
    if (model.empty()) model = StructString(doc, "default_model");
    if (!model.empty()) status.model = model;
    return status;
  }

  for (const auto& line : SplitLines(out)) {
    const auto lower = ToLower(line);

    if (Contains(lower, "session")) {
      std::smatch m;
      if (std::regex_search(line, m, kNumber)) status.sessions = ToInt(m[1].str()).value_or(0);
    }
    if (Contains(lower, "model")) {
      auto colon = line.find(':');
      if (colon != std::string::npos) {
        auto end     = line.find(':', colon + 1);
        status.model = Trim(line.substr(colon + 1, end == std::string::npos ? std::string::npos : end - colon - 1));
      }
    }
  }
  return status;
}

model::CronJobs ParseCronList(const std::string& out) {
  model::CronJobs cron;

  auto lines = SplitLines(out);

  // diagnostics may precede the table
  std::size_t header_idx = lines.size();
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (StartsWith(lines[i], "ID") && Contains(lines[i], "Name") && Contains(lines[i], "Schedule")) {
      header_idx = i;
      break;
    }
  }
  if (header_idx + 1 >= lines.size()) return cron;

  const std::string& header = lines[header_idx];
  auto               column = [&](const char* name, std::size_t fallback) {
    auto pos = header.find(name);
    return pos == std::string::npos ? fallback : pos;
  };

  const bool        has_target   = header.find("Target") != std::string::npos;
  const std::size_t name_start   = column("Name", 37);
  const std::size_t next_start   = column("Next", 70);
  const std::size_t last_start   = column("Last", 81);
  const std::size_t status_start = column("Status", 92);
  const std::size_t agent_start  = column("Agent", 112);
  const std::size_t status_end   = has_target ? column("Target", agent_start) : agent_start;

  for (std::size_t i = header_idx + 1; i < lines.size(); ++i) {
    const std::string& line = lines[i];
    if (Trim(line).empty()) continue;

    model::CronJob job;

    std::string name = Trim(Slice(line, name_start, next_start));
    while (!name.empty() && name.back() == '.') name.pop_back();
    job.name = Trim(name.substr(0, 22));

    job.next_run = Trim(Slice(line, next_start, last_start));
    job.last_run = Trim(Slice(line, last_start, status_start));
    if (job.last_run == "-") job.last_run.clear();

    const auto status = ToLower(Trim(Slice(line, status_start, status_end)));
    if (Contains(status, "error")) {
      job.status = "error";
    } else if (Contains(status, "running")) {
      job.status = "running";
    } else if (status == "ok") {
      job.status = "ok";
    } else {
      job.status = "idle";
    }

    if (line.size() > agent_start) {
      auto agent_parts = SplitWs(std::string_view(line).substr(agent_start));
      if (!agent_parts.empty()) job.agent = agent_parts.front();
    }

    cron.jobs.push_back(std::move(job));
  }
  return cron;
}

model::ChannelList ParseChannels(const std::string& out) {
  static const std::string kBar = "│";

  model::ChannelList list;
  bool               in_channels = false;

  for (const auto& line : SplitLines(out)) {
    if (!in_channels) {
      if (Contains(line, "Channels") && !Contains(line, kBar)) in_channels = true;
      continue;
    }

    const std::string trimmed = Trim(line);
    if (!trimmed.empty() && !StartsWith(trimmed, kBar) && !StartsWith(trimmed, "├") && !StartsWith(trimmed, "└") &&
        !StartsWith(trimmed, "┌") && !StartsWith(trimmed, "─")) {
      if (Contains(line, "Sessions") || Contains(line, "Security") || Contains(line, "FAQ")) break;
    }
    if (!StartsWith(trimmed, kBar)) continue;

    // "│ name │ enabled │ state │ detail │"
    std::vector<std::string> cells;
    std::size_t              pos = kBar.size();
    while (true) {
      auto next = trimmed.find(kBar, pos);
      if (next == std::string::npos) break;
      cells.push_back(Trim(trimmed.substr(pos, next - pos)));
      pos = next + kBar.size();
    }
    if (cells.size() < 4) continue;

    const std::string& name = cells[0];
    if (name.empty() || name == "Channel" || StartsWith(name, "─") || SplitWs(name).size() != 1) continue;

    list.channels.push_back({name, cells[1], cells[2], cells[3]});
  }
  return list;
}

model::UpdateStatus ParseUpdateStatus(const std::string& out) {
  static const std::regex kLatest(R"(update ([\d.]+(?:-\d+)?))");
  static const std::regex kCurrent(R"(app ([\d.]+(?:-\d+)?))");

  model::UpdateStatus status;

  for (const auto& line : SplitLines(out)) {
    std::smatch m;
    if (Contains(line, "Update") && Contains(line, "available")) {
      status.available = true;
      if (std::regex_search(line, m, kLatest)) status.latest = m[1].str();
    }
    if (Contains(line, "Gateway") && Contains(line, "app ")) {
      if (std::regex_search(line, m, kCurrent)) status.current = m[1].str();
    }
  }
  return status;
}

std::vector<model::LogEvent> ParseSystemEvents(const std::string& out, const std::string& now_hhmm, std::size_t limit) {
  std::vector<model::LogEvent> events;

  google::protobuf::ListValue doc;
  if (google::protobuf::util::JsonStringToMessage(out, &doc).ok()) {
    for (const auto& value : doc.values()) {
      if (events.size() >= limit) break;
      if (value.kind_case() != google::protobuf::Value::kStructValue) continue;

      const auto&     obj = value.struct_value();
      model::LogEvent ev;

      ev.time = StructString(obj, "time");
      if (ev.time.empty()) ev.time = StructString(obj, "timestamp");
      if (ev.time.empty()) ev.time = "unknown";

      ev.message = StructString(obj, "message");
      if (ev.message.empty()) ev.message = StructString(obj, "text");
      if (ev.message.empty() && !google::protobuf::util::MessageToJsonString(obj, &ev.message).ok()) ev.message.clear();

      if (auto type = StructString(obj, "type"); !type.empty()) ev.type = type;
      if (auto level = StructString(obj, "level"); !level.empty()) ev.level = level;

      events.push_back(std::move(ev));
    }
    return events;
  }

  for (const auto& raw : SplitLines(out)) {
    if (events.size() >= limit) break;
    const std::string line = Trim(raw);
    if (line.empty()) continue;

    model::LogEvent ev;
    ev.time    = now_hhmm;
    ev.message = line;
    events.push_back(std::move(ev));
  }
  return events;
}

model::EventLog ParseServiceLogs(const std::string& out, const std::string& now_hhmm, std::size_t limit) {
  static const std::regex kIsoStamp(R"(^(\d{4}-\d{2}-\d{2}[T ](\d{2}:\d{2})))");

  model::EventLog log;

  auto        lines = SplitLines(out);
  std::size_t first = lines.size() > limit ? lines.size() - limit : 0;

  for (std::size_t i = first; i < lines.size(); ++i) {
    const std::string line = Trim(lines[i]);
    if (line.empty() || StartsWith(line, "==>")) continue;

    model::LogEvent ev;

    std::smatch m;
    ev.time    = std::regex_search(line, m, kIsoStamp) ? m[2].str() : now_hhmm;
    ev.message = line.substr(0, 80);
    ev.type    = "openclaw";
    ev.level   = DetectLevel(line);
    log.events.push_back(std::move(ev));
  }
  return log;
}

std::string DetectLevel(std::string_view line) {
  const auto lower = ToLower(line);
  if (Contains(lower, "error") || Contains(lower, "fail")) return "error";
  if (Contains(lower, "warn")) return "warning";
  return "info";
}

} // namespace cic::probe::parse
