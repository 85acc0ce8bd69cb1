#include "internal/probe/parsers.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

namespace {

namespace parse = cic::probe::parse;

bool Near(double a, double b, double eps = 1e-6) {
  return std::abs(a - b) < eps;
}

std::string Pad(const std::string& s, std::size_t width) {
  return s.size() >= width ? s : s + std::string(width - s.size(), ' ');
}

const char* kAuthLog =
    "Oct 18 10:00:01 host sshd[1]: Failed password for root from 203.0.113.9 port 5000 ssh2\n"
    "Oct 18 10:00:02 host sshd[1]: Failed password for root from 203.0.113.9 port 5001 ssh2\n"
    "Oct 18 10:00:03 host sshd[1]: Invalid user admin from 198.51.100.7 port 5002\n"
    "Oct 18 10:00:04 host sshd[1]: Failed password for invalid user admin from 198.51.100.7 port 5003 ssh2\n"
    "Oct 18 10:00:05 host sshd[1]: Invalid user test from 192.0.2.1 port 5004\n"
    "Oct 18 10:05:00 host sshd[2]: Accepted publickey for deploy from 10.0.0.2 port 6000 ssh2\n"
    "Oct 18 10:05:00 host sshd[2]: pam_unix(sshd:session): session opened for user deploy\n";

void TestSizes() {
  assert(Near(parse::SizeToGb("512M"), 0.5));
  assert(Near(parse::SizeToGb("7.7Gi"), 7.7));
  assert(Near(parse::SizeToGb("1T"), 1024.0));
  assert(Near(parse::SizeToGb("garbage"), 0.0));
  assert(parse::SizeToBytes("27M") == 28311552);
  assert(parse::SizeToBytes("4.0K") == 4096);
}

void TestHostHealth() {
  cic::model::ServerHealth health;

  assert(parse::ParseFree("               total        used        free      shared  buff/cache   available\n"
                          "Mem:            7951        2345        1234         100        4372        5300\n"
                          "Swap:           2047           0        2047\n",
                          health));
  assert(Near(health.mem_total_mb, 7951));
  assert(Near(health.mem_used_mb, 2345));
  assert(Near(health.mem_percent, 2345.0 / 7951.0 * 100.0));

  assert(parse::ParseDf("Filesystem      Size  Used Avail Use% Mounted on\n"
                        "/dev/sda1        78G   31G   44G  42% /\n",
                        health));
  assert(Near(health.disk_total_gb, 78));
  assert(Near(health.disk_used_gb, 31));
  assert(Near(health.disk_percent, 42));

  assert(parse::ParseUptime(" 14:03:22 up 12 days,  3:41,  2 users,  load average: 0.52, 0.58, 0.59\n", health));
  assert(health.uptime == "12 days,  3:41");
  assert(Near(health.load_avg[0], 0.52));
  assert(Near(health.load_avg[2], 0.59));

  cic::model::ServerHealth empty;
  assert(!parse::ParseFree("no memory here\n", empty));
  assert(!parse::ParseDf("", empty));
}

void TestCpuPercent() {
  auto prev = parse::ParseProcStat("cpu  100 0 100 700 100 0 0 0 0 0");
  auto next = parse::ParseProcStat("cpu  150 0 150 750 150 0 0 0 0 0");
  assert(prev && next);
  assert(Near(parse::CpuPercent(*prev, *next), 50.0));
  assert(Near(parse::CpuPercent(*next, *next), 0.0));
  assert(!parse::ParseProcStat("intr 12345").has_value());
}

void TestProcessesAndNetwork() {
  auto procs = parse::ParsePsAux("USER         PID %CPU %MEM    VSZ   RSS TTY      STAT START   TIME COMMAND\n"
                                 "www-data    1234 25.0  1.5 123456 65432 ?        Sl   10:00   1:23 /usr/bin/python3 app.py\n"
                                 "root           1  0.1  0.2  16000  9000 ?        Ss   09:00   0:05 /sbin/init splash\n",
                                 1);
  assert(procs.processes.size() == 1);
  assert(procs.processes[0].pid == "1234");
  assert(procs.processes[0].user == "www-data");
  assert(Near(procs.processes[0].cpu, 25.0));
  assert(procs.processes[0].command == "python3");

  auto net = parse::ParseSsConnections("State  Recv-Q Send-Q Local Address:Port  Peer Address:Port Process\n"
                                       "ESTAB  0      0      10.0.0.5:22         203.0.113.9:51234\n"
                                       "ESTAB  0      0      10.0.0.5:22         203.0.113.9:51235\n"
                                       "ESTAB  0      0      127.0.0.1:5432      127.0.0.1:40000\n"
                                       "ESTAB  0      0      [::ffff:10.0.0.5]:443 [::ffff:198.51.100.7]:6000\n");
  assert(net.active_connections == 3);
  assert(net.unique_ips == 2);
  assert(net.peer_ips.at("203.0.113.9") == 2);
  assert(net.peer_ips.at("198.51.100.7") == 1);
}

void TestPorts() {
  auto nmap = parse::ParseNmapPorts("Starting Nmap 7.80\n"
                                    "PORT     STATE SERVICE\n"
                                    "22/tcp   open  ssh\n"
                                    "80/tcp   open  http\n"
                                    "443/tcp  closed https\n"
                                    "Nmap done: 1 IP address (1 host up)\n");
  assert(nmap.size() == 2);
  assert(nmap[0].port == 22 && nmap[0].service == "ssh");
  assert(nmap[1].port == 80 && nmap[1].state == "open");

  auto ss = parse::ParseSsListening("State  Recv-Q Send-Q Local Address:Port Peer Address:Port Process\n"
                                    "LISTEN 0      128    0.0.0.0:22          0.0.0.0:*     users:((\"sshd\",pid=812,fd=3))\n"
                                    "LISTEN 0      511    127.0.0.1:6379      0.0.0.0:*\n");
  assert(ss.size() == 2);
  assert(ss[0].port == 22 && ss[0].service == "sshd");
  assert(ss[1].port == 6379 && ss[1].service == "port-6379");
}

void TestAuthLog() {
  assert(parse::CountIntrusions(kAuthLog) == 5);

  auto summary = parse::ParseSshLogins(kAuthLog, 2);
  assert(summary.failed.size() == 2);
  assert(summary.failed[0].ip == "198.51.100.7");
  assert(summary.failed[0].count == 2);
  assert(summary.failed[1].ip == "203.0.113.9");
  assert(summary.failed[1].last_seen == "Oct 18 10:00:02");
  assert(summary.accepted.size() == 1);
  assert(summary.accepted[0].ip == "10.0.0.2");

  auto events = parse::ParseAuthEvents(kAuthLog, 10);
  assert(events.size() == 2);
  assert(events[0].time == "Oct 18 10:05:00");
  assert(events[0].type == "ssh");
  assert(events[0].message.rfind("host sshd[2]: Accepted", 0) == 0);
}

void TestAgents() {
  auto fleet = parse::ParseAgentsList("Agents:\n"
                                      "- main (default) (galactic)\n"
                                      "  Workspace: /home/u/.openclaw/workspace\n"
                                      "  Model: anthropic/claude-sonnet-4\n"
                                      "- helper\n"
                                      "  Model: gpt-4o\n");
  assert(fleet.agents.size() == 2);
  assert(fleet.agents[0].name == "main");
  assert(fleet.agents[0].is_default);
  assert(fleet.agents[0].model == "sonnet-4");
  assert(fleet.agents[0].workspace == "/home/u/.openclaw/workspace");
  assert(fleet.agents[1].name == "helper");
  assert(!fleet.agents[1].is_default);

  parse::ApplySessionTokens("│ agent:main:main     │ direct │ 2m ago │ sonnet-4 │ 12k/200k (6%) │\n"
                            "│ agent:main:cron:x   │ direct │ 5m ago │ sonnet-4 │ 3k/200k (1%)  │\n"
                            "│ agent:helper:main   │ direct │ 1h ago │ gpt-4o   │ 0k/128k (0%)  │\n",
                            fleet);
  assert(fleet.agents[0].tokens_used == 15000);
  assert(fleet.agents[0].sessions == 2);
  assert(fleet.agents[1].tokens_used == 0);
  assert(fleet.agents[1].sessions == 1);
}

void TestServiceStatus() {
  auto json = parse::ParseServiceStatus(R"({"sessions": 3, "model": "sonnet-4"})");
  assert(json.sessions == 3);
  assert(json.model == "sonnet-4");

  auto text = parse::ParseServiceStatus("Sessions: 4 active\nDefault model: opus\n");
  assert(text.sessions == 4);
  assert(text.model == "opus");
}

void TestCronList() {
  const std::string header = Pad("ID", 37) + Pad("Name", 24) + Pad("Schedule", 9) + Pad("Next", 11) + Pad("Last", 11) + Pad("Status", 20) + "Agent";
  const std::string row1   = Pad("abc-123", 37) + Pad("daily-report", 24) + Pad("0 9 * * *", 9) + Pad("in 5m", 11) + Pad("10:00", 11) + Pad("error", 20) + "main";
  const std::string row2   = Pad("def-456", 37) + Pad("backup", 24) + Pad("every 1h", 9) + Pad("in 1h", 11) + Pad("-", 11) + Pad("ok", 20) + "helper";

  auto cron = parse::ParseCronList("Doctor warnings: none\n" + header + "\n" + row1 + "\n" + row2 + "\n");
  assert(cron.jobs.size() == 2);
  assert(cron.jobs[0].name == "daily-report");
  assert(cron.jobs[0].next_run == "in 5m");
  assert(cron.jobs[0].last_run == "10:00");
  assert(cron.jobs[0].status == "error");
  assert(cron.jobs[0].agent == "main");
  assert(cron.jobs[1].name == "backup");
  assert(cron.jobs[1].last_run.empty());
  assert(cron.jobs[1].status == "ok");

  assert(parse::ParseCronList("No cron jobs.\n").jobs.empty());
}

void TestChannelsAndUpdates() {
  auto channels = parse::ParseChannels("Channels\n"
                                       "┌──────────┬─────────┬───────┬───────────────┐\n"
                                       "│ Channel  │ Enabled │ State │ Detail        │\n"
                                       "├──────────┼─────────┼───────┼───────────────┤\n"
                                       "│ telegram │ ON      │ OK    │ polling       │\n"
                                       "│ discord  │ ON      │ WARN  │ token expired │\n"
                                       "└──────────┴─────────┴───────┴───────────────┘\n"
                                       "Sessions\n"
                                       "│ agent:main │ x │ y │ z │\n");
  assert(channels.channels.size() == 2);
  assert(channels.channels[0].name == "telegram");
  assert(channels.channels[1].state == "WARN");
  assert(channels.channels[1].detail == "token expired");

  auto update = parse::ParseUpdateStatus("│ Gateway │ local · app 2026.1.30 │\n"
                                         "│ Update  │ available · npm update 2026.2.1 │\n");
  assert(update.available);
  assert(update.latest == "2026.2.1");
  assert(update.current == "2026.1.30");

  assert(!parse::ParseUpdateStatus("all good\n").available);
}

void TestEventFeeds() {
  auto json = parse::ParseSystemEvents(R"([{"time":"10:01","message":"agent started","type":"system","level":"info"},)"
                                       R"({"timestamp":"10:02","text":"cron failed","level":"error"}])",
                                       "12:34", 20);
  assert(json.size() == 2);
  assert(json[0].type == "system");
  assert(json[1].time == "10:02");
  assert(json[1].message == "cron failed");
  assert(json[1].type == "openclaw");
  assert(json[1].level == "error");

  auto plain = parse::ParseSystemEvents("event one\n\nevent two\n", "12:34", 20);
  assert(plain.size() == 2);
  assert(plain[1].time == "12:34");
  assert(plain[1].message == "event two");

  auto logs = parse::ParseServiceLogs("==> gateway.log <==\n"
                                      "2026-10-18T10:15:00Z gateway listening\n"
                                      "2026-10-18 10:16:01 ERROR request failed\n"
                                      "plain warning line\n",
                                      "12:00", 20);
  assert(logs.events.size() == 3);
  assert(logs.events[0].time == "10:15");
  assert(logs.events[0].level == "info");
  assert(logs.events[1].time == "10:16");
  assert(logs.events[1].level == "error");
  assert(logs.events[2].time == "12:00");
  assert(logs.events[2].level == "warning");

  assert(parse::DetectLevel("Connection FAILED") == "error");
  assert(parse::DetectLevel("nothing to see") == "info");
}

} // namespace

int main() {
  TestSizes();
  TestHostHealth();
  TestCpuPercent();
  TestProcessesAndNetwork();
  TestPorts();
  TestAuthLog();
  TestAgents();
  TestServiceStatus();
  TestCronList();
  TestChannelsAndUpdates();
  TestEventFeeds();

  std::cout << "cic_unit_parsers: pass\n";
  return 0;
}
