#include "internal/runtime/refresh_orchestrator.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_metrics_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/model/sources.hpp"

namespace {

using namespace std::chrono_literals;

using cic::cache::TieredCache;
using cic::probe::FunctionProbe;
using cic::probe::ProbeDescriptor;
using cic::probe::ProbeResult;
using cic::runtime::RefreshOrchestrator;
using cic::scheduler::CollectionScheduler;

namespace model   = cic::model;
namespace sources = cic::model::sources;

std::shared_ptr<cic::probe::Probe> MakeProbe(const std::string& name, std::chrono::seconds ttl, FunctionProbe::Fn fn,
                                             std::chrono::milliseconds timeout = 3000ms) {
  ProbeDescriptor d;
  d.name    = name;
  d.ttl     = ttl;
  d.timeout = timeout;
  return std::make_shared<FunctionProbe>(d, std::move(fn));
}

bool WaitFor(const std::function<bool()>& done, std::chrono::milliseconds limit) {
  const auto deadline = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < deadline) {
    if (done()) return true;
    std::this_thread::sleep_for(20ms);
  }
  return done();
}

std::vector<std::shared_ptr<cic::probe::Probe>> TroubledHost() {
  std::vector<std::shared_ptr<cic::probe::Probe>> probes;

  probes.push_back(MakeProbe(sources::kServerHealth, 30s, [] {
    model::ServerHealth h;
    h.cpu_percent  = 95.0;
    h.mem_percent  = 50.0;
    h.disk_percent = 85.0;
    return ProbeResult::Ok(h);
  }));

  probes.push_back(MakeProbe(sources::kCronJobs, 120s, [] {
    model::CronJobs cron;
    cron.jobs.push_back({"nightly", "error", "2026-10-18 03:00", "", "main"});
    cron.jobs.push_back({"hourly", "ok", "", "", "main"});
    return ProbeResult::Ok(cron);
  }));

  probes.push_back(MakeProbe(sources::kSecurityStatus, 300s, [] {
    model::SecurityStatus sec;
    sec.ssh_intrusions  = 60;
    sec.listening_ports = 10;
    sec.expected_ports  = 4;
    return ProbeResult::Ok(sec);
  }));

  probes.push_back(MakeProbe(sources::kUpdateStatus, 300s, [] {
    model::UpdateStatus update;
    update.available = true;
    update.latest    = "2026.2.1";
    return ProbeResult::Ok(update);
  }));

  probes.push_back(MakeProbe(sources::kChannelsStatus, 300s, [] {
    model::ChannelList list;
    list.channels.push_back({"discord", "ON", "WARN", "token expired"});
    list.channels.push_back({"telegram", "ON", "OK", "polling"});
    return ProbeResult::Ok(list);
  }));

  probes.push_back(MakeProbe(sources::kSshLoginSummary, 300s, [] {
    model::SshLoginSummary ssh;
    ssh.failed.push_back({"203.0.113.9", 7, "Oct 18 10:00:02"});
    ssh.failed.push_back({"192.0.2.1", 2, "Oct 18 10:00:05"});
    return ProbeResult::Ok(ssh);
  }));

  probes.push_back(MakeProbe(sources::kOpenclawLogs, 120s, [] {
    model::EventLog log;
    log.events.push_back({"10:16", "ERROR request failed", "openclaw", "error"});
    log.events.push_back({"10:17", "gateway listening", "openclaw", "info"});
    return ProbeResult::Ok(log);
  }));

  return probes;
}

std::shared_ptr<cic::trend::TrendEngine> OpenTrends(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "cic_refresh_orchestrator_tests";
  std::filesystem::create_directories(dir);

  const auto path = dir / (test_name + ".db");
  for (const char* suffix : {"", "-wal", "-shm"}) std::filesystem::remove(path.string() + suffix);

  auto db = std::make_shared<cic::db::sqlite::SqliteDB>(path.string());
  cic::db::sqlite::BootstrapSchema(*db);
  return std::make_shared<cic::trend::TrendEngine>(std::make_shared<cic::db::sqlite::SqliteMetricsRepository>(db));
}

void TestRunCyclePublishesDerivedSnapshot() {
  auto cache     = std::make_shared<TieredCache>();
  auto scheduler = std::make_shared<CollectionScheduler>(TroubledHost(), cache, nullptr, nullptr, 900s);

  RefreshOrchestrator orchestrator(scheduler, cache, OpenTrends("derived"), 30s);

  assert(orchestrator.Snapshot() == nullptr);
  assert(!orchestrator.LastRefreshAge(cic::util::Now()).has_value());

  auto report = orchestrator.RunCycle(true);
  assert(report.failed.empty());
  assert(orchestrator.CyclesCompleted() == 1);

  auto snap = orchestrator.Snapshot();
  assert(snap != nullptr);
  assert(snap->entries.size() == 7);
  assert(snap->Get<model::ServerHealth>(sources::kServerHealth)->cpu_percent == 95.0);
  assert(snap->Get<model::CronJobs>(sources::kServerHealth) == nullptr);
  assert(snap->Get<model::ServerHealth>("missing") == nullptr);

  // no history yet
  assert(snap->server_trends.cpu.arrow == cic::trend::TrendArrow::kNoData);
  assert(snap->tokens_per_hour.at(cic::trend::kTotalKey) == 0);

  assert(snap->errors.size() == 3);
  assert(snap->errors[0].type == "cron");
  assert(snap->errors[0].time == "03:00");
  assert(snap->errors[0].message == "nightly: delivery failed");
  assert(snap->errors[1].type == "ssh");
  assert(snap->errors[1].time == "10:00");
  assert(snap->errors[1].message == "7 failed attempts from 203.0.113.9");
  assert(snap->errors[2].message == "ERROR request failed");

  assert(snap->actions.size() == 7);
  assert(snap->actions[0].severity == "error" && snap->actions[0].text == "nightly cron failed");
  assert(snap->actions[1].text == "60 SSH intrusion attempts");
  assert(snap->actions[2].text == "10 listening ports (expected ~4)");
  assert(snap->actions[3].text == "OpenClaw update: 2026.2.1");
  assert(snap->actions[4].text == "discord: token expired");
  assert(snap->actions[5].text == "Disk usage: 85%");
  assert(snap->actions[6].text == "CPU usage: 95%");

  auto age = orchestrator.LastRefreshAge(snap->published_at + 5s);
  assert(age.has_value() && *age == 5s);

  // readers keep the snapshot they hold
  orchestrator.RunCycle(true);
  auto next = orchestrator.Snapshot();
  assert(next != snap);
  assert(snap->entries.size() == 7);
}

void TestForceRefreshAppliesToNextCycle() {
  std::atomic<int> slow_calls{0};

  auto cache = std::make_shared<TieredCache>();
  std::vector<std::shared_ptr<cic::probe::Probe>> probes;
  probes.push_back(MakeProbe("slow_tier", 3600s, [&] {
    slow_calls.fetch_add(1);
    return ProbeResult::Ok(model::UpdateStatus{});
  }));
  auto scheduler = std::make_shared<CollectionScheduler>(std::move(probes), cache, nullptr, nullptr, 900s);

  RefreshOrchestrator orchestrator(scheduler, cache, nullptr, 1s);
  orchestrator.Start();

  assert(WaitFor([&] { return orchestrator.CyclesCompleted() >= 2; }, 5s));
  assert(slow_calls.load() == 1);
  assert(orchestrator.Snapshot() != nullptr);

  orchestrator.ForceRefresh();
  const auto cycles = orchestrator.CyclesCompleted();
  assert(WaitFor([&] { return orchestrator.CyclesCompleted() >= cycles + 2; }, 5s));
  assert(slow_calls.load() == 2);

  orchestrator.Stop();
  const auto stopped_at = orchestrator.CyclesCompleted();
  std::this_thread::sleep_for(1200ms);
  assert(orchestrator.CyclesCompleted() == stopped_at);

  orchestrator.Stop();
}

void TestTicksMissedDuringLongCycleAreSkipped() {
  auto cache = std::make_shared<TieredCache>();
  std::vector<std::shared_ptr<cic::probe::Probe>> probes;
  probes.push_back(MakeProbe("sluggish", 1s, [] {
    std::this_thread::sleep_for(1500ms);
    return ProbeResult::Ok(model::ProcessList{});
  }));
  auto scheduler = std::make_shared<CollectionScheduler>(std::move(probes), cache, nullptr, nullptr, 900s);

  RefreshOrchestrator orchestrator(scheduler, cache, nullptr, 1s);
  orchestrator.Start();

  assert(WaitFor([&] { return orchestrator.CyclesCompleted() >= 1; }, 5s));
  orchestrator.Stop();

  assert(orchestrator.TicksSkipped() >= 1);
}

} // namespace

int main() {
  TestRunCyclePublishesDerivedSnapshot();
  TestForceRefreshAppliesToNextCycle();
  TestTicksMissedDuringLongCycleAreSkipped();

  std::cout << "cic_unit_refresh_orchestrator: pass\n";
  return 0;
}
