#include "internal/cache/tiered_cache.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;

using cic::cache::TieredCache;
using cic::model::Bundle;
using cic::model::ProcessList;
using cic::model::ServerHealth;

ServerHealth Health(double cpu) {
  ServerHealth h;
  h.cpu_percent = cpu;
  return h;
}

void TestAbsentEntryIsDueAndFallsBack() {
  TieredCache cache;
  const auto  now = cic::util::Now();

  assert(!cache.Get("server_health").has_value());
  assert(cache.IsDue("server_health", 30s, now));

  auto fallback = cache.GetOr("server_health", Health(-1.0));
  assert(std::get<ServerHealth>(fallback).cpu_percent == -1.0);
}

void TestFreshnessFollowsTtl() {
  TieredCache cache;
  const auto  t0 = cic::util::Now();

  cache.Put("server_health", Health(12.5), t0);

  assert(!cache.IsDue("server_health", 30s, t0));
  assert(!cache.IsDue("server_health", 30s, t0 + 29s));
  assert(cache.IsDue("server_health", 30s, t0 + 30s));
  assert(cache.IsDue("server_health", 30s, t0 + 5min));

  // stale entries are still served
  auto entry = cache.Get("server_health");
  assert(entry.has_value());
  assert(entry->collected_at == t0);
  assert(std::get<ServerHealth>(*entry->bundle).cpu_percent == 12.5);
}

void TestPutReplacesWithoutTouchingHeldBundle() {
  TieredCache cache;
  const auto  t0 = cic::util::Now();

  cache.Put("server_health", Health(1.0), t0);
  auto held = cache.Get("server_health");

  cache.Put("server_health", Health(2.0), t0 + 1s);

  assert(std::get<ServerHealth>(*held->bundle).cpu_percent == 1.0);
  assert(std::get<ServerHealth>(*cache.Get("server_health")->bundle).cpu_percent == 2.0);
  assert(cache.Entries().size() == 1);
}

void TestConcurrentReadersSeeWholeBundles() {
  TieredCache cache;
  const auto  t0 = cic::util::Now();
  cache.Put("top_processes", ProcessList{}, t0);

  std::thread writer([&] {
    for (int i = 0; i < 500; ++i) {
      ProcessList list;
      list.processes.resize(static_cast<std::size_t>(i % 7));
      for (auto& p : list.processes) p.pid = std::to_string(i);
      cache.Put("top_processes", std::move(list), t0 + std::chrono::seconds(i));
    }
  });

  std::vector<std::thread> readers;
  for (int r = 0; r < 4; ++r) {
    readers.emplace_back([&] {
      for (int i = 0; i < 500; ++i) {
        auto entry = cache.Get("top_processes");
        assert(entry.has_value());
        const auto& list = std::get<ProcessList>(*entry->bundle);
        for (const auto& p : list.processes) assert(p.pid == list.processes.front().pid);
      }
    });
  }

  writer.join();
  for (auto& t : readers) t.join();
}

} // namespace

int main() {
  TestAbsentEntryIsDueAndFallsBack();
  TestFreshnessFollowsTtl();
  TestPutReplacesWithoutTouchingHeldBundle();
  TestConcurrentReadersSeeWholeBundles();

  std::cout << "cic_unit_tiered_cache: pass\n";
  return 0;
}
