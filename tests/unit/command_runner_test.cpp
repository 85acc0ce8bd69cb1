#include "internal/probe/command_runner.hpp"

#include <cassert>
#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>

namespace {

using namespace std::chrono_literals;

using cic::probe::CommandFailure;
using cic::probe::ProbeErrorCode;
using cic::probe::RunCommand;
using cic::probe::RunShell;

void TestCapturesStdoutAndExitCode() {
  auto r = RunCommand({"echo", "hello"}, 2000ms);
  assert(r.Ok());
  assert(r.exit_code == 0);
  assert(r.out == "hello\n");

  auto failing = RunShell("echo oops >&2; exit 3", 2000ms);
  assert(!failing.Ok());
  assert(failing.exit_code == 3);
  assert(failing.err == "oops\n");
  assert(CommandFailure(failing, "sh").code == ProbeErrorCode::kCommandFailed);
}

void TestMissingBinaryIsUnavailable() {
  auto r = RunCommand({"cic-definitely-not-installed"}, 2000ms);
  assert(r.exit_code == 127);
  assert(CommandFailure(r, "missing").code == ProbeErrorCode::kUnavailable);
}

void TestTimeoutKillsChild() {
  const auto start = std::chrono::steady_clock::now();
  auto       r     = RunCommand({"sleep", "5"}, 300ms);
  const auto took  = std::chrono::steady_clock::now() - start;

  assert(r.timed_out);
  assert(!r.Ok());
  assert(took < 3s);
  assert(CommandFailure(r, "sleep").code == ProbeErrorCode::kTimeout);
}

void TestReadTextFile() {
  assert(!cic::probe::ReadTextFile("/nonexistent/cic/file").has_value());
  auto self = cic::probe::ReadTextFile("/proc/self/stat");
  assert(self.has_value() && !self->empty());
}

// children only see their own stdio, never the pipes of a command running
// on another thread
void TestConcurrentChildrenDoNotInheritPipes() {
  auto baseline = RunCommand({"ls", "/proc/self/fd"}, 2000ms);
  assert(baseline.Ok());

  std::thread sibling([] {
    auto r = RunCommand({"sleep", "1"}, 5000ms);
    assert(r.Ok());
  });
  std::this_thread::sleep_for(200ms);

  auto during = RunCommand({"ls", "/proc/self/fd"}, 2000ms);
  sibling.join();

  assert(during.Ok());
  assert(std::count(during.out.begin(), during.out.end(), '\n') == std::count(baseline.out.begin(), baseline.out.end(), '\n'));
}

} // namespace

int main() {
  TestCapturesStdoutAndExitCode();
  TestMissingBinaryIsUnavailable();
  TestTimeoutKillsChild();
  TestReadTextFile();
  TestConcurrentChildrenDoNotInheritPipes();

  std::cout << "cic_unit_command_runner: pass\n";
  return 0;
}
