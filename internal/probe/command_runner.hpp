#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "probe.hpp"

namespace cic::probe {

struct CommandResult {
  int         exit_code = -1;
  bool        timed_out = false;
  std::string out;
  std::string err;

  bool Ok() const {
    return !timed_out && exit_code == 0;
  }
};

/*
  Runs an external command without a shell.

  The child gets its own process group; on timeout the whole group is killed
  and `timed_out` is set. exit_code 127 means the binary was not found.
*/
CommandResult RunCommand(const std::vector<std::string>& args, std::chrono::milliseconds timeout);

// `/bin/sh -c <script>`; only for fixed pipelines, never for caller input.
CommandResult RunShell(const std::string& script, std::chrono::milliseconds timeout);

// Maps a failed command onto the probe error taxonomy.
ProbeResult CommandFailure(const CommandResult& result, std::string_view what);

// Whole file, or nullopt when it cannot be opened.
std::optional<std::string> ReadTextFile(const std::string& path);

} // namespace cic::probe
