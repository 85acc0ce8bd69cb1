#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace cic::probe {

// Inputs shared by the concrete probes, resolved from RuntimeConfig.
struct ProbeSettings {
  std::string cli           = "openclaw";
  std::string log_dir;
  std::string auth_log_path = "/var/log/auth.log";
  std::string home;

  std::size_t top_processes = 5;
  std::size_t login_top_n   = 5;
  std::size_t log_lines     = 20;
  std::size_t event_limit   = 50;
};

} // namespace cic::probe
