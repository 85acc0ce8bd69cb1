#pragma once

#include <stdexcept>
#include <string>

namespace cic::util {

/*
  Central error types.

  Probe failures never use these; they travel as ProbeResult values.
*/

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace cic::util
