#pragma once

#include <string>

#include "config/config.pb.h"

namespace cic::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Fields left at zero or
  empty are filled from the built-in defaults.
*/
class ConfigLoader {
 public:
  static cic::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Built-in defaults, used when no config file is given.
  static cic::runtime::config::RuntimeConfig Defaults();

  static void ApplyDefaults(cic::runtime::config::RuntimeConfig& config);

  // "~/x" -> "$HOME/x"
  static std::string ExpandHome(const std::string& path);
};

} // namespace cic::config
