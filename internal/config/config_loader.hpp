#pragma once

#include <string>

#include "config/config.pb.h"

namespace satp::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Defaults are filled in and the result validated before it is
  returned, so callers never see a half-configured gateway.
*/
class ConfigLoader {
 public:
  static satp::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static satp::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  static void ApplyDefaults(satp::runtime::config::RuntimeConfig& config);
  static void Validate(const satp::runtime::config::RuntimeConfig& config);
};

} // namespace satp::config
