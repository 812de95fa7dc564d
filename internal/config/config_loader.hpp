#pragma once

#include <string>

#include "config/config.pb.h"

namespace telemetry::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static telemetry::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Same conversion for YAML already in memory (telemetryctl, tests).
  static telemetry::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace telemetry::config
