#pragma once

#include <string>

#include "config/config.pb.h"

namespace registry::config {

/*
  Loads RuntimeConfig from a YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Fields the file leaves unset keep their Defaults() value.
*/
class ConfigLoader {
 public:
  static registry::runtime::config::RuntimeConfig Defaults();

  static registry::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // PORT, ORIGIN and REGISTRY_DB_PATH override the loaded values.
  static void ApplyEnvironment(registry::runtime::config::RuntimeConfig& config);

  // Throws std::runtime_error describing the first invalid setting.
  static void Validate(const registry::runtime::config::RuntimeConfig& config);
};

} // namespace registry::config
