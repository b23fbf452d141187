#pragma once

#include <string>

#include "config/config.pb.h"

namespace swarm::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Defaults are applied and the result validated before return.
*/
class ConfigLoader {
 public:
  static swarm::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static swarm::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Fills every unset (zero) field with its documented default.
  static void ApplyDefaults(swarm::runtime::config::RuntimeConfig* config);

  // Throws util::InvalidConfig.
  static void Validate(const swarm::runtime::config::RuntimeConfig& config);
};

} // namespace swarm::config
