#pragma once

#include <string>

#include "config/config.pb.h"

namespace reel::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. The returned config has defaults applied and is validated.
*/
class ConfigLoader {
 public:
  static reel::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Same as LoadFromYaml for an in-memory document.
  static reel::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

// Fills every unset field with its documented default.
void ApplyDefaults(reel::runtime::config::RuntimeConfig& config);

// Throws std::runtime_error describing the first invalid setting.
void Validate(const reel::runtime::config::RuntimeConfig& config);

} // namespace reel::config
