#pragma once

#include <string>

#include "config/config.pb.h"

namespace relations::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Unset fields are filled from built-in defaults, then the
  result is validated.
*/
class ConfigLoader {
 public:
  static relations::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static relations::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Config used when no file is given: in-memory backend, default limits.
  static relations::runtime::config::RuntimeConfig Defaults();

  static void ApplyDefaults(relations::runtime::config::RuntimeConfig& config);

  // Throws std::invalid_argument on inconsistent settings.
  static void Validate(const relations::runtime::config::RuntimeConfig& config);
};

} // namespace relations::config
