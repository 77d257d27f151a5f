#pragma once

#include <string>

#include "config/config.pb.h"

namespace cirrus::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown fields are
  rejected. Unset limits and sections receive their defaults.
*/
class ConfigLoader {
 public:
  static cirrus::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static cirrus::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(cirrus::runtime::config::RuntimeConfig& config);
};

} // namespace cirrus::config
