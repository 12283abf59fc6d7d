#pragma once

#include <string>

#include "config/config.pb.h"

namespace expiringdict::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so the YAML keys
  are the proto field names and unknown keys are rejected.
*/
class ConfigLoader {
 public:
  static expiringdict::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static expiringdict::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace expiringdict::config
