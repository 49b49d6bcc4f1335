#pragma once

#include <string>

#include "config/config.pb.h"

namespace kinship::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unknown keys are rejected.
*/
class ConfigLoader {
 public:
  static kinship::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Same conversion for YAML already in memory.
  static kinship::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);
};

} // namespace kinship::config
