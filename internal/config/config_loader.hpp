#pragma once

#include <string>

#include "config/config.pb.h"

namespace pgshadow::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Failures throw util::ConfigError.
*/
class ConfigLoader {
 public:
  static pgshadow::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static pgshadow::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace pgshadow::config
