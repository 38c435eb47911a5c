#pragma once

#include <string>

#include "config/config.pb.h"

namespace annoschema::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Unset compiler options are filled with their defaults.
*/
class ConfigLoader {
 public:
  static annoschema::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static annoschema::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace annoschema::config
