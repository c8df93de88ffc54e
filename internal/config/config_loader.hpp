#pragma once

#include <string>

#include "config/config.pb.h"

namespace twingraph::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so unknown
  keys are rejected the same way protobuf JSON parsing rejects them.
*/
class ConfigLoader {
 public:
  static twingraph::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static twingraph::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace twingraph::config
