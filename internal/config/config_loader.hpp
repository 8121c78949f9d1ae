#pragma once

#include <string>

#include "config/config.pb.h"

namespace graphvc::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf.
  Unknown keys are rejected, as are values the loader can tell are
  unusable (empty backend locations, unknown log levels or exporters,
  negative tolerances, sample ratios outside [0, 1]).
*/
class ConfigLoader {
 public:
  static graphvc::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static graphvc::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // memory backend, default diff thresholds
  static graphvc::runtime::config::RuntimeConfig Defaults();
};

} // namespace graphvc::config
