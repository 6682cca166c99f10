#pragma once

#include <string>

#include "config/config.pb.h"

namespace flowcheck::config {

/*
  Loads FlowConfig from a YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Defaults are applied and the result validated before it is
  returned; violations throw util::InvalidConfig.
*/
class ConfigLoader {
 public:
  static FlowConfig LoadFromYaml(const std::string& path);
  static FlowConfig LoadFromYamlString(const std::string& text);

  // Configuration used when no file is given.
  static FlowConfig Defaults();

  static void ApplyDefaults(FlowConfig& config);
  static void Validate(const FlowConfig& config);
};

} // namespace flowcheck::config
