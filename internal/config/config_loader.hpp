#pragma once

#include <string>

#include "config/config.pb.h"

namespace mediaflow::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected so a misspelled knob fails at startup instead of silently
  falling back to its default.
*/
class ConfigLoader {
 public:
  static mediaflow::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static mediaflow::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml_text);
};

} // namespace mediaflow::config
