#pragma once

#include <string>

#include "config/config.pb.h"

namespace scavenger::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Quoted scalars always stay strings.
*/
class ConfigLoader {
 public:
  static scavenger::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static scavenger::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Throws util::InvalidInput on the first semantic problem found.
  static void Validate(const scavenger::runtime::config::RuntimeConfig& config);
};

} // namespace scavenger::config
