#pragma once

#include <string>

#include "config/config.pb.h"

namespace fleet::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected; unset values are filled by ApplyDefaults().
*/
class ConfigLoader {
 public:
  static fleet::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Configuration used when no file is given.
  static fleet::runtime::config::RuntimeConfig Defaults();

  static void ApplyDefaults(fleet::runtime::config::RuntimeConfig* config);
};

} // namespace fleet::config
