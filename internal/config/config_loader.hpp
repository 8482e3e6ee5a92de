#pragma once

#include <string>

#include "config/config.pb.h"

namespace vidpipe::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Fields left unset are filled by ApplyDefaults().
*/
class ConfigLoader {
 public:
  static vidpipe::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(vidpipe::runtime::config::RuntimeConfig& config);
};

} // namespace vidpipe::config
