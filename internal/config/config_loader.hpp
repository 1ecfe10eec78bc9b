#pragma once

#include <string>

#include "config/config.pb.h"

namespace epicflow::config {

/*
  Loads RuntimeConfig from a YAML file or string.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Throws std::runtime_error on any failure.
*/
class ConfigLoader {
 public:
  static epicflow::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static epicflow::runtime::config::RuntimeConfig ParseYaml(const std::string& yaml);
};

} // namespace epicflow::config
