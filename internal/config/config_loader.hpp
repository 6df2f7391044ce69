#pragma once

#include <string>

#include "config/config.pb.h"

namespace catalog::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf, so unknown keys
  and type mismatches are rejected by the protobuf JSON parser.
*/
class ConfigLoader {
 public:
  static catalog::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
};

} // namespace catalog::config
