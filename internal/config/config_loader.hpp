#pragma once

#include <string>

#include "config/config.pb.h"

namespace shortener::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static shortener::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Rejects values the service cannot run with. Throws std::runtime_error.
  static void Validate(const shortener::runtime::config::RuntimeConfig& config);
};

} // namespace shortener::config
