#pragma once

#include <string>

#include "config/config.pb.h"

namespace finq::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so field names and
  enum spellings follow config.proto. Unknown fields are rejected.
  Missing settings are filled with defaults before validation.
*/
class ConfigLoader {
 public:
  static finq::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static finq::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(finq::runtime::config::RuntimeConfig& config);

  // Throws util::InvalidArgument.
  static void Validate(const finq::runtime::config::RuntimeConfig& config);
};

} // namespace finq::config
