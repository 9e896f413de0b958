#pragma once

#include <string>

#include "config/config.pb.h"

namespace warden::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf, so unknown keys and
  mistyped values are rejected by the schema in config.proto.
*/
class ConfigLoader {
 public:
  static warden::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Path precedence: explicit path, $WARDEN_CONFIG_PATH, "config.yaml".
  // A missing file yields the defaults. Result has defaults applied and
  // is validated.
  static warden::runtime::config::RuntimeConfig Load(const std::string& explicit_path);

  static std::string ResolvePath(const std::string& explicit_path);

  static void ApplyDefaults(warden::runtime::config::RuntimeConfig* config);

  // Throws std::invalid_argument naming the offending field.
  static void Validate(const warden::runtime::config::RuntimeConfig& config);
};

} // namespace warden::config
