#pragma once

#include <functional>
#include <string>

#include "config/config.pb.h"

namespace mintgate::config {

using EnvLookup = std::function<const char*(const char*)>;

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf (unknown fields are
  rejected). Defaults are filled in, then MINTGATE_* environment variables
  override individual fields. The result is validated and never changes
  afterwards.
*/
class ConfigLoader {
 public:
  static mintgate::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static mintgate::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path, const EnvLookup& env);

  // Parses YAML text only: no defaults, no environment.
  static mintgate::runtime::config::RuntimeConfig ParseYaml(const std::string& yaml_text);

  static void ApplyDefaults(mintgate::runtime::config::RuntimeConfig* config);
  static void ApplyEnvironment(mintgate::runtime::config::RuntimeConfig* config, const EnvLookup& env);

  // Throws std::runtime_error describing the first invalid field.
  static void Validate(const mintgate::runtime::config::RuntimeConfig& config);
};

} // namespace mintgate::config
