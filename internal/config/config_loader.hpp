#pragma once

#include <string>

#include "config/config.pb.h"

namespace faucet::config {

/*
  Loads RuntimeConfig from YAML and FAUCET_* environment variables.

  YAML is converted to JSON, with scalars typed after the matching protobuf
  field, then parsed into the message with unknown fields rejected.
  Environment variables override file values. Defaults fill what neither sets.
*/
class ConfigLoader {
 public:
  static faucet::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static faucet::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
  static faucet::runtime::config::RuntimeConfig LoadFromEnvironment();

  static void ApplyDefaults(faucet::runtime::config::RuntimeConfig& config);

  // Throws util::ConfigError naming every problem found.
  static void Validate(const faucet::runtime::config::RuntimeConfig& config);
};

} // namespace faucet::config
