#pragma once
#include "md-server/export.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#ifndef MD_SERVER_VERSION
#define MD_SERVER_VERSION "0.1.0"
#endif

namespace mdserver {

/// Defaults applied to start_server parameters the caller leaves out
struct WorkerDefaults {
  std::string engine{"openmm"};
  double temperature{300.0}; // Kelvin
  double timestep{2.0};      // femtoseconds
};

/// Process-wide settings, loaded from YAML and overridden by the command line
struct ServerConfig {
  std::string log_file{"md_server.log"};
  std::string log_level{"info"};
  std::string version{MD_SERVER_VERSION};
  uint16_t base_port{38801};
  uint32_t stop_timeout_ms{2000};
  uint32_t step_interval_ms{10};
  WorkerDefaults defaults;
  std::vector<std::string> engines{"openmm", "ase"};
};

/// Decode a config object. Missing keys keep their defaults; a key with the
/// wrong type throws ConfigError.
MD_SERVER_API ServerConfig server_config_from_json(const nlohmann::json &j);

/// Load a YAML config file. Throws ConfigError if it cannot be read.
MD_SERVER_API ServerConfig load_server_config(const std::string &path);

/// Convert a YAML document into the equivalent JSON value
MD_SERVER_API nlohmann::json yaml_to_json(const std::string &yaml_text);

} // namespace mdserver
