#include "md-server/ServerConfig.hpp"
#include "md-server/Errors.hpp"
#include "md-server/Logger.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <fstream>
#include <limits>
#include <sstream>
#include <yaml-cpp/yaml.h>

using json = nlohmann::json;

namespace mdserver {

namespace {

json node_to_json(const YAML::Node &node) {
  if (node.IsNull()) {
    return nullptr;
  } else if (node.IsScalar()) {
    // Quoted scalars carry the "!" tag and always stay strings
    if (node.Tag() == "!") {
      return node.as<std::string>();
    }
    try {
      return node.as<int64_t>();
    } catch (const YAML::BadConversion &) {
    }
    try {
      return node.as<double>();
    } catch (const YAML::BadConversion &) {
    }
    try {
      return node.as<bool>();
    } catch (const YAML::BadConversion &) {
    }
    return node.as<std::string>();
  } else if (node.IsSequence()) {
    json arr = json::array();
    for (const auto &item : node) {
      arr.push_back(node_to_json(item));
    }
    return arr;
  } else if (node.IsMap()) {
    json obj = json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = node_to_json(kv.second);
    }
    return obj;
  }
  return nullptr;
}

template <typename T>
void read_field(const json &j, const char *key, T &out) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null())
    return;
  try {
    out = it->get<T>();
  } catch (const json::exception &e) {
    throw ConfigError(fmt::format("Invalid config value for '{}': {}", key,
                                  e.what()));
  }
}

uint16_t read_port(const json &j, const char *key, uint16_t fallback) {
  int64_t value = fallback;
  read_field(j, key, value);
  if (value < 1 || value > std::numeric_limits<uint16_t>::max()) {
    throw ConfigError(fmt::format("'{}' must be in 1..65535, got {}", key,
                                  value));
  }
  return static_cast<uint16_t>(value);
}

uint32_t read_millis(const json &j, const char *key, uint32_t fallback) {
  int64_t value = fallback;
  read_field(j, key, value);
  if (value < 0 || value > std::numeric_limits<uint32_t>::max()) {
    throw ConfigError(fmt::format("'{}' must be a non-negative number of "
                                  "milliseconds, got {}",
                                  key, value));
  }
  return static_cast<uint32_t>(value);
}

} // namespace

json yaml_to_json(const std::string &yaml_text) {
  try {
    return node_to_json(YAML::Load(yaml_text));
  } catch (const YAML::Exception &e) {
    throw ConfigError(std::string("Invalid YAML: ") + e.what());
  }
}

ServerConfig server_config_from_json(const json &j) {
  ServerConfig config;
  if (j.is_null())
    return config;
  if (!j.is_object()) {
    throw ConfigError("Server config must be a mapping");
  }

  read_field(j, "log_file", config.log_file);
  read_field(j, "log_level", config.log_level);
  read_field(j, "version", config.version);
  config.stop_timeout_ms =
      read_millis(j, "stop_timeout_ms", config.stop_timeout_ms);
  config.step_interval_ms =
      read_millis(j, "step_interval_ms", config.step_interval_ms);
  config.base_port = read_port(j, "base_port", config.base_port);

  auto defaults = j.find("defaults");
  if (defaults != j.end() && !defaults->is_null()) {
    if (!defaults->is_object()) {
      throw ConfigError("'defaults' must be a mapping");
    }
    read_field(*defaults, "engine", config.defaults.engine);
    read_field(*defaults, "temperature", config.defaults.temperature);
    read_field(*defaults, "timestep", config.defaults.timestep);
  }

  read_field(j, "engines", config.engines);
  if (config.engines.empty()) {
    throw ConfigError("'engines' must list at least one engine");
  }
  if (std::find(config.engines.begin(), config.engines.end(),
                config.defaults.engine) == config.engines.end()) {
    throw ConfigError(fmt::format("Default engine '{}' is not in engines",
                                  config.defaults.engine));
  }
  if (!(config.defaults.temperature > 0.0)) {
    throw ConfigError("'defaults.temperature' must be positive");
  }
  if (!(config.defaults.timestep > 0.0)) {
    throw ConfigError("'defaults.timestep' must be positive");
  }
  return config;
}

ServerConfig load_server_config(const std::string &path) {
  std::ifstream ifs(path);
  if (!ifs) {
    throw ConfigError("Cannot open config file: " + path);
  }
  std::stringstream buffer;
  buffer << ifs.rdbuf();

  ServerConfig config = server_config_from_json(yaml_to_json(buffer.str()));
  LOG_INFO("CONFIG", "LOAD", "Loaded server config from {}", path);
  return config;
}

} // namespace mdserver
