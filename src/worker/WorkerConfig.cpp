#include "md-server/worker/WorkerConfig.hpp"
#include "md-server/Errors.hpp"

#include <algorithm>
#include <filesystem>
#include <fmt/format.h>
#include <fmt/ranges.h>

using json = nlohmann::json;

namespace mdserver {

namespace {

double read_positive(const json &params, const char *key, double fallback) {
  auto it = params.find(key);
  if (it == params.end() || it->is_null())
    return fallback;
  if (!it->is_number()) {
    throw ConfigError(fmt::format("'{}' must be a number", key));
  }
  double value = it->get<double>();
  if (!(value > 0.0)) {
    throw ConfigError(fmt::format("'{}' must be positive, got {}", key, value));
  }
  return value;
}

} // namespace

WorkerConfig WorkerConfig::from_json(const json &params,
                                     const ServerConfig &server_config) {
  if (!params.is_object()) {
    throw ConfigError("params must be an object");
  }

  WorkerConfig config;

  auto path = params.find("structure_path");
  if (path == params.end() || path->is_null()) {
    throw ConfigError("Missing required parameter: structure_path");
  }
  if (!path->is_string() || path->get<std::string>().empty()) {
    throw ConfigError("'structure_path' must be a non-empty string");
  }
  config.structure_path = path->get<std::string>();

  config.engine = server_config.defaults.engine;
  auto engine = params.find("engine");
  if (engine != params.end() && !engine->is_null()) {
    if (!engine->is_string()) {
      throw ConfigError("'engine' must be a string");
    }
    config.engine = engine->get<std::string>();
  }
  const auto &engines = server_config.engines;
  if (std::find(engines.begin(), engines.end(), config.engine) ==
      engines.end()) {
    throw ConfigError(fmt::format("Unsupported engine '{}' (expected one of: {})",
                                  config.engine, fmt::join(engines, ", ")));
  }

  config.temperature =
      read_positive(params, "temperature", server_config.defaults.temperature);
  config.timestep =
      read_positive(params, "timestep", server_config.defaults.timestep);

  auto steps = params.find("steps");
  if (steps != params.end() && !steps->is_null()) {
    if (!steps->is_number_integer() || steps->get<int64_t>() < 0) {
      throw ConfigError("'steps' must be a non-negative integer");
    }
    config.steps = steps->get<uint64_t>();
  }

  auto port = params.find("port");
  if (port != params.end() && !port->is_null()) {
    if (!port->is_number_integer()) {
      throw ConfigError("'port' must be an integer");
    }
    int64_t value = port->get<int64_t>();
    if (value < 1 || value > 65535) {
      throw ConfigError(fmt::format("'port' must be in 1..65535, got {}", value));
    }
    config.port = static_cast<uint16_t>(value);
  }

  return config;
}

void WorkerConfig::check_structure_file() const {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(structure_path, ec)) {
    throw ConfigError("Structure file not found: " + structure_path);
  }
}

} // namespace mdserver
