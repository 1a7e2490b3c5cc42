#pragma once
#include "md-server/ServerConfig.hpp"
#include "md-server/export.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace mdserver {

/// Validated start_server parameters. Immutable once a worker is created.
struct WorkerConfig {
  std::string structure_path;
  std::string engine;
  double temperature{0.0};
  double timestep{0.0};
  std::optional<uint64_t> steps; // no budget when empty
  std::optional<uint16_t> port;  // allocated when empty

  /// Build from start_server params, filling gaps from the server defaults.
  /// Throws ConfigError naming the offending field.
  static WorkerConfig from_json(const nlohmann::json &params,
                                const ServerConfig &server_config);

  /// Check that the structure file exists. Throws ConfigError otherwise.
  void check_structure_file() const;
};

} // namespace mdserver
