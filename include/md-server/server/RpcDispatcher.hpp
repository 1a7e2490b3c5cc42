#pragma once
#include "md-server/ServerConfig.hpp"
#include "md-server/export.h"
#include "md-server/server/JsonRpc.hpp"
#include "md-server/server/WorkerRegistry.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace mdserver {
namespace server {

/// Turns one parsed JSON-RPC request into one response envelope.
///
/// Carries no state between requests apart from the registry. Never throws:
/// any unexpected exception becomes an InternalError envelope.
class MD_SERVER_API RpcDispatcher {
public:
  RpcDispatcher(WorkerRegistry &registry, const ServerConfig &config);

  nlohmann::json dispatch(const nlohmann::json &request);

  /// Envelope for a line that failed to parse (no id is available)
  static nlohmann::json parse_error(const std::string &detail);

private:
  nlohmann::json handle_start_server(const nlohmann::json &params);
  nlohmann::json handle_stop_server(const nlohmann::json &params);
  nlohmann::json handle_get_status(const nlohmann::json &params);
  nlohmann::json handle_list_servers(const nlohmann::json &params);
  nlohmann::json handle_shutdown_all(const nlohmann::json &params);
  nlohmann::json handle_ping(const nlohmann::json &params);

  WorkerRegistry &registry_;
  ServerConfig config_;
};

} // namespace server
} // namespace mdserver
