#include "md-server/server/RpcDispatcher.hpp"
#include "md-server/Errors.hpp"
#include "md-server/Logger.hpp"

#include <limits>

using json = nlohmann::json;

namespace mdserver {
namespace server {

namespace {

int require_server_id(const json &params) {
  auto it = params.find("server_id");
  if (it == params.end() || it->is_null()) {
    throw ProtocolError(static_cast<int>(RpcErrorCode::InvalidParams),
                        "Missing required parameter: server_id");
  }
  if (!it->is_number_integer()) {
    throw ProtocolError(static_cast<int>(RpcErrorCode::InvalidParams),
                        "server_id must be an integer");
  }
  // Unsigned values above INT64_MAX would wrap through get<int64_t>()
  bool out_of_range =
      it->is_number_unsigned()
          ? it->get<uint64_t>() >
                static_cast<uint64_t>(std::numeric_limits<int>::max())
          : (it->get<int64_t>() < std::numeric_limits<int>::min() ||
             it->get<int64_t>() > std::numeric_limits<int>::max());
  if (out_of_range) {
    throw ProtocolError(static_cast<int>(RpcErrorCode::InvalidParams),
                        "server_id out of range");
  }
  int64_t id = it->get<int64_t>();
  return static_cast<int>(id);
}

} // namespace

RpcDispatcher::RpcDispatcher(WorkerRegistry &registry,
                             const ServerConfig &config)
    : registry_(registry), config_(config) {}

json RpcDispatcher::parse_error(const std::string &detail) {
  return make_error(std::nullopt, RpcErrorCode::ParseError,
                    "Parse error: " + detail);
}

json RpcDispatcher::dispatch(const json &request) {
  if (!request.is_object()) {
    return make_error(std::nullopt, RpcErrorCode::InvalidRequest,
                      "Invalid Request: expected a JSON object");
  }

  RpcId id;
  auto id_it = request.find("id");
  if (id_it != request.end()) {
    id = *id_it;
  }

  std::string method;
  try {
    auto method_it = request.find("method");
    if (method_it == request.end() || !method_it->is_string()) {
      throw ProtocolError(static_cast<int>(RpcErrorCode::InvalidRequest),
                          "Invalid Request: method must be a string");
    }
    method = method_it->get<std::string>();

    json params = json::object();
    auto params_it = request.find("params");
    if (params_it != request.end() && !params_it->is_null()) {
      if (!params_it->is_object()) {
        throw ProtocolError(static_cast<int>(RpcErrorCode::InvalidParams),
                            "params must be an object");
      }
      params = *params_it;
    }

    LOG_DEBUG("RPC", "REQUEST", "Method: {}", method);

    json result;
    if (method == "start_server") {
      result = handle_start_server(params);
    } else if (method == "stop_server") {
      result = handle_stop_server(params);
    } else if (method == "get_status") {
      result = handle_get_status(params);
    } else if (method == "list_servers") {
      result = handle_list_servers(params);
    } else if (method == "shutdown_all") {
      result = handle_shutdown_all(params);
    } else if (method == "ping") {
      result = handle_ping(params);
    } else {
      throw ProtocolError(static_cast<int>(RpcErrorCode::MethodNotFound),
                          "Method not found: " + method);
    }
    return make_result(id, std::move(result));
  } catch (const ProtocolError &e) {
    LOG_WARN("RPC", "REQUEST", "Rejected {}: {}", method, e.what());
    return make_error(id, e.code(), e.what());
  } catch (const std::exception &e) {
    LOG_ERROR("RPC", "REQUEST", "Unexpected failure in {}: {}", method,
              e.what());
    return make_error(id, RpcErrorCode::InternalError,
                      std::string("Internal error: ") + e.what());
  } catch (...) {
    LOG_ERROR("RPC", "REQUEST", "Unexpected non-standard failure in {}",
              method);
    return make_error(id, RpcErrorCode::InternalError,
                      "Internal error: unknown error");
  }
}

json RpcDispatcher::handle_start_server(const json &params) {
  try {
    WorkerConfig config = WorkerConfig::from_json(params, config_);
    WorkerStatus status = registry_.start(config);
    return {{"status", "success"},
            {"server_id", status.server_id},
            {"port", status.port},
            {"num_atoms", status.atom_count},
            {"structure_file", status.structure_file}};
  } catch (const ServerError &e) {
    LOG_WARN("RPC", "START", "start_server failed: {}", e.what());
    return {{"status", "error"}, {"error", e.what()}};
  }
}

json RpcDispatcher::handle_stop_server(const json &params) {
  int server_id = require_server_id(params);
  if (!registry_.stop(server_id)) {
    return {{"status", "error"},
            {"error", fmt::format("Server {} not found", server_id)}};
  }
  return {{"status", "success"}, {"server_id", server_id}};
}

json RpcDispatcher::handle_get_status(const json &params) {
  int server_id = require_server_id(params);
  auto status = registry_.status(server_id);
  if (!status) {
    return {{"status", "not_found"}, {"server_id", server_id}};
  }
  return {{"status", to_string(status->state)},
          {"server_id", status->server_id},
          {"port", status->port},
          {"num_atoms", status->atom_count},
          {"structure_file", status->structure_file},
          {"engine", status->engine},
          {"steps_completed", status->steps_completed}};
}

json RpcDispatcher::handle_list_servers(const json &) {
  json servers = json::array();
  for (const auto &status : registry_.list()) {
    servers.push_back({{"server_id", status.server_id},
                       {"port", status.port},
                       {"num_atoms", status.atom_count},
                       {"running", status.running()},
                       {"structure_file", status.structure_file}});
  }
  return {{"status", "success"}, {"servers", std::move(servers)}};
}

json RpcDispatcher::handle_shutdown_all(const json &) {
  size_t stopped = registry_.shutdown_all();
  return {{"status", "success"},
          {"message", fmt::format("Stopped {} servers", stopped)}};
}

json RpcDispatcher::handle_ping(const json &) {
  return {{"status", "pong"}, {"version", config_.version}};
}

} // namespace server
} // namespace mdserver
