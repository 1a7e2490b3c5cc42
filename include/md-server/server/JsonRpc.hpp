#pragma once
#include "md-server/export.h"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace mdserver {
namespace server {

/// JSON-RPC 2.0 error codes
enum class RpcErrorCode : int {
  ParseError = -32700,
  InvalidRequest = -32600,
  MethodNotFound = -32601,
  InvalidParams = -32602,
  InternalError = -32603,
};

/// Request id, echoed verbatim. Empty when the request carried none.
using RpcId = std::optional<nlohmann::json>;

/// {"jsonrpc":"2.0","id":<id>,"result":<result>}
MD_SERVER_API nlohmann::json make_result(const RpcId &id,
                                         nlohmann::json result);

/// {"jsonrpc":"2.0","id":<id>,"error":{"code":<code>,"message":<message>}}
MD_SERVER_API nlohmann::json make_error(const RpcId &id, int code,
                                        const std::string &message);

inline nlohmann::json make_error(const RpcId &id, RpcErrorCode code,
                                 const std::string &message) {
  return make_error(id, static_cast<int>(code), message);
}

} // namespace server
} // namespace mdserver
