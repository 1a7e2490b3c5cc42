#include "md-server/server/JsonRpc.hpp"

using json = nlohmann::json;

namespace mdserver {
namespace server {

namespace {

json envelope(const RpcId &id) {
  json resp = json::object();
  resp["jsonrpc"] = "2.0";
  if (id) {
    resp["id"] = *id;
  }
  return resp;
}

} // namespace

json make_result(const RpcId &id, json result) {
  json resp = envelope(id);
  resp["result"] = std::move(result);
  return resp;
}

json make_error(const RpcId &id, int code, const std::string &message) {
  json resp = envelope(id);
  resp["error"] = {{"code", code}, {"message", message}};
  return resp;
}

} // namespace server
} // namespace mdserver
