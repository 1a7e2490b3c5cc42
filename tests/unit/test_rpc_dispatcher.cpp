#include "md-server/server/RpcDispatcher.hpp"
#include "test_utils/TestFixtures.hpp"

#include <gtest/gtest.h>
#include <limits>
#include <set>
#include <stdexcept>

using json = nlohmann::json;
using namespace mdserver;
using namespace mdserver::test;

TEST_F(DispatcherTest, PingReturnsVersion) {
  auto resp = call("ping", json::object(), 7);
  EXPECT_EQ(resp["jsonrpc"], "2.0");
  EXPECT_EQ(resp["id"], 7);
  EXPECT_EQ(resp["result"]["status"], "pong");
  EXPECT_EQ(resp["result"]["version"], "0.1.0");
  EXPECT_FALSE(resp.contains("error"));
}

TEST_F(DispatcherTest, IdIsEchoedVerbatim) {
  EXPECT_EQ(call("ping", json::object(), "abc-1")["id"], "abc-1");
  EXPECT_TRUE(call("ping", json::object(), nullptr)["id"].is_null());

  json no_id = {{"jsonrpc", "2.0"}, {"method", "ping"}};
  auto resp = dispatcher_->dispatch(no_id);
  EXPECT_FALSE(resp.contains("id"));
  EXPECT_EQ(resp["result"]["status"], "pong");
}

TEST_F(DispatcherTest, StartServerScenario) {
  auto first = call("start_server", {{"structure_path", pdb_path_}});
  auto result = first["result"];
  EXPECT_EQ(result["status"], "success");
  EXPECT_EQ(result["server_id"], 38801);
  EXPECT_EQ(result["port"], 38801);
  EXPECT_EQ(result["num_atoms"], 42);
  EXPECT_EQ(result["structure_file"], pdb_path_);

  auto second = call("start_server", {{"structure_path", pdb_path_}});
  EXPECT_EQ(second["result"]["server_id"], 38802);
}

TEST_F(DispatcherTest, GetStatusAfterStart) {
  call("start_server", {{"structure_path", pdb_path_}});
  auto resp = call("get_status", {{"server_id", 38801}});
  auto result = resp["result"];

  std::string status = result["status"];
  EXPECT_TRUE(status == "running" || status == "starting") << status;
  EXPECT_EQ(result["server_id"], 38801);
  EXPECT_EQ(result["port"], 38801);
  EXPECT_EQ(result["num_atoms"], 42);
  EXPECT_EQ(result["structure_file"], pdb_path_);
  EXPECT_EQ(result["engine"], "openmm");
}

TEST_F(DispatcherTest, StartServerApplicationErrorsStayInResult) {
  auto missing = call("start_server", json::object());
  EXPECT_FALSE(missing.contains("error"));
  EXPECT_EQ(missing["result"]["status"], "error");
  EXPECT_NE(missing["result"]["error"].get<std::string>().find("structure_path"),
            std::string::npos);

  auto not_found =
      call("start_server", {{"structure_path", "/nonexistent/valid.pdb"}});
  EXPECT_EQ(not_found["result"]["status"], "error");
  EXPECT_EQ(not_found["result"]["error"],
            "Structure file not found: /nonexistent/valid.pdb");

  factory_.set_construction_error("unsupported residue HOH");
  auto construction = call("start_server", {{"structure_path", pdb_path_}});
  EXPECT_EQ(construction["result"]["status"], "error");
  EXPECT_EQ(construction["result"]["error"], "unsupported residue HOH");

  EXPECT_TRUE(call("list_servers")["result"]["servers"].empty());
}

TEST_F(DispatcherTest, StopUnknownServer) {
  auto resp = call("stop_server", {{"server_id", 99999}});
  EXPECT_FALSE(resp.contains("error"));
  EXPECT_EQ(resp["result"]["status"], "error");
  EXPECT_EQ(resp["result"]["error"], "Server 99999 not found");
}

TEST_F(DispatcherTest, GetStatusUnknownServer) {
  auto resp = call("get_status", {{"server_id", 12345}});
  EXPECT_EQ(resp["result"]["status"], "not_found");
  EXPECT_EQ(resp["result"]["server_id"], 12345);
}

TEST_F(DispatcherTest, StoppedServerIsNoLongerVisible) {
  call("start_server", {{"structure_path", pdb_path_}});
  auto stop = call("stop_server", {{"server_id", 38801}});
  EXPECT_EQ(stop["result"]["status"], "success");
  EXPECT_EQ(stop["result"]["server_id"], 38801);

  EXPECT_EQ(call("get_status", {{"server_id", 38801}})["result"]["status"],
            "not_found");
}

TEST_F(DispatcherTest, ListServers) {
  call("start_server", {{"structure_path", pdb_path_}});
  call("start_server", {{"structure_path", pdb_path_}, {"port", 39001}});

  auto resp = call("list_servers");
  EXPECT_EQ(resp["result"]["status"], "success");
  auto servers = resp["result"]["servers"];
  ASSERT_EQ(servers.size(), 2u);

  std::set<int> ports;
  for (const auto &s : servers) {
    EXPECT_EQ(s["server_id"], s["port"]);
    EXPECT_EQ(s["num_atoms"], 42);
    EXPECT_TRUE(s["running"].is_boolean());
    ports.insert(s["port"].get<int>());
  }
  EXPECT_EQ(ports, (std::set<int>{38801, 39001}));
}

TEST_F(DispatcherTest, ShutdownAllTwiceThenRefuseStart) {
  call("start_server", {{"structure_path", pdb_path_}});
  call("start_server", {{"structure_path", pdb_path_}});

  auto first = call("shutdown_all");
  EXPECT_EQ(first["result"]["status"], "success");
  EXPECT_EQ(first["result"]["message"], "Stopped 2 servers");

  auto second = call("shutdown_all");
  EXPECT_EQ(second["result"]["status"], "success");
  EXPECT_FALSE(second.contains("error"));
  EXPECT_TRUE(call("list_servers")["result"]["servers"].empty());

  auto refused = call("start_server", {{"structure_path", pdb_path_}});
  EXPECT_EQ(refused["result"]["status"], "error");
  EXPECT_EQ(refused["result"]["error"], "Server is shutting down");
  EXPECT_TRUE(call("list_servers")["result"]["servers"].empty());
}

TEST_F(DispatcherTest, UnknownMethod) {
  auto resp = call("launch_rockets");
  EXPECT_FALSE(resp.contains("result"));
  EXPECT_EQ(resp["id"], 1);
  EXPECT_EQ(resp["error"]["code"], -32601);
  EXPECT_TRUE(resp["error"]["message"].is_string());
}

TEST_F(DispatcherTest, MissingOrInvalidServerId) {
  EXPECT_EQ(call("stop_server")["error"]["code"], -32602);
  EXPECT_EQ(call("get_status")["error"]["code"], -32602);
  EXPECT_EQ(call("get_status", {{"server_id", "38801"}})["error"]["code"],
            -32602);
  EXPECT_EQ(call("stop_server", {{"server_id", 1.5}})["error"]["code"],
            -32602);
}

TEST_F(DispatcherTest, HugeUnsignedServerIdIsRejected) {
  json huge = std::numeric_limits<uint64_t>::max();
  auto status = call("get_status", {{"server_id", huge}});
  EXPECT_EQ(status["error"]["code"], -32602);
  EXPECT_FALSE(status.contains("result"));

  json above_int = static_cast<uint64_t>(std::numeric_limits<int>::max()) + 1;
  EXPECT_EQ(call("stop_server", {{"server_id", above_int}})["error"]["code"],
            -32602);
  EXPECT_EQ(call("get_status", {{"server_id", -1}})["result"]["status"],
            "not_found");
}

TEST_F(DispatcherTest, InvalidRequestShapes) {
  auto not_object = dispatcher_->dispatch(json::array({1, 2}));
  EXPECT_EQ(not_object["error"]["code"], -32600);
  EXPECT_FALSE(not_object.contains("id"));

  auto bad_method = dispatcher_->dispatch({{"id", 3}, {"method", 42}});
  EXPECT_EQ(bad_method["error"]["code"], -32600);
  EXPECT_EQ(bad_method["id"], 3);

  auto bad_params =
      dispatcher_->dispatch({{"id", 4}, {"method", "ping"}, {"params", 5}});
  EXPECT_EQ(bad_params["error"]["code"], -32602);
}

TEST_F(DispatcherTest, MissingParamsDefaultsToEmptyObject) {
  auto resp = dispatcher_->dispatch({{"id", 9}, {"method", "list_servers"}});
  EXPECT_EQ(resp["result"]["status"], "success");
}

TEST_F(DispatcherTest, ParseErrorEnvelopeHasNoId) {
  auto resp = server::RpcDispatcher::parse_error("unexpected end of input");
  EXPECT_EQ(resp["jsonrpc"], "2.0");
  EXPECT_FALSE(resp.contains("id"));
  EXPECT_EQ(resp["error"]["code"], -32700);
}

namespace {

/// Registry whose factory throws something that is not a ServerError
class ExplodingFactory : public WorkerFactory {
public:
  std::unique_ptr<Worker> create(const WorkerConfig &, uint16_t) override {
    throw std::logic_error("unreachable");
  }
};

} // namespace

TEST_F(DispatcherTest, FactoryLogicErrorIsReportedNotThrown) {
  ExplodingFactory exploding;
  WorkerRegistry registry(exploding, 38801, std::chrono::milliseconds(100));
  server::RpcDispatcher dispatcher(registry, server_config_);

  json request = {{"id", 1},
                  {"method", "start_server"},
                  {"params", {{"structure_path", pdb_path_}}}};
  json resp;
  EXPECT_NO_THROW(resp = dispatcher.dispatch(request));
  EXPECT_EQ(resp["result"]["status"], "error");
  EXPECT_EQ(resp["result"]["error"], "unreachable");
}

namespace {

struct NonStandardFault {};

/// Factory that throws a value outside the std::exception hierarchy
class ThrowingIntFactory : public WorkerFactory {
public:
  std::unique_ptr<Worker> create(const WorkerConfig &, uint16_t) override {
    throw 42;
  }
};

class FaultyAtomsWorker : public Worker {
public:
  size_t atom_count() const override { throw NonStandardFault{}; }
  uint16_t port() const override { return 0; }
  void step() override {}
  void close() override {}
};

class FaultyAtomsFactory : public WorkerFactory {
public:
  std::unique_ptr<Worker> create(const WorkerConfig &, uint16_t) override {
    return std::make_unique<FaultyAtomsWorker>();
  }
};

} // namespace

TEST_F(DispatcherTest, NonStandardFactoryThrowIsInternalError) {
  ThrowingIntFactory throwing;
  WorkerRegistry registry(throwing, 38801, std::chrono::milliseconds(100));
  server::RpcDispatcher dispatcher(registry, server_config_);

  json request = {{"id", "req-1"},
                  {"method", "start_server"},
                  {"params", {{"structure_path", pdb_path_}}}};
  json resp;
  EXPECT_NO_THROW(resp = dispatcher.dispatch(request));
  EXPECT_EQ(resp["id"], "req-1");
  EXPECT_FALSE(resp.contains("result"));
  EXPECT_EQ(resp["error"]["code"], -32603);
  EXPECT_EQ(resp["error"]["message"], "Internal error: unknown error");
  EXPECT_EQ(registry.size(), 0u);

  auto ping = dispatcher.dispatch({{"id", 2}, {"method", "ping"}});
  EXPECT_EQ(ping["result"]["status"], "pong");
}

TEST_F(DispatcherTest, NonStandardWorkerThrowIsInternalError) {
  FaultyAtomsFactory faulty;
  WorkerRegistry registry(faulty, 38801, std::chrono::milliseconds(100));
  server::RpcDispatcher dispatcher(registry, server_config_);

  json request = {{"id", 11},
                  {"method", "start_server"},
                  {"params", {{"structure_path", pdb_path_}}}};
  json resp;
  EXPECT_NO_THROW(resp = dispatcher.dispatch(request));
  EXPECT_EQ(resp["id"], 11);
  EXPECT_EQ(resp["error"]["code"], -32603);
  EXPECT_EQ(registry.size(), 0u);
}
