#include "md-server/Errors.hpp"
#include "md-server/Logger.hpp"
#include "md-server/ServerConfig.hpp"
#include "md-server/server/RpcDispatcher.hpp"
#include "md-server/server/StdioTransport.hpp"
#include "md-server/server/WorkerRegistry.hpp"
#include "md-server/worker/StructureWorker.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <unistd.h>

using namespace mdserver;

static volatile std::sig_atomic_t g_shutdown_signal = 0;

void signal_handler(int sig) { g_shutdown_signal = sig; }

void print_usage() {
  std::cerr << "Usage: md-server [options]\n\n";
  std::cerr << "Reads newline-delimited JSON-RPC requests on stdin and writes\n";
  std::cerr << "one response per line on stdout.\n\n";
  std::cerr << "Options:\n";
  std::cerr << "  --config <file>      YAML server config\n";
  std::cerr << "  --log-level <level>  trace|debug|info|warn|error\n";
  std::cerr << "  --log-file <file>    Log file (default: md_server.log)\n";
  std::cerr << "  --base-port <port>   First automatically assigned port\n";
  std::cerr << "  --mode <rpc|test>    test: print readiness and exit\n";
  std::cerr << "  -h, --help           Show this help\n";
  std::cerr << "\nMethods:\n";
  std::cerr << "  start_server  stop_server  get_status  list_servers\n";
  std::cerr << "  shutdown_all  ping\n";
}

struct CliOptions {
  std::string config_path;
  std::string log_level;
  std::string log_file;
  int base_port{0};
  std::string mode{"rpc"};
  bool help{false};
};

static bool parse_args(int argc, char **argv, CliOptions &opts) {
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    auto need_value = [&](const char *name) -> const char * {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << name << "\n";
        return nullptr;
      }
      return argv[++i];
    };

    if (arg == "--help" || arg == "-h") {
      opts.help = true;
    } else if (arg == "--config") {
      const char *v = need_value("--config");
      if (!v)
        return false;
      opts.config_path = v;
    } else if (arg == "--log-level") {
      const char *v = need_value("--log-level");
      if (!v)
        return false;
      opts.log_level = v;
    } else if (arg == "--log-file") {
      const char *v = need_value("--log-file");
      if (!v)
        return false;
      opts.log_file = v;
    } else if (arg == "--base-port") {
      const char *v = need_value("--base-port");
      if (!v)
        return false;
      try {
        opts.base_port = std::stoi(v);
      } catch (const std::exception &) {
        std::cerr << "Invalid port: " << v << "\n";
        return false;
      }
      if (opts.base_port < 1 || opts.base_port > 65535) {
        std::cerr << "Port out of range: " << v << "\n";
        return false;
      }
    } else if (arg == "--mode") {
      const char *v = need_value("--mode");
      if (!v)
        return false;
      opts.mode = v;
      if (opts.mode != "rpc" && opts.mode != "test") {
        std::cerr << "Unknown mode: " << opts.mode << "\n";
        return false;
      }
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      return false;
    }
  }
  return true;
}

int main(int argc, char **argv) {
  CliOptions opts;
  if (!parse_args(argc, argv, opts)) {
    print_usage();
    return 1;
  }
  if (opts.help) {
    print_usage();
    return 0;
  }

  ServerConfig config;
  try {
    if (!opts.config_path.empty()) {
      config = load_server_config(opts.config_path);
    }
  } catch (const ConfigError &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
  if (!opts.log_level.empty())
    config.log_level = opts.log_level;
  if (!opts.log_file.empty())
    config.log_file = opts.log_file;
  if (opts.base_port > 0)
    config.base_port = static_cast<uint16_t>(opts.base_port);

  if (opts.mode == "test") {
    nlohmann::json ready = {{"status", "bridge_ready"},
                            {"version", config.version}};
    std::cout << ready.dump() << std::endl;
    return 0;
  }

  ServerLogger::instance().init(config.log_file,
                                parse_log_level(config.log_level));
  if (!ServerLogger::instance().is_initialized()) {
    std::cerr << "Warning: logging disabled, could not open "
              << config.log_file << "\n";
  }
  LOG_INFO("MAIN", "START", "md-server {} starting (base port {})",
           config.version, config.base_port);

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);
  std::signal(SIGPIPE, SIG_IGN);

  StructureWorkerFactory factory(
      std::chrono::milliseconds(config.step_interval_ms));
  WorkerRegistry registry(factory, config.base_port,
                          std::chrono::milliseconds(config.stop_timeout_ms));
  server::RpcDispatcher dispatcher(registry, config);
  server::StdioTransport transport(dispatcher, registry);

  // Forward shutdown signals to the registry independently of the RPC loop
  std::atomic<bool> watching{true};
  std::thread signal_watcher([&]() {
    while (watching && !g_shutdown_signal) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    if (g_shutdown_signal) {
      LOG_INFO("MAIN", "SIGNAL", "Received signal {}, shutting down",
               static_cast<int>(g_shutdown_signal));
      registry.shutdown_all();
      transport.stop();
    }
  });

  size_t handled = transport.run(STDIN_FILENO, std::cout);

  watching = false;
  signal_watcher.join();
  registry.shutdown_all();

  LOG_INFO("MAIN", "STOP", "md-server exiting after {} requests", handled);
  ServerLogger::instance().shutdown();
  return 0;
}
