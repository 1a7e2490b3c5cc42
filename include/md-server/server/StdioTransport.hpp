#pragma once
#include "md-server/export.h"
#include "md-server/server/RpcDispatcher.hpp"
#include "md-server/server/WorkerRegistry.hpp"

#include <atomic>
#include <iosfwd>
#include <string>

namespace mdserver {
namespace server {

/// Line-delimited JSON-RPC loop.
///
/// One request per input line, one response line per request, flushed before
/// the next line is read. A malformed line produces a ParseError response and
/// the loop carries on. When input ends or stop() is called the registry is
/// shut down before run() returns.
class MD_SERVER_API StdioTransport {
public:
  StdioTransport(RpcDispatcher &dispatcher, WorkerRegistry &registry);

  /// Serve lines from a stream. Returns the number of responses written.
  size_t run(std::istream &in, std::ostream &out);

  /// Serve lines from a file descriptor, polling so that stop() is noticed
  /// while no input arrives. Returns the number of responses written.
  size_t run(int fd, std::ostream &out);

  /// Ask the loop to exit. Safe to call from any thread or repeatedly.
  void stop();
  bool stop_requested() const { return stop_requested_.load(); }

  /// Handle one input line. Returns false if the line was blank.
  bool handle_line(const std::string &line, std::ostream &out);

private:
  void write_response(const nlohmann::json &response, std::ostream &out);

  RpcDispatcher &dispatcher_;
  WorkerRegistry &registry_;
  std::atomic<bool> stop_requested_{false};
};

} // namespace server
} // namespace mdserver
