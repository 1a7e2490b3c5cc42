#include "md-server/server/StdioTransport.hpp"
#include "md-server/Logger.hpp"

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <istream>
#include <ostream>

using json = nlohmann::json;

namespace mdserver {
namespace server {

namespace {
constexpr int POLL_INTERVAL_MS = 100;
constexpr size_t MAX_LINE_BYTES = 1024 * 1024; // 1 MB

bool is_blank(const std::string &line) {
  return line.find_first_not_of(" \t\r\n") == std::string::npos;
}
} // namespace

StdioTransport::StdioTransport(RpcDispatcher &dispatcher,
                               WorkerRegistry &registry)
    : dispatcher_(dispatcher), registry_(registry) {}

void StdioTransport::stop() {
  if (!stop_requested_.exchange(true)) {
    LOG_INFO("TRANSPORT", "STOP", "Stop requested");
  }
}

void StdioTransport::write_response(const json &response, std::ostream &out) {
  out << response.dump(-1, ' ', false, json::error_handler_t::replace) << '\n';
  out.flush();
}

bool StdioTransport::handle_line(const std::string &line, std::ostream &out) {
  if (is_blank(line)) {
    return false;
  }

  json request;
  try {
    request = json::parse(line);
  } catch (const json::parse_error &e) {
    LOG_WARN("TRANSPORT", "PARSE", "Malformed request line: {}", e.what());
    write_response(RpcDispatcher::parse_error(e.what()), out);
    return true;
  }

  write_response(dispatcher_.dispatch(request), out);
  return true;
}

size_t StdioTransport::run(std::istream &in, std::ostream &out) {
  LOG_INFO("TRANSPORT", "LOOP", "Serving JSON-RPC on stream");
  size_t responses = 0;
  std::string line;
  while (!stop_requested() && std::getline(in, line)) {
    if (handle_line(line, out)) {
      ++responses;
    }
  }

  LOG_INFO("TRANSPORT", "LOOP", "Input closed after {} requests", responses);
  registry_.shutdown_all();
  return responses;
}

size_t StdioTransport::run(int fd, std::ostream &out) {
  LOG_INFO("TRANSPORT", "LOOP", "Serving JSON-RPC on fd {}", fd);
  size_t responses = 0;
  std::string buffer;
  bool discarding = false; // skipping the tail of an oversized line
  char chunk[4096];

  while (!stop_requested()) {
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int ret = ::poll(&pfd, 1, POLL_INTERVAL_MS);
    if (ret < 0) {
      if (errno == EINTR)
        continue;
      LOG_ERROR("TRANSPORT", "READ", "poll failed: {}", strerror(errno));
      break;
    }
    if (ret == 0)
      continue;

    ssize_t n = ::read(fd, chunk, sizeof(chunk));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN)
        continue;
      LOG_ERROR("TRANSPORT", "READ", "read failed: {}", strerror(errno));
      break;
    }
    if (n == 0) {
      // Final line without a trailing newline
      if (!discarding && handle_line(buffer, out)) {
        ++responses;
      }
      break;
    }

    buffer.append(chunk, static_cast<size_t>(n));
    size_t pos;
    while (!stop_requested() && (pos = buffer.find('\n')) != std::string::npos) {
      std::string line = buffer.substr(0, pos);
      buffer.erase(0, pos + 1);
      if (discarding) {
        discarding = false;
        continue;
      }
      if (handle_line(line, out)) {
        ++responses;
      }
    }

    if (discarding) {
      buffer.clear();
    } else if (buffer.size() > MAX_LINE_BYTES) {
      LOG_WARN("TRANSPORT", "READ", "Dropping request line over {} bytes",
               MAX_LINE_BYTES);
      write_response(RpcDispatcher::parse_error("request line too long"), out);
      ++responses;
      buffer.clear();
      discarding = true;
    }
  }

  LOG_INFO("TRANSPORT", "LOOP", "Loop finished after {} requests", responses);
  registry_.shutdown_all();
  return responses;
}

} // namespace server
} // namespace mdserver
