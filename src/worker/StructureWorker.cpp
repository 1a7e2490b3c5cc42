#include "md-server/worker/StructureWorker.hpp"
#include "md-server/Errors.hpp"
#include "md-server/Logger.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fmt/format.h>
#include <fstream>
#include <thread>

namespace mdserver {

namespace {
constexpr int BACKLOG = 8;
} // namespace

size_t count_structure_atoms(const std::string &path) {
  std::ifstream ifs(path);
  if (!ifs) {
    throw ConstructionError("Cannot open structure file: " + path);
  }

  size_t atoms = 0;
  std::string line;
  while (std::getline(ifs, line)) {
    if (line.compare(0, 4, "ATOM") == 0 || line.compare(0, 6, "HETATM") == 0) {
      ++atoms;
    }
  }
  return atoms;
}

StructureWorker::StructureWorker(const WorkerConfig &config, uint16_t port,
                                 std::chrono::milliseconds step_interval)
    : structure_path_(config.structure_path), port_(port),
      step_interval_(step_interval) {
  atom_count_ = count_structure_atoms(structure_path_);
  if (atom_count_ == 0) {
    throw ConstructionError("No atoms found in structure file: " +
                            structure_path_);
  }
  bind_port();

  LOG_INFO("WORKER", "INIT",
           "Loaded {} atoms from {} (engine={}, T={}K, dt={}fs) on port {}",
           atom_count_, structure_path_, config.engine, config.temperature,
           config.timestep, port_);
}

StructureWorker::~StructureWorker() {
  if (listen_fd_ >= 0) {
    ::close(listen_fd_);
  }
}

void StructureWorker::bind_port() {
  listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
  if (listen_fd_ < 0) {
    throw ConstructionError(
        fmt::format("Failed to create socket: {}", strerror(errno)));
  }

  int opt = 1;
  setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  struct sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = inet_addr("127.0.0.1");
  addr.sin_port = htons(port_);

  if (bind(listen_fd_, reinterpret_cast<struct sockaddr *>(&addr),
           sizeof(addr)) < 0 ||
      listen(listen_fd_, BACKLOG) < 0) {
    int err = errno;
    ::close(listen_fd_);
    listen_fd_ = -1;
    throw ConstructionError(
        fmt::format("Failed to bind port {}: {}", port_, strerror(err)));
  }
}

void StructureWorker::step() {
  std::this_thread::sleep_for(step_interval_);
  frames_.fetch_add(1);
}

void StructureWorker::close() {
  if (listen_fd_ < 0)
    return;
  shutdown(listen_fd_, SHUT_RDWR);
  if (::close(listen_fd_) < 0) {
    int err = errno;
    listen_fd_ = -1;
    throw std::runtime_error(
        fmt::format("close on port {} failed: {}", port_, strerror(err)));
  }
  listen_fd_ = -1;
  LOG_DEBUG("WORKER", "CLOSE", "Released port {} after {} frames", port_,
            frames_.load());
}

std::unique_ptr<Worker>
StructureWorkerFactory::create(const WorkerConfig &config, uint16_t port) {
  return std::make_unique<StructureWorker>(config, port, step_interval_);
}

} // namespace mdserver
