#pragma once
#include "md-server/export.h"
#include "md-server/server/PortAllocator.hpp"
#include "md-server/server/WorkerSupervisor.hpp"
#include "md-server/worker/Worker.hpp"
#include "md-server/worker/WorkerConfig.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mdserver {

/// Snapshot of one registered worker
struct WorkerStatus {
  int server_id{0};
  uint16_t port{0};
  size_t atom_count{0};
  std::string structure_file;
  std::string engine;
  WorkerState state{WorkerState::Starting};
  uint64_t steps_completed{0};

  bool running() const { return state != WorkerState::Stopped; }
};

/// Authoritative table of workers and port allocation state.
///
/// Every operation takes the registry mutex for its map/counter access only.
/// Worker construction and supervisor joins happen outside the lock.
class MD_SERVER_API WorkerRegistry {
public:
  WorkerRegistry(WorkerFactory &factory, uint16_t base_port,
                 std::chrono::milliseconds stop_timeout);
  ~WorkerRegistry();

  WorkerRegistry(const WorkerRegistry &) = delete;
  WorkerRegistry &operator=(const WorkerRegistry &) = delete;

  /// Construct, register and start a worker.
  /// Throws ConfigError, PortExhaustedError, ShuttingDownError or
  /// ConstructionError; on any of them nothing is registered. A factory throw
  /// that is not a std::exception is rethrown unchanged.
  WorkerStatus start(const WorkerConfig &config);

  /// Stop and deregister. Returns false if `server_id` is unknown.
  bool stop(int server_id);

  std::optional<WorkerStatus> status(int server_id) const;

  /// All registered workers, in no particular order
  std::vector<WorkerStatus> list() const;

  /// Refuse further starts and stop every registered worker. Idempotent.
  /// Returns the number of workers this call stopped.
  size_t shutdown_all();

  bool is_shutting_down() const;
  size_t size() const;

private:
  struct WorkerRecord {
    int server_id;
    uint16_t port;
    WorkerConfig config;
    size_t atom_count;
    std::shared_ptr<WorkerSupervisor> supervisor;
  };

  static WorkerStatus snapshot(const WorkerRecord &record);
  void finish_stop(const std::shared_ptr<WorkerSupervisor> &supervisor);

  WorkerFactory &factory_;
  std::chrono::milliseconds stop_timeout_;
  CancellationToken shutdown_token_;

  mutable std::mutex mutex_;
  std::map<int, WorkerRecord> records_;
  PortAllocator ports_;
  bool shutting_down_{false};
};

} // namespace mdserver
