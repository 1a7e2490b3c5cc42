#include "md-server/server/WorkerRegistry.hpp"
#include "md-server/Errors.hpp"
#include "md-server/Logger.hpp"

namespace mdserver {

WorkerRegistry::WorkerRegistry(WorkerFactory &factory, uint16_t base_port,
                               std::chrono::milliseconds stop_timeout)
    : factory_(factory), stop_timeout_(stop_timeout), ports_(base_port) {}

WorkerRegistry::~WorkerRegistry() { shutdown_all(); }

WorkerStatus WorkerRegistry::snapshot(const WorkerRecord &record) {
  WorkerStatus status;
  status.server_id = record.server_id;
  status.port = record.port;
  status.atom_count = record.atom_count;
  status.structure_file = record.config.structure_path;
  status.engine = record.config.engine;
  status.state = record.supervisor->state();
  status.steps_completed = record.supervisor->steps_completed();
  return status;
}

WorkerStatus WorkerRegistry::start(const WorkerConfig &config) {
  config.check_structure_file();

  uint16_t port = 0;
  {
    std::lock_guard lock(mutex_);
    if (shutting_down_) {
      throw ShuttingDownError();
    }
    // Explicit ports are taken as given and do not advance the allocator
    port = config.port ? *config.port : ports_.next();
  }

  LOG_INFO("REGISTRY", "START", "Creating server on port {} from {}", port,
           config.structure_path);

  // Construction may load a large structure file: never under the lock
  std::unique_ptr<Worker> worker;
  size_t atom_count = 0;
  try {
    worker = factory_.create(config, port);
    if (!worker) {
      throw ConstructionError("Worker factory returned no worker");
    }
    atom_count = worker->atom_count();
  } catch (const ConstructionError &e) {
    LOG_ERROR("REGISTRY", "START", "Failed to construct server on port {}: {}",
              port, e.what());
    throw;
  } catch (const std::exception &e) {
    LOG_ERROR("REGISTRY", "START", "Failed to construct server on port {}: {}",
              port, e.what());
    throw ConstructionError(e.what());
  } catch (...) {
    LOG_ERROR("REGISTRY", "START",
              "Failed to construct server on port {}: unknown error", port);
    throw;
  }

  const int server_id = port;
  auto supervisor = std::make_shared<WorkerSupervisor>(
      server_id, std::move(worker), config.steps, shutdown_token_);

  WorkerStatus status;
  std::shared_ptr<WorkerSupervisor> displaced;
  bool refused = false;
  {
    std::lock_guard lock(mutex_);
    if (shutting_down_) {
      refused = true;
    } else {
      auto it = records_.find(server_id);
      if (it != records_.end()) {
        LOG_WARN("REGISTRY", "START",
                 "Port {} already registered, stopping previous server",
                 port);
        displaced = it->second.supervisor;
        displaced->request_stop();
        records_.erase(it);
      }

      WorkerRecord record{server_id, port, config, atom_count, supervisor};
      supervisor->start();
      status = snapshot(record);
      records_.emplace(server_id, std::move(record));
    }
  }

  if (refused) {
    // Shutdown began while the worker was being built: close it and refuse
    supervisor->request_stop();
    supervisor->start();
    finish_stop(supervisor);
    LOG_WARN("REGISTRY", "START",
             "Refused server on port {}: shutdown in progress", port);
    throw ShuttingDownError();
  }

  if (displaced) {
    finish_stop(displaced);
  }

  LOG_INFO("REGISTRY", "START", "Server {} started with {} atoms", server_id,
           atom_count);
  return status;
}

void WorkerRegistry::finish_stop(
    const std::shared_ptr<WorkerSupervisor> &supervisor) {
  if (!supervisor->join_with_timeout(stop_timeout_)) {
    LOG_WARN("REGISTRY", "STOP",
             "Server {} is still stepping; it will close after its current "
             "step",
             supervisor->server_id());
  }
}

bool WorkerRegistry::stop(int server_id) {
  std::shared_ptr<WorkerSupervisor> supervisor;
  {
    std::lock_guard lock(mutex_);
    auto it = records_.find(server_id);
    if (it == records_.end()) {
      return false;
    }
    supervisor = it->second.supervisor;
    supervisor->request_stop();
    records_.erase(it);
  }

  LOG_INFO("REGISTRY", "STOP", "Stopping server {}", server_id);
  finish_stop(supervisor);
  LOG_INFO("REGISTRY", "STOP", "Removed server {}", server_id);
  return true;
}

std::optional<WorkerStatus> WorkerRegistry::status(int server_id) const {
  std::lock_guard lock(mutex_);
  auto it = records_.find(server_id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return snapshot(it->second);
}

std::vector<WorkerStatus> WorkerRegistry::list() const {
  std::lock_guard lock(mutex_);
  std::vector<WorkerStatus> statuses;
  statuses.reserve(records_.size());
  for (const auto &[id, record] : records_) {
    statuses.push_back(snapshot(record));
  }
  return statuses;
}

size_t WorkerRegistry::shutdown_all() {
  std::vector<int> ids;
  {
    std::lock_guard lock(mutex_);
    if (!shutting_down_) {
      shutting_down_ = true;
      shutdown_token_.cancel();
      LOG_INFO("REGISTRY", "SHUTDOWN", "Shutting down {} servers",
               records_.size());
    }
    ids.reserve(records_.size());
    for (const auto &[id, _] : records_) {
      ids.push_back(id);
    }
  }

  size_t stopped = 0;
  for (int id : ids) {
    // Another caller may have removed it already; that is not an error
    if (stop(id)) {
      ++stopped;
    }
  }
  return stopped;
}

bool WorkerRegistry::is_shutting_down() const {
  std::lock_guard lock(mutex_);
  return shutting_down_;
}

size_t WorkerRegistry::size() const {
  std::lock_guard lock(mutex_);
  return records_.size();
}

} // namespace mdserver
