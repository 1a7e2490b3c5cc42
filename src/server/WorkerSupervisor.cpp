#include "md-server/server/WorkerSupervisor.hpp"
#include "md-server/Logger.hpp"

#include <string>

namespace mdserver {

const char *to_string(WorkerState state) {
  switch (state) {
  case WorkerState::Starting:
    return "starting";
  case WorkerState::Running:
    return "running";
  case WorkerState::Stopped:
    return "stopped";
  }
  return "unknown";
}

WorkerSupervisor::WorkerSupervisor(int server_id,
                                   std::unique_ptr<Worker> worker,
                                   std::optional<uint64_t> step_budget,
                                   CancellationToken shutdown_token)
    : server_id_(server_id), worker_(std::move(worker)),
      step_budget_(step_budget), shutdown_token_(std::move(shutdown_token)) {}

WorkerSupervisor::~WorkerSupervisor() {
  if (thread_.joinable()) {
    // The last reference may be dropped by the supervisor thread itself
    if (thread_.get_id() == std::this_thread::get_id()) {
      thread_.detach();
    } else {
      thread_.join();
    }
  }
}

void WorkerSupervisor::start() {
  auto self = shared_from_this();
  thread_ = std::thread([self]() { self->run_loop(); });
}

void WorkerSupervisor::request_stop() { stop_token_.cancel(); }

bool WorkerSupervisor::wait_for_exit(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(exit_mutex_);
  return exit_cv_.wait_for(lock, timeout, [this]() { return exited_; });
}

bool WorkerSupervisor::join_with_timeout(std::chrono::milliseconds timeout) {
  bool exited = wait_for_exit(timeout);
  if (!thread_.joinable()) {
    return exited;
  }
  if (exited) {
    thread_.join();
  } else {
    LOG_ERROR("SUPERVISOR", "STOP",
              "Server {} did not exit within {}ms, detaching", server_id_,
              timeout.count());
    thread_.detach();
  }
  return exited;
}

void WorkerSupervisor::mark_exited() {
  state_.store(WorkerState::Stopped, std::memory_order_release);
  {
    std::lock_guard<std::mutex> lock(exit_mutex_);
    exited_ = true;
  }
  exit_cv_.notify_all();
}

void WorkerSupervisor::run_loop() {
  state_.store(WorkerState::Running, std::memory_order_release);
  LOG_INFO("SUPERVISOR", "RUN", "Server {} running on port {}", server_id_,
           worker_->port());

  std::string reason;
  try {
    while (true) {
      if (stop_token_.is_cancelled()) {
        reason = "stop requested";
        break;
      }
      if (shutdown_token_.is_cancelled()) {
        reason = "shutdown";
        break;
      }
      if (step_budget_ && steps_completed_.load() >= *step_budget_) {
        reason = "step budget exhausted";
        break;
      }
      worker_->step();
      steps_completed_.fetch_add(1);
    }
  } catch (const std::exception &e) {
    reason = std::string("step failed: ") + e.what();
    LOG_ERROR("SUPERVISOR", "STEP", "Server {} failed after {} steps: {}",
              server_id_, steps_completed_.load(), e.what());
  } catch (...) {
    reason = "step failed: unknown error";
    LOG_ERROR("SUPERVISOR", "STEP",
              "Server {} failed after {} steps with an unknown error",
              server_id_, steps_completed_.load());
  }

  try {
    worker_->close();
  } catch (const std::exception &e) {
    LOG_WARN("SUPERVISOR", "CLOSE", "Error closing server {}: {}", server_id_,
             e.what());
  } catch (...) {
    LOG_WARN("SUPERVISOR", "CLOSE", "Unknown error closing server {}",
             server_id_);
  }

  mark_exited();
  LOG_INFO("SUPERVISOR", "EXIT", "Server {} stopped ({}) after {} steps",
           server_id_, reason, steps_completed_.load());
}

} // namespace mdserver
