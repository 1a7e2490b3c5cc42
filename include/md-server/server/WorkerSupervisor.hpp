#pragma once
#include "md-server/export.h"
#include "md-server/worker/Worker.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace mdserver {

enum class WorkerState { Starting, Running, Stopped };

MD_SERVER_API const char *to_string(WorkerState state);

/// Shared cooperative cancellation flag. Copies observe the same flag.
class CancellationToken {
public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() const { flag_->store(true, std::memory_order_release); }
  bool is_cancelled() const {
    return flag_->load(std::memory_order_acquire);
  }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

/// Drives one worker on its own thread.
///
/// The thread marks the worker Running, steps it until the budget is spent or
/// either token is cancelled (checked between steps, never mid-step), then
/// closes the worker exactly once and marks it Stopped. Any failure in step()
/// or close() is logged and ends the loop; it never leaves the thread.
class MD_SERVER_API WorkerSupervisor
    : public std::enable_shared_from_this<WorkerSupervisor> {
public:
  WorkerSupervisor(int server_id, std::unique_ptr<Worker> worker,
                   std::optional<uint64_t> step_budget,
                   CancellationToken shutdown_token);
  ~WorkerSupervisor();

  WorkerSupervisor(const WorkerSupervisor &) = delete;
  WorkerSupervisor &operator=(const WorkerSupervisor &) = delete;

  /// Spawn the supervisor thread. The thread keeps this object alive.
  void start();

  /// Ask the loop to exit before its next step. Non-blocking, idempotent.
  void request_stop();

  /// Wait until the worker has been closed. Returns false on timeout.
  bool wait_for_exit(std::chrono::milliseconds timeout);

  /// Join the thread if it has exited within `timeout`, otherwise detach it
  /// so the caller is not held by a step that never returns.
  bool join_with_timeout(std::chrono::milliseconds timeout);

  WorkerState state() const { return state_.load(std::memory_order_acquire); }
  bool is_alive() const { return state() != WorkerState::Stopped; }
  uint64_t steps_completed() const { return steps_completed_.load(); }
  int server_id() const { return server_id_; }

private:
  void run_loop();
  void mark_exited();

  int server_id_;
  std::unique_ptr<Worker> worker_;
  std::optional<uint64_t> step_budget_;
  CancellationToken stop_token_;
  CancellationToken shutdown_token_;

  std::atomic<WorkerState> state_{WorkerState::Starting};
  std::atomic<uint64_t> steps_completed_{0};

  std::mutex exit_mutex_;
  std::condition_variable exit_cv_;
  bool exited_{false};

  std::thread thread_;
};

} // namespace mdserver
