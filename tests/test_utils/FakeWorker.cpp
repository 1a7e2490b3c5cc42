#include "FakeWorker.hpp"
#include "md-server/Errors.hpp"

#include <stdexcept>
#include <thread>

namespace mdserver {
namespace test {

FakeWorker::FakeWorker(uint16_t port, size_t atoms,
                       std::shared_ptr<FakeWorkerProbe> probe,
                       std::chrono::milliseconds step_delay)
    : port_(port), atoms_(atoms), probe_(std::move(probe)),
      step_delay_(step_delay) {}

void FakeWorker::step() {
  if (probe_->fail_step) {
    throw std::runtime_error("integrator diverged");
  }
  while (probe_->hold_step) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  std::this_thread::sleep_for(step_delay_);
  probe_->steps.fetch_add(1);
}

void FakeWorker::close() {
  probe_->closes.fetch_add(1);
  if (probe_->fail_close) {
    throw std::runtime_error("socket already closed");
  }
}

std::unique_ptr<Worker> FakeWorkerFactory::create(const WorkerConfig &,
                                                  uint16_t port) {
  std::chrono::milliseconds delay;
  {
    std::lock_guard lock(mutex_);
    delay = construct_delay_;
  }
  if (delay.count() > 0) {
    std::this_thread::sleep_for(delay);
  }

  std::lock_guard lock(mutex_);
  if (!construction_error_.empty()) {
    throw ConstructionError(construction_error_);
  }
  if (!generic_failure_.empty()) {
    throw std::runtime_error(generic_failure_);
  }
  auto probe = std::make_shared<FakeWorkerProbe>();
  probes_[port] = probe;
  ++created_;
  return std::make_unique<FakeWorker>(port, atoms_, probe, step_delay_);
}

void FakeWorkerFactory::set_atom_count(size_t atoms) {
  std::lock_guard lock(mutex_);
  atoms_ = atoms;
}

void FakeWorkerFactory::set_construction_error(const std::string &message) {
  std::lock_guard lock(mutex_);
  construction_error_ = message;
}

void FakeWorkerFactory::set_generic_failure(const std::string &message) {
  std::lock_guard lock(mutex_);
  generic_failure_ = message;
}

void FakeWorkerFactory::set_construct_delay(std::chrono::milliseconds delay) {
  std::lock_guard lock(mutex_);
  construct_delay_ = delay;
}

void FakeWorkerFactory::set_step_delay(std::chrono::milliseconds delay) {
  std::lock_guard lock(mutex_);
  step_delay_ = delay;
}

std::shared_ptr<FakeWorkerProbe> FakeWorkerFactory::probe(uint16_t port) const {
  std::lock_guard lock(mutex_);
  auto it = probes_.find(port);
  return it == probes_.end() ? nullptr : it->second;
}

size_t FakeWorkerFactory::created() const {
  std::lock_guard lock(mutex_);
  return created_;
}

} // namespace test
} // namespace mdserver
