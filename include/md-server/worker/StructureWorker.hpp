#pragma once
#include "md-server/export.h"
#include "md-server/worker/Worker.hpp"

#include <atomic>
#include <chrono>
#include <string>

namespace mdserver {

/// Count ATOM/HETATM records in a PDB-style structure file.
/// Throws ConstructionError if the file cannot be read.
MD_SERVER_API size_t count_structure_atoms(const std::string &path);

/// Built-in worker: loads the structure file, occupies its port with a
/// listening socket on 127.0.0.1 and paces steps at a fixed interval.
class MD_SERVER_API StructureWorker : public Worker {
public:
  StructureWorker(const WorkerConfig &config, uint16_t port,
                  std::chrono::milliseconds step_interval);
  ~StructureWorker() override;

  StructureWorker(const StructureWorker &) = delete;
  StructureWorker &operator=(const StructureWorker &) = delete;

  size_t atom_count() const override { return atom_count_; }
  uint16_t port() const override { return port_; }

  void step() override;
  void close() override;

  uint64_t frames() const { return frames_.load(); }

private:
  void bind_port();

  std::string structure_path_;
  uint16_t port_;
  std::chrono::milliseconds step_interval_;
  size_t atom_count_{0};
  int listen_fd_{-1};
  std::atomic<uint64_t> frames_{0};
};

class MD_SERVER_API StructureWorkerFactory : public WorkerFactory {
public:
  explicit StructureWorkerFactory(std::chrono::milliseconds step_interval)
      : step_interval_(step_interval) {}

  std::unique_ptr<Worker> create(const WorkerConfig &config,
                                 uint16_t port) override;

private:
  std::chrono::milliseconds step_interval_;
};

} // namespace mdserver
