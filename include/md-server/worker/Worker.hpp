#pragma once
#include "md-server/worker/WorkerConfig.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>

namespace mdserver {

/// A running simulation unit bound to one port.
///
/// step() and close() are only ever called from the worker's own supervisor
/// thread. Both may throw; the supervisor logs and contains the failure.
class Worker {
public:
  virtual ~Worker() = default;

  /// Number of atoms loaded from the structure file
  virtual size_t atom_count() const = 0;

  /// Port this worker serves on
  virtual uint16_t port() const = 0;

  /// Advance the simulation by one step
  virtual void step() = 0;

  /// Release the port and any engine resources
  virtual void close() = 0;
};

/// Constructs workers from a validated configuration.
///
/// create() may be slow (it loads the structure file) and is always called
/// outside the registry lock. It throws on failure.
class WorkerFactory {
public:
  virtual ~WorkerFactory() = default;

  virtual std::unique_ptr<Worker> create(const WorkerConfig &config,
                                         uint16_t port) = 0;
};

} // namespace mdserver
