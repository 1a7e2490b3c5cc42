#pragma once
#include "md-server/export.h"

#include <cstdint>

namespace mdserver {

/// Hands out monotonically increasing ports. Ports are never reused, even
/// after the worker holding one stops.
///
/// Not synchronized: callers serialize next() with registry mutation.
class MD_SERVER_API PortAllocator {
public:
  explicit PortAllocator(uint16_t base_port) : next_port_(base_port) {}

  /// Return the next port and advance. Throws PortExhaustedError once the
  /// counter passes 65535.
  uint16_t next();

  /// Next port that would be handed out
  uint32_t peek() const { return next_port_; }

private:
  uint32_t next_port_;
};

} // namespace mdserver
