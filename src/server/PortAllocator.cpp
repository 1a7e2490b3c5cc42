#include "md-server/server/PortAllocator.hpp"
#include "md-server/Errors.hpp"

#include <fmt/format.h>

namespace mdserver {

namespace {
constexpr uint32_t MAX_PORT = 65535;
} // namespace

uint16_t PortAllocator::next() {
  if (next_port_ > MAX_PORT) {
    throw PortExhaustedError(
        fmt::format("No ports left to assign (next would be {})", next_port_));
  }
  return static_cast<uint16_t>(next_port_++);
}

} // namespace mdserver
