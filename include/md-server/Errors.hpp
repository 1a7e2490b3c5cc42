#pragma once
#include <stdexcept>
#include <string>

namespace mdserver {

/// Base for every application-level failure the registry reports.
class ServerError : public std::runtime_error {
public:
  explicit ServerError(const std::string &message)
      : std::runtime_error(message) {}
};

/// Missing or invalid worker configuration. No worker is created.
class ConfigError : public ServerError {
public:
  using ServerError::ServerError;
};

/// The automatic port counter ran past the valid port range.
class PortExhaustedError : public ServerError {
public:
  using ServerError::ServerError;
};

/// The worker collaborator failed to initialize.
class ConstructionError : public ServerError {
public:
  using ServerError::ServerError;
};

/// start was requested after shutdown began.
class ShuttingDownError : public ServerError {
public:
  ShuttingDownError() : ServerError("Server is shutting down") {}
};

/// Request-level failure with a JSON-RPC error code.
class ProtocolError : public std::runtime_error {
public:
  ProtocolError(int code, const std::string &message)
      : std::runtime_error(message), code_(code) {}

  int code() const noexcept { return code_; }

private:
  int code_;
};

} // namespace mdserver
