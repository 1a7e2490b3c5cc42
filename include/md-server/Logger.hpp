#pragma once
#include "md-server/export.h"

#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace mdserver {

/// Centralized logging with component and action context.
///
/// stdout carries the JSON-RPC stream, so the console sink writes to stderr.
/// Until init() is called every log call is a no-op.
class MD_SERVER_API ServerLogger {
public:
  static ServerLogger &instance();

  // Initialize with file and console sinks
  void init(const std::string &log_file = "md_server.log",
            spdlog::level::level_enum level = spdlog::level::info) {
    std::lock_guard<std::mutex> lock(mutex_);

    // If already initialized, just update level
    if (logger_) {
      logger_->set_level(level);
      logger_->flush_on(level);
      return;
    }

    try {
      auto console_sink =
          std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      console_sink->set_level(spdlog::level::info);

      auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          log_file, 1024 * 1024 * 10, 3); // 10MB, 3 files
      file_sink->set_level(spdlog::level::trace);

      std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
      logger_ = std::make_shared<spdlog::logger>("md-server", sinks.begin(),
                                                 sinks.end());
      logger_->set_level(level);
      logger_->flush_on(level);

      if (!spdlog::get("md-server")) {
        spdlog::register_logger(logger_);
      }
    } catch (const spdlog::spdlog_ex &ex) {
      if (std::string(ex.what()).find("already exists") == std::string::npos) {
        fmt::print(stderr, "Log initialization failed: {}\n", ex.what());
      }
    }
  }

  // Drop the logger so a later init() recreates the sinks (used by tests).
  void shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) {
      logger_->flush();
    }
    spdlog::drop("md-server");
    logger_.reset();
  }

  bool is_initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return logger_ != nullptr;
  }

  template <typename... Args>
  void trace(const std::string &component, const std::string &action,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::trace, component, action, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void debug(const std::string &component, const std::string &action,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::debug, component, action, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(const std::string &component, const std::string &action,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::info, component, action, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(const std::string &component, const std::string &action,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::warn, component, action, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(const std::string &component, const std::string &action,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::err, component, action, fmt_str,
        std::forward<Args>(args)...);
  }

private:
  ServerLogger() = default;

  ServerLogger(const ServerLogger &) = delete;
  ServerLogger &operator=(const ServerLogger &) = delete;

  template <typename... Args>
  void log(spdlog::level::level_enum level, const std::string &component,
           const std::string &action, const std::string &fmt_str,
           Args &&...args) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_ || !logger_->should_log(level))
      return;

    // Format:  [component] [action] message
    std::string prefix = fmt::format("[{}] [{}] ", component, action);
    std::string full_msg = prefix + fmt::format(fmt::runtime(fmt_str),
                                                std::forward<Args>(args)...);
    logger_->log(level, full_msg);
  }

  std::shared_ptr<spdlog::logger> logger_;
  mutable std::mutex mutex_;
};

/// Parse "trace" / "debug" / "info" / "warn" / "error"; anything else is info.
MD_SERVER_API spdlog::level::level_enum
parse_log_level(const std::string &level);

// Convenience macros
#define LOG_TRACE(component, action, ...)                                      \
  mdserver::ServerLogger::instance().trace(component, action, __VA_ARGS__)
#define LOG_DEBUG(component, action, ...)                                      \
  mdserver::ServerLogger::instance().debug(component, action, __VA_ARGS__)
#define LOG_INFO(component, action, ...)                                       \
  mdserver::ServerLogger::instance().info(component, action, __VA_ARGS__)
#define LOG_WARN(component, action, ...)                                       \
  mdserver::ServerLogger::instance().warn(component, action, __VA_ARGS__)
#define LOG_ERROR(component, action, ...)                                      \
  mdserver::ServerLogger::instance().error(component, action, __VA_ARGS__)

} // namespace mdserver
