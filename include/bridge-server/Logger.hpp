#pragma once
#include "bridge-server/export.h"

#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace bridgesrv {

/// Centralized logging with component and tag context.
///
/// All console output goes to stderr: stdout belongs to the protocol stream.
class BRIDGE_SERVER_API BridgeLogger {
public:
  static BridgeLogger &instance();

  // Initialize with a stderr sink and, if log_file is set, a rotating file
  // sink
  void init(spdlog::level::level_enum level = spdlog::level::info,
            const std::string &log_file = "") {
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
      console_sink->set_level(spdlog::level::trace);

      std::vector<spdlog::sink_ptr> sinks{console_sink};
      if (!log_file.empty()) {
        auto file_sink =
            std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, 1024 * 1024 * 10, 3); // 10MB, 3 files
        file_sink->set_level(spdlog::level::trace);
        sinks.push_back(file_sink);
      }

      logger_ = std::make_shared<spdlog::logger>("bridge", sinks.begin(),
                                                 sinks.end());
      logger_->set_level(level);
      // Flush at the configured level so an orchestrator tailing stderr sees
      // messages before the next response is written
      logger_->flush_on(level);

      if (!spdlog::get("bridge")) {
        spdlog::register_logger(logger_);
      }
    } catch (const spdlog::spdlog_ex &ex) {
      fmt::print(stderr, "Log initialization failed: {}\n", ex.what());
    }
  }

  // Drop the logger from the spdlog registry so a later init() recreates the
  // sinks (used by tests)
  void shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::drop("bridge");
    logger_.reset();
  }

  bool is_initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return logger_ != nullptr;
  }

  template <typename... Args>
  void trace(const std::string &component, const std::string &tag,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::trace, component, tag, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void debug(const std::string &component, const std::string &tag,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::debug, component, tag, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(const std::string &component, const std::string &tag,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::info, component, tag, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(const std::string &component, const std::string &tag,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::warn, component, tag, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(const std::string &component, const std::string &tag,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::err, component, tag, fmt_str,
        std::forward<Args>(args)...);
  }

private:
  BridgeLogger() = default;

  template <typename... Args>
  void log(spdlog::level::level_enum level, const std::string &component,
           const std::string &tag, const std::string &fmt_str,
           Args &&...args) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_)
      return;

    // Format:  [component] [tag] message
    std::string prefix = fmt::format("[{}] [{}] ", component, tag);
    std::string full_msg = prefix + fmt::format(fmt::runtime(fmt_str),
                                                std::forward<Args>(args)...);
    logger_->log(level, full_msg);
  }

  std::shared_ptr<spdlog::logger> logger_;
  mutable std::mutex mutex_;
};

// Convenience macros
#define LOG_TRACE(component, tag, ...)                                         \
  bridgesrv::BridgeLogger::instance().trace(component, tag, __VA_ARGS__)
#define LOG_DEBUG(component, tag, ...)                                         \
  bridgesrv::BridgeLogger::instance().debug(component, tag, __VA_ARGS__)
#define LOG_INFO(component, tag, ...)                                          \
  bridgesrv::BridgeLogger::instance().info(component, tag, __VA_ARGS__)
#define LOG_WARN(component, tag, ...)                                          \
  bridgesrv::BridgeLogger::instance().warn(component, tag, __VA_ARGS__)
#define LOG_ERROR(component, tag, ...)                                         \
  bridgesrv::BridgeLogger::instance().error(component, tag, __VA_ARGS__)

} // namespace bridgesrv
