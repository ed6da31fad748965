#pragma once

/**
 * @file logger.hpp
 * @brief spdlog-backed logging: one root logger plus per-subsystem channels
 */

#include <memory>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>

namespace minir::core {

enum class LogLevel { Trace = 0, Debug, Info, Warn, Error, Critical, Off };

// Named sub-logger ("minir.scene", ...) sharing the root console sink.
// Calls made before Logger::init() or after shutdown() are dropped.
class LogChannel {
public:
  explicit LogChannel(const char *name) : m_name(name) {}

  template <typename... Args>
  void trace(spdlog::format_string_t<Args...> fmt, Args &&...args) const {
    log(spdlog::level::trace, fmt, std::forward<Args>(args)...);
  }
  template <typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args &&...args) const {
    log(spdlog::level::debug, fmt, std::forward<Args>(args)...);
  }
  template <typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args &&...args) const {
    log(spdlog::level::info, fmt, std::forward<Args>(args)...);
  }
  template <typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args &&...args) const {
    log(spdlog::level::warn, fmt, std::forward<Args>(args)...);
  }
  template <typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args &&...args) const {
    log(spdlog::level::err, fmt, std::forward<Args>(args)...);
  }
  template <typename... Args>
  void critical(spdlog::format_string_t<Args...> fmt, Args &&...args) const {
    log(spdlog::level::critical, fmt, std::forward<Args>(args)...);
  }

  [[nodiscard]] const char *name() const { return m_name; }

private:
  friend class Logger;

  template <typename... Args>
  void log(spdlog::level::level_enum lvl, spdlog::format_string_t<Args...> fmt,
           Args &&...args) const {
    if (m_logger) {
      m_logger->log(lvl, fmt, std::forward<Args>(args)...);
    }
  }

  const char *m_name;
  std::shared_ptr<spdlog::logger> m_logger;
};

class Logger {
public:
  Logger() = delete;

  // Idempotent. Level defaults to debug in DEBUG builds, info otherwise.
  static void init(const std::string &pattern = "[%H:%M:%S] [%l] %v");
  static void shutdown();

  static void setLevel(LogLevel level);
  [[nodiscard]] static LogLevel getLevel();
  [[nodiscard]] static bool isInitialized() { return Root.m_logger != nullptr; }

  // Application-level messages go to the root logger.
  template <typename... Args>
  static void info(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    Root.info(fmt, std::forward<Args>(args)...);
  }
  template <typename... Args>
  static void warn(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    Root.warn(fmt, std::forward<Args>(args)...);
  }
  template <typename... Args>
  static void critical(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    Root.critical(fmt, std::forward<Args>(args)...);
  }

  static LogChannel Core;
  static LogChannel Scene;
  static LogChannel Render;
  static LogChannel Platform;

private:
  static LogChannel Root;
};

} // namespace minir::core
