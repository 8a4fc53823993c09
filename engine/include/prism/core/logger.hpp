#pragma once

/**
 * @file logger.hpp
 * @brief Centralized logging facade using spdlog
 */

#include <memory>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <vector>

namespace prism::core {

using ScopeSnapshot = std::vector<std::string>;

class Logger;

// A named category ("Mesh", "Asset") that prefixes every message with its name and
// the scope stack of the calling thread.
class LogChannel {
public:
  explicit LogChannel(std::string_view name) : m_name(name) {}

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

  std::string_view name() const { return m_name; }

private:
  template <typename... Args>
  void log(spdlog::level::level_enum level,
           spdlog::format_string_t<Args...> fmt, Args &&...args) const;

  std::string m_name;
};

class Logger {
public:
  // Static-only interface
  Logger() = delete;
  ~Logger() = delete;
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  // Initialize logger (call once on startup)
  static void init(const std::string &pattern = "[%H:%M:%S] [%l] %v");
  static void shutdown();

  static void setLevel(spdlog::level::level_enum level);
  static spdlog::level::level_enum getLevel();

  static LogChannel Mesh;
  static LogChannel Asset;

  // Pushes a label onto the calling thread's scope stack for its lifetime.
  class ScopedContext {
  public:
    explicit ScopedContext(std::string label);
    ~ScopedContext();

    ScopedContext(const ScopedContext &) = delete;
    ScopedContext &operator=(const ScopedContext &) = delete;
  };

  static ScopeSnapshot captureScopes();
  static void restoreScopes(const ScopeSnapshot &snapshot);
  static std::string scopePrefix();

  // Logging interface (C++20 format strings)
  template <typename... Args>
  static void trace(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    if (sLogger)
      sLogger->trace(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void debug(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    if (sLogger)
      sLogger->debug(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void info(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    if (sLogger)
      sLogger->info(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void warn(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    if (sLogger)
      sLogger->warn(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void error(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    if (sLogger) {
      sLogger->error(fmt, std::forward<Args>(args)...);
    }
  }

  template <typename... Args>
  static void critical(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    if (sLogger) {
      sLogger->critical(fmt, std::forward<Args>(args)...);
    }
  }

private:
  friend class LogChannel;

  static std::shared_ptr<spdlog::logger> sLogger;
};

template <typename... Args>
void LogChannel::log(spdlog::level::level_enum level,
                     spdlog::format_string_t<Args...> fmt,
                     Args &&...args) const {
  const auto &logger = Logger::sLogger;
  if (!logger || !logger->should_log(level)) {
    return;
  }
  std::string message =
      spdlog::fmt_lib::format(fmt, std::forward<Args>(args)...);
  logger->log(level, "[{}]{} {}", m_name, Logger::scopePrefix(), message);
}

} // namespace prism::core

#define PRISM_LOG_SCOPE_CONCAT_INNER(a, b) a##b
#define PRISM_LOG_SCOPE_CONCAT(a, b) PRISM_LOG_SCOPE_CONCAT_INNER(a, b)
#define PRISM_LOG_SCOPE(label)                                                 \
  ::prism::core::Logger::ScopedContext PRISM_LOG_SCOPE_CONCAT(                 \
      prismLogScope_, __LINE__)(label)
