#include "prism/core/logger.hpp"

namespace prism::core {

std::shared_ptr<spdlog::logger> Logger::sLogger;

LogChannel Logger::Mesh{"Mesh"};
LogChannel Logger::Asset{"Asset"};

namespace {
thread_local ScopeSnapshot tScopes;
}

void Logger::init(const std::string &pattern) {
  if (sLogger) {
    return; // Already initialized
  }

  auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  const auto logger = std::make_shared<spdlog::logger>("prism", consoleSink);

  logger->set_pattern(pattern);

#ifdef DEBUG
  logger->set_level(spdlog::level::debug);
#else
  logger->set_level(spdlog::level::info);
#endif

  spdlog::register_logger(logger);
  sLogger = logger;

  info("Logger initialized");
}

void Logger::shutdown() {
  if (!sLogger) {
    return;
  }
  sLogger->flush();
  spdlog::drop(sLogger->name());
  sLogger.reset();
}

void Logger::setLevel(spdlog::level::level_enum level) {
  if (sLogger) {
    sLogger->set_level(level);
  }
}

spdlog::level::level_enum Logger::getLevel() {
  return sLogger ? sLogger->level() : spdlog::level::off;
}

Logger::ScopedContext::ScopedContext(std::string label) {
  tScopes.push_back(std::move(label));
}

Logger::ScopedContext::~ScopedContext() {
  if (!tScopes.empty()) {
    tScopes.pop_back();
  }
}

ScopeSnapshot Logger::captureScopes() { return tScopes; }

void Logger::restoreScopes(const ScopeSnapshot &snapshot) {
  tScopes = snapshot;
}

std::string Logger::scopePrefix() {
  std::string prefix;
  for (const auto &scope : tScopes) {
    prefix += " [";
    prefix += scope;
    prefix += "]";
  }
  return prefix;
}

} // namespace prism::core
