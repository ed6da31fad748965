#include "minir/core/logger.hpp"

#include <array>

namespace minir::core {

LogChannel Logger::Root("minir");
LogChannel Logger::Core("core");
LogChannel Logger::Scene("scene");
LogChannel Logger::Render("render");
LogChannel Logger::Platform("platform");

namespace {

constexpr std::array kLevels{
    std::pair{LogLevel::Trace, spdlog::level::trace},
    std::pair{LogLevel::Debug, spdlog::level::debug},
    std::pair{LogLevel::Info, spdlog::level::info},
    std::pair{LogLevel::Warn, spdlog::level::warn},
    std::pair{LogLevel::Error, spdlog::level::err},
    std::pair{LogLevel::Critical, spdlog::level::critical},
    std::pair{LogLevel::Off, spdlog::level::off},
};

std::array<LogChannel *, 4> subsystemChannels() {
  return {&Logger::Core, &Logger::Scene, &Logger::Render, &Logger::Platform};
}

} // namespace

void Logger::init(const std::string &pattern) {
  if (isInitialized()) {
    return;
  }

  auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();

#ifdef DEBUG
  const auto level = spdlog::level::debug;
#else
  const auto level = spdlog::level::info;
#endif

  Root.m_logger = std::make_shared<spdlog::logger>(Root.name(), sink);
  Root.m_logger->set_pattern(pattern);
  Root.m_logger->set_level(level);
  spdlog::register_logger(Root.m_logger);

  for (LogChannel *channel : subsystemChannels()) {
    channel->m_logger = std::make_shared<spdlog::logger>(
        std::string(Root.name()) + "." + channel->name(), sink);
    channel->m_logger->set_pattern("[%H:%M:%S] [%l] [%n] %v");
    channel->m_logger->set_level(level);
    spdlog::register_logger(channel->m_logger);
  }

  Core.debug("Logging to console at level {}", spdlog::level::to_string_view(level));
}

void Logger::shutdown() {
  if (!isInitialized()) {
    return;
  }

  for (LogChannel *channel : subsystemChannels()) {
    if (channel->m_logger) {
      channel->m_logger->flush();
      spdlog::drop(channel->m_logger->name());
      channel->m_logger.reset();
    }
  }
  Root.m_logger->flush();
  spdlog::drop(Root.m_logger->name());
  Root.m_logger.reset();
}

void Logger::setLevel(LogLevel level) {
  if (!isInitialized()) {
    return;
  }

  auto spdLevel = spdlog::level::info;
  for (const auto &[ours, theirs] : kLevels) {
    if (ours == level) {
      spdLevel = theirs;
    }
  }

  Root.m_logger->set_level(spdLevel);
  for (LogChannel *channel : subsystemChannels()) {
    if (channel->m_logger) {
      channel->m_logger->set_level(spdLevel);
    }
  }
}

LogLevel Logger::getLevel() {
  if (!isInitialized()) {
    return LogLevel::Off;
  }
  for (const auto &[ours, theirs] : kLevels) {
    if (theirs == Root.m_logger->level()) {
      return ours;
    }
  }
  return LogLevel::Off;
}

} // namespace minir::core
