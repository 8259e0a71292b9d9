/**
 * @file logging.hpp
 * @brief spdlog-backed logger shared by every tessera component
 */

#pragma once

#include <string>

#ifdef ENABLE_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace tessera {
namespace logging {

enum class LogLevel {
  TRACE = 0,
  DEBUG = 1,
  INFO = 2,
  WARN = 3,
  ERROR = 4,
  CRITICAL = 5,
  OFF = 6
};

class Logger {
 public:
  static Logger& getInstance() {
    static Logger instance;
    return instance;
  }

  void setLevel(LogLevel level) {
    if (logger_) {
      logger_->set_level(toSpdlogLevel(level));
    }
  }

  std::shared_ptr<spdlog::logger> getLogger() const { return logger_; }

  /**
   * @brief Set the level from its configuration name
   *
   * Unknown names fall back to "info".
   */
  void setLogLevel(const std::string& level_str) {
    setLevel(parseLevel(level_str));
  }

  static LogLevel parseLevel(const std::string& level_str) {
    if (level_str == "trace") return LogLevel::TRACE;
    if (level_str == "debug") return LogLevel::DEBUG;
    if (level_str == "warn") return LogLevel::WARN;
    if (level_str == "error") return LogLevel::ERROR;
    if (level_str == "critical") return LogLevel::CRITICAL;
    if (level_str == "off") return LogLevel::OFF;
    return LogLevel::INFO;
  }

 private:
  Logger() {
    logger_ = spdlog::get("tessera");
    if (!logger_) {
      logger_ = spdlog::stdout_color_mt("tessera");
    }
    logger_->set_level(spdlog::level::info);
    logger_->set_pattern("[%H:%M:%S.%e] [%n] [%l] %v");
  }

  static spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
    switch (level) {
      case LogLevel::TRACE:
        return spdlog::level::trace;
      case LogLevel::DEBUG:
        return spdlog::level::debug;
      case LogLevel::INFO:
        return spdlog::level::info;
      case LogLevel::WARN:
        return spdlog::level::warn;
      case LogLevel::ERROR:
        return spdlog::level::err;
      case LogLevel::CRITICAL:
        return spdlog::level::critical;
      case LogLevel::OFF:
        return spdlog::level::off;
    }
    return spdlog::level::info;
  }

  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace logging
}  // namespace tessera

#define TESSERA_LOG_TRACE(...) \
  tessera::logging::Logger::getInstance().getLogger()->trace(__VA_ARGS__)
#define TESSERA_LOG_DEBUG(...) \
  tessera::logging::Logger::getInstance().getLogger()->debug(__VA_ARGS__)
#define TESSERA_LOG_INFO(...) \
  tessera::logging::Logger::getInstance().getLogger()->info(__VA_ARGS__)
#define TESSERA_LOG_WARN(...) \
  tessera::logging::Logger::getInstance().getLogger()->warn(__VA_ARGS__)
#define TESSERA_LOG_ERROR(...) \
  tessera::logging::Logger::getInstance().getLogger()->error(__VA_ARGS__)
#define TESSERA_LOG_CRITICAL(...) \
  tessera::logging::Logger::getInstance().getLogger()->critical(__VA_ARGS__)

#else
// No-op macros when logging is disabled
#define TESSERA_LOG_TRACE(...)
#define TESSERA_LOG_DEBUG(...)
#define TESSERA_LOG_INFO(...)
#define TESSERA_LOG_WARN(...)
#define TESSERA_LOG_ERROR(...)
#define TESSERA_LOG_CRITICAL(...)

namespace tessera {
namespace logging {
enum class LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL, OFF };
class Logger {
 public:
  static Logger& getInstance() {
    static Logger instance;
    return instance;
  }
  void setLevel(LogLevel) {}
  void setLogLevel(const std::string&) {}
  static LogLevel parseLevel(const std::string&) { return LogLevel::INFO; }
};
}  // namespace logging
}  // namespace tessera

#endif
