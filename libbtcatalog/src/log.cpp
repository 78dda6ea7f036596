/**
 * @file log.cpp
 * @brief spdlog setup for the shared "btcatalog" logger
 */

#include "btcatalog/log.h"
#include "btcatalog/naming.h"

#include <mutex>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace btcatalog {
namespace log {

namespace {

std::mutex g_logger_mutex;

std::shared_ptr<spdlog::logger> make_console_logger() {
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, console_sink);
  logger->set_pattern(LogConfig().pattern);
  logger->set_level(spdlog::level::info);
  return logger;
}

} // namespace

// ============================================================================
// LogConfig
// ============================================================================

Result<void> LogConfig::validate() const {
  if (!parse_level(level)) {
    return Error(ErrorCode::ConfigError, "Unknown log level", level);
  }
  if (!file.empty()) {
    if (max_file_size == 0) {
      return Error(ErrorCode::ConfigError,
                   "Max log file size must be greater than 0");
    }
    if (max_files == 0) {
      return Error(ErrorCode::ConfigError,
                   "Max log files must be greater than 0");
    }
  }
  if (pattern.empty()) {
    return Error(ErrorCode::ConfigError, "Log pattern cannot be empty");
  }
  return Result<void>::ok();
}

// ============================================================================
// Logger Setup
// ============================================================================

std::optional<spdlog::level::level_enum> parse_level(const std::string &level) {
  std::string name = to_lower(trim(level));
  if (name == "trace")
    return spdlog::level::trace;
  if (name == "debug")
    return spdlog::level::debug;
  if (name == "info")
    return spdlog::level::info;
  if (name == "warn" || name == "warning")
    return spdlog::level::warn;
  if (name == "error" || name == "err")
    return spdlog::level::err;
  if (name == "critical")
    return spdlog::level::critical;
  if (name == "off")
    return spdlog::level::off;
  return std::nullopt;
}

Result<void> init(const LogConfig &config) {
  BTCATALOG_TRY(config.validate());

  // Console goes to stderr so stdout stays clean for JSON output
  std::vector<spdlog::sink_ptr> sinks;
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console_sink->set_pattern(config.pattern);
  sinks.push_back(console_sink);

  if (!config.file.empty()) {
    try {
      auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          config.file, config.max_file_size, config.max_files);
      file_sink->set_pattern(config.pattern);
      sinks.push_back(file_sink);
    } catch (const spdlog::spdlog_ex &e) {
      return Error(ErrorCode::FileWriteError, "Cannot open log file",
                   config.file + ": " + e.what());
    }
  }

  auto logger =
      std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
  logger->set_level(*parse_level(config.level));
  logger->flush_on(spdlog::level::warn);

  std::lock_guard<std::mutex> lock(g_logger_mutex);
  spdlog::drop(LOGGER_NAME);
  spdlog::register_logger(logger);
  return Result<void>::ok();
}

std::shared_ptr<spdlog::logger> get() {
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  auto logger = spdlog::get(LOGGER_NAME);
  if (!logger) {
    logger = make_console_logger();
    spdlog::register_logger(logger);
  }
  return logger;
}

Result<void> set_level(const std::string &level) {
  auto parsed = parse_level(level);
  if (!parsed) {
    return Error(ErrorCode::InvalidArgument, "Unknown log level", level);
  }
  get()->set_level(*parsed);
  return Result<void>::ok();
}

} // namespace log
} // namespace btcatalog
