/**
 * @file log.h
 * @brief Library-wide logging on top of spdlog
 *
 * All btcatalog code logs through the logger named "btcatalog". Calling
 * init() is optional: get() creates a console logger on first use.
 */

#ifndef BTCATALOG_LOG_H
#define BTCATALOG_LOG_H

#include "error.h"
#include "platform.h"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace btcatalog {
namespace log {

/// Name of the shared logger
constexpr const char *LOGGER_NAME = "btcatalog";

/**
 * @brief Logging configuration
 */
struct LogConfig {
  /// "trace", "debug", "info", "warn", "error", "critical", "off"
  std::string level = "info";

  /// Rotating log file, empty for console only
  std::string file;

  size_t max_file_size = 5 * 1024 * 1024;
  size_t max_files = 3;

  std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

  /// Check the configuration without touching any sink
  Result<void> validate() const;
};

/**
 * @brief Install the "btcatalog" logger
 *
 * Replaces any logger installed earlier. A file sink that cannot be
 * opened is reported as FileWriteError and nothing is replaced.
 */
BTCATALOG_API Result<void> init(const LogConfig &config);

/// Shared logger, created on demand with console output at info level
BTCATALOG_API std::shared_ptr<spdlog::logger> get();

/// Change the level of the shared logger
BTCATALOG_API Result<void> set_level(const std::string &level);

/// Parse a level name, nullopt if unknown
BTCATALOG_API std::optional<spdlog::level::level_enum>
parse_level(const std::string &level);

} // namespace log
} // namespace btcatalog

#endif // BTCATALOG_LOG_H
