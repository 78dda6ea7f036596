/**
 * @file error.h
 * @brief Error codes and result types for btcatalog
 *
 * btcatalog uses a Result type pattern for error handling. No exception
 * crosses the library boundary: third-party code that throws is caught at
 * the call site and converted into an Error.
 */

#ifndef BTCATALOG_ERROR_H
#define BTCATALOG_ERROR_H

#include "platform.h"
#include <optional>
#include <string>
#include <variant>

namespace btcatalog {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode : int {
  // Success (0)
  Success = 0,

  // General errors (1-99)
  Unknown = 1,
  InvalidArgument = 2,
  InvalidState = 3,
  Timeout = 5,
  Cancelled = 6,

  // Discovery / source errors (100-199)
  SourceFailed = 100,
  SourceTimeout = 101,
  BluetoothOff = 103,
  BleScanFailed = 105,
  InquiryFailed = 106,

  // Aggregation errors (200-299)
  TotalFailure = 200,
  UnknownSource = 201,
  DuplicateSource = 202,

  // Configuration / data errors (300-399)
  ConfigError = 300,
  ConfigParseError = 301,
  FileNotFound = 302,
  FileReadError = 303,
  FileWriteError = 304,
  LookupTableError = 305,

  // Platform errors (500-599)
  PlatformError = 500,
  PermissionDenied = 501,
  ServiceUnavailable = 502,
  HardwareNotAvailable = 503
};

// ============================================================================
// Error Information
// ============================================================================

/**
 * @brief Detailed error information
 */
struct Error {
  ErrorCode code = ErrorCode::Success;
  std::string message;
  std::string details;  // Additional context
  std::string location; // Function/file where error occurred

  Error() = default;

  explicit Error(ErrorCode c, std::string msg = "", std::string det = "")
      : code(c), message(std::move(msg)), details(std::move(det)) {}

  /// Check if this represents an error
  bool is_error() const { return code != ErrorCode::Success; }

  /// Check if this represents success
  bool is_ok() const { return code == ErrorCode::Success; }

  /// Get human-readable error string
  std::string to_string() const;

  /// Create success result
  static Error ok() { return Error(ErrorCode::Success); }
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type that holds either a value or an error
 *
 * Usage:
 *   Result<AggregationResult> result = aggregator.aggregate(request);
 *   if (result) {
 *       const auto &devices = result.value().devices;
 *   } else {
 *       Error err = result.error();
 *   }
 */
template <typename T> class Result {
public:
  /// Construct with success value
  Result(T value) : data_(std::move(value)) {}

  /// Construct with error
  Result(Error error) : data_(std::move(error)) {}

  /// Construct with error code
  Result(ErrorCode code, std::string message = "")
      : data_(Error(code, std::move(message))) {}

  /// Check if result is success
  bool is_ok() const { return std::holds_alternative<T>(data_); }

  /// Check if result is error
  bool is_error() const { return std::holds_alternative<Error>(data_); }

  /// Boolean conversion (true = success)
  explicit operator bool() const { return is_ok(); }

  /// Get the value (undefined behavior if error)
  T &value() & { return std::get<T>(data_); }
  const T &value() const & { return std::get<T>(data_); }
  T &&value() && { return std::get<T>(std::move(data_)); }

  /// Get the error (undefined behavior if success)
  Error &error() & { return std::get<Error>(data_); }
  const Error &error() const & { return std::get<Error>(data_); }

  /// Get value or default
  T value_or(T default_value) const {
    return is_ok() ? std::get<T>(data_) : std::move(default_value);
  }

private:
  std::variant<T, Error> data_;
};

/**
 * @brief Specialization for void result (success or error, no value)
 */
template <> class Result<void> {
public:
  /// Construct success
  Result() : error_(std::nullopt) {}

  /// Construct with error
  Result(Error error) : error_(std::move(error)) {}

  /// Construct with error code
  Result(ErrorCode code, std::string message = "")
      : error_(Error(code, std::move(message))) {}

  bool is_ok() const { return !error_.has_value(); }
  bool is_error() const { return error_.has_value(); }
  explicit operator bool() const { return is_ok(); }

  Error &error() { return error_.value(); }
  const Error &error() const { return error_.value(); }

  static Result ok() { return Result(); }

private:
  std::optional<Error> error_;
};

// ============================================================================
// Convenience Macros
// ============================================================================

/// Return early if result is error
#define BTCATALOG_TRY(result)                                                  \
  do {                                                                         \
    auto &&_result = (result);                                                 \
    if (_result.is_error()) {                                                  \
      return _result.error();                                                  \
    }                                                                          \
  } while (0)

/// Return early with error if condition is false
#define BTCATALOG_REQUIRE(condition, error_code, message)                      \
  do {                                                                         \
    if (!(condition)) {                                                        \
      return ::btcatalog::Error(error_code, message);                          \
    }                                                                          \
  } while (0)

// ============================================================================
// Error Code Helpers
// ============================================================================

/// Get human-readable name for error code
BTCATALOG_API const char *error_code_name(ErrorCode code);

/// Get description for error code
BTCATALOG_API const char *error_code_description(ErrorCode code);

} // namespace btcatalog

#endif // BTCATALOG_ERROR_H
