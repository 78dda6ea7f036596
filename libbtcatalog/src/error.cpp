/**
 * @file error.cpp
 * @brief Error handling implementation
 */

#include "btcatalog/error.h"
#include <sstream>

namespace btcatalog {

// ============================================================================
// Error Code Names
// ============================================================================

const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Success";
  case ErrorCode::Unknown:
    return "Unknown";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  case ErrorCode::InvalidState:
    return "InvalidState";
  case ErrorCode::Timeout:
    return "Timeout";
  case ErrorCode::Cancelled:
    return "Cancelled";

  case ErrorCode::SourceFailed:
    return "SourceFailed";
  case ErrorCode::SourceTimeout:
    return "SourceTimeout";
  case ErrorCode::BluetoothOff:
    return "BluetoothOff";
  case ErrorCode::BleScanFailed:
    return "BleScanFailed";
  case ErrorCode::InquiryFailed:
    return "InquiryFailed";

  case ErrorCode::TotalFailure:
    return "TotalFailure";
  case ErrorCode::UnknownSource:
    return "UnknownSource";
  case ErrorCode::DuplicateSource:
    return "DuplicateSource";

  case ErrorCode::ConfigError:
    return "ConfigError";
  case ErrorCode::ConfigParseError:
    return "ConfigParseError";
  case ErrorCode::FileNotFound:
    return "FileNotFound";
  case ErrorCode::FileReadError:
    return "FileReadError";
  case ErrorCode::FileWriteError:
    return "FileWriteError";
  case ErrorCode::LookupTableError:
    return "LookupTableError";

  case ErrorCode::PlatformError:
    return "PlatformError";
  case ErrorCode::PermissionDenied:
    return "PermissionDenied";
  case ErrorCode::ServiceUnavailable:
    return "ServiceUnavailable";
  case ErrorCode::HardwareNotAvailable:
    return "HardwareNotAvailable";

  default:
    return "UnknownError";
  }
}

// ============================================================================
// Error Code Descriptions
// ============================================================================

const char *error_code_description(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Operation completed successfully";
  case ErrorCode::Unknown:
    return "An unknown error occurred";
  case ErrorCode::InvalidArgument:
    return "Invalid argument provided";
  case ErrorCode::InvalidState:
    return "Operation not valid in current state";
  case ErrorCode::Timeout:
    return "Operation timed out";
  case ErrorCode::Cancelled:
    return "Operation was cancelled";

  case ErrorCode::SourceFailed:
    return "Scan source failed";
  case ErrorCode::SourceTimeout:
    return "Scan source did not finish within its time budget";
  case ErrorCode::BluetoothOff:
    return "Bluetooth is disabled";
  case ErrorCode::BleScanFailed:
    return "BLE scanning failed";
  case ErrorCode::InquiryFailed:
    return "Classic Bluetooth inquiry failed";

  case ErrorCode::TotalFailure:
    return "Every configured scan source failed";
  case ErrorCode::UnknownSource:
    return "Unknown scan source identifier";
  case ErrorCode::DuplicateSource:
    return "Scan source registered twice";

  case ErrorCode::ConfigError:
    return "Invalid configuration";
  case ErrorCode::ConfigParseError:
    return "Configuration file could not be parsed";
  case ErrorCode::FileNotFound:
    return "File not found";
  case ErrorCode::FileReadError:
    return "Error reading file";
  case ErrorCode::FileWriteError:
    return "Error writing file";
  case ErrorCode::LookupTableError:
    return "Lookup table data is invalid";

  case ErrorCode::PlatformError:
    return "Platform-specific error occurred";
  case ErrorCode::PermissionDenied:
    return "Permission denied";
  case ErrorCode::ServiceUnavailable:
    return "Required service unavailable";
  case ErrorCode::HardwareNotAvailable:
    return "Required hardware not available";

  default:
    return "Unknown error occurred";
  }
}

// ============================================================================
// Error::to_string
// ============================================================================

std::string Error::to_string() const {
  std::ostringstream oss;

  oss << error_code_name(code);

  if (!message.empty()) {
    oss << ": " << message;
  }

  if (!details.empty()) {
    oss << " (" << details << ")";
  }

  if (!location.empty()) {
    oss << " [" << location << "]";
  }

  return oss.str();
}

} // namespace btcatalog
