/**
 * @file error.h
 * @brief Error codes and error type used with Expected<T, Error>
 *
 * Every fallible operation in casereader reports failures through
 * Expected<T, Error>. An Error carries a code, a human-readable message and
 * an optional context string (for example the iteration coordinate of the
 * record that failed to decode).
 */

#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace casereader::utils {

/**
 * @brief Error codes
 *
 * Codes are grouped by subsystem in blocks of 100.
 */
// NOLINTNEXTLINE(performance-enum-size)
enum class ErrorCode : int32_t {
  // General (0-99)
  kUnknown = 1,
  kInvalidArgument = 2,
  kNotFound = 3,

  // Configuration (100-199)
  kConfigFileNotFound = 100,
  kConfigParseError = 101,
  kConfigYamlError = 102,
  kConfigValidationError = 103,
  kConfigInvalidValue = 104,

  // Storage (200-299)
  kInvalidStore = 200,             ///< File missing, unreadable or not a case store
  kUnsupportedFormatVersion = 201,  ///< metadata.format_version not understood
  kStorageReadError = 202,          ///< SQLite statement failed while reading
  kDecodeError = 203,               ///< Stored value could not be decoded

  // Case queries (300-399)
  kCaseNotFound = 300,     ///< No row for the requested coordinate / case name
  kSourceNotFound = 301,   ///< Source string matches no category or location
  kUnknownVariable = 302,  ///< Name lookup failed against the metadata catalog
};

/**
 * @brief Convert error code to its symbolic name
 */
inline const char* ErrorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kUnknown:
      return "Unknown";
    case ErrorCode::kInvalidArgument:
      return "InvalidArgument";
    case ErrorCode::kNotFound:
      return "NotFound";
    case ErrorCode::kConfigFileNotFound:
      return "ConfigFileNotFound";
    case ErrorCode::kConfigParseError:
      return "ConfigParseError";
    case ErrorCode::kConfigYamlError:
      return "ConfigYamlError";
    case ErrorCode::kConfigValidationError:
      return "ConfigValidationError";
    case ErrorCode::kConfigInvalidValue:
      return "ConfigInvalidValue";
    case ErrorCode::kInvalidStore:
      return "InvalidStore";
    case ErrorCode::kUnsupportedFormatVersion:
      return "UnsupportedFormatVersion";
    case ErrorCode::kStorageReadError:
      return "StorageReadError";
    case ErrorCode::kDecodeError:
      return "DecodeError";
    case ErrorCode::kCaseNotFound:
      return "CaseNotFound";
    case ErrorCode::kSourceNotFound:
      return "SourceNotFound";
    case ErrorCode::kUnknownVariable:
      return "UnknownVariable";
  }
  return "Unknown";
}

/**
 * @brief Error value carried by Expected<T, Error>
 */
class Error {
 public:
  Error() = default;

  explicit Error(ErrorCode code, std::string message = "", std::string context = "")
      : code_(code), message_(std::move(message)), context_(std::move(context)) {}

  [[nodiscard]] ErrorCode code() const { return code_; }
  [[nodiscard]] const std::string& message() const { return message_; }
  [[nodiscard]] const std::string& context() const { return context_; }

  /**
   * @brief Format as "[Code] message (context)"
   */
  [[nodiscard]] std::string to_string() const {
    std::string result = "[";
    result += ErrorCodeToString(code_);
    result += "] ";
    result += message_;
    if (!context_.empty()) {
      result += " (";
      result += context_;
      result += ")";
    }
    return result;
  }

 private:
  ErrorCode code_ = ErrorCode::kUnknown;
  std::string message_;
  std::string context_;
};

/**
 * @brief Create an Error
 * @param code Error code
 * @param message Human-readable message
 * @param context Optional context (coordinate, table, file path, ...)
 */
inline Error MakeError(ErrorCode code, std::string message = "", std::string context = "") {
  return Error(code, std::move(message), std::move(context));
}

}  // namespace casereader::utils
