/**
 * @file config.h
 * @brief Configuration structures and YAML parser for casereader
 */

#pragma once

#include <string>

#include "utils/error.h"
#include "utils/expected.h"

namespace casereader::config {

/**
 * @brief Case reader configuration
 */
struct ReaderConfig {
  bool cache_cases = false;  ///< Default caching mode for single-case fetches
  bool preload = false;      ///< Decode every case into the caches at open
};

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
  std::string level = "info";  ///< Log level: trace, debug, info, warn, error
  bool json = true;            ///< Use structured JSON logging
  std::string file;            ///< Log file path (empty = stderr)
};

/**
 * @brief Root configuration
 */
struct Config {
  ReaderConfig reader;    ///< Case reader configuration
  LoggingConfig logging;  ///< Logging configuration
};

/**
 * @brief Load configuration from YAML file
 *
 * @param path Path to YAML configuration file
 * @return Expected<Config, Error> with configuration or error
 */
utils::Expected<Config, utils::Error> LoadConfig(const std::string& path);

/**
 * @brief Parse configuration from YAML text
 */
utils::Expected<Config, utils::Error> ParseConfig(const std::string& yaml_text);

/**
 * @brief Validate configuration
 *
 * @param config Configuration to validate
 * @return Expected<void, Error> with success or validation error
 */
utils::Expected<void, utils::Error> ValidateConfig(const Config& config);

/**
 * @brief Apply logging settings to spdlog
 *
 * Sets the level, the structured log format and, when a file is given,
 * replaces the default logger with a file logger.
 *
 * @return kConfigInvalidValue if the log file cannot be opened
 */
utils::Expected<void, utils::Error> ApplyLoggingConfig(const LoggingConfig& logging);

}  // namespace casereader::config
