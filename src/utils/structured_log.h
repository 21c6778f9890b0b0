/**
 * @file structured_log.h
 * @brief Structured logging utilities for JSON-formatted logs
 *
 * Provides helper functions for logging events in structured JSON (or
 * key=value text) format on top of spdlog, so that reader activity can be
 * parsed programmatically.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace casereader::utils {

/**
 * @brief Log output format
 */
enum class LogFormat : std::uint8_t {
  JSON,  // {"event":"name","field":"value"}
  TEXT   // event=name field=value
};

/**
 * @brief Structured log line builder
 *
 * Fields keep insertion order. The JSON form is rendered by nlohmann::json,
 * the text form as space separated key=value pairs.
 *
 * @code
 * StructuredLog()
 *   .Event("case_decode_error")
 *   .Field("table", "solver_iterations")
 *   .Field("coordinate", coordinate)
 *   .Error();
 * @endcode
 */
class StructuredLog {
 public:
  StructuredLog() = default;

  /// Set the process-wide output format
  static void SetFormat(LogFormat format) { format_.store(format, std::memory_order_relaxed); }
  static LogFormat GetFormat() { return format_.load(std::memory_order_relaxed); }

  StructuredLog& Event(const std::string& event) {
    event_ = event;
    return *this;
  }

  StructuredLog& Field(const std::string& key, const char* value) { return Field(key, std::string(value)); }

  StructuredLog& Field(const std::string& key, const std::string& value) {
    fields_[key] = value;
    return *this;
  }

  StructuredLog& Field(const std::string& key, int64_t value) {
    fields_[key] = value;
    return *this;
  }

  StructuredLog& Field(const std::string& key, uint64_t value) {
    fields_[key] = value;
    return *this;
  }

  StructuredLog& Field(const std::string& key, double value) {
    fields_[key] = value;
    return *this;
  }

  StructuredLog& Field(const std::string& key, bool value) {
    fields_[key] = value;
    return *this;
  }

  /**
   * @brief Human-readable context, emitted after the event name
   */
  StructuredLog& Message(const std::string& message) {
    message_ = message;
    return *this;
  }

  void Error() const { spdlog::error("{}", Build()); }
  void Warn() const { spdlog::warn("{}", Build()); }
  void Info() const { spdlog::info("{}", Build()); }
  void Debug() const { spdlog::debug("{}", Build()); }

 private:
  std::string Build() const {
    nlohmann::ordered_json line = nlohmann::ordered_json::object();
    if (!event_.empty()) {
      line["event"] = event_;
    }
    if (!message_.empty()) {
      line["message"] = message_;
    }
    for (auto field = fields_.begin(); field != fields_.end(); ++field) {
      line[field.key()] = field.value();
    }

    if (format_.load(std::memory_order_relaxed) == LogFormat::JSON) {
      return line.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
    }

    std::string text;
    for (auto field = line.begin(); field != line.end(); ++field) {
      if (!text.empty()) {
        text += ' ';
      }
      text += field.key();
      text += '=';
      text += field->is_string() ? QuoteText(field->get<std::string>()) : field->dump();
    }
    return text;
  }

  /// Quote values containing spaces, quotes or control characters
  static std::string QuoteText(const std::string& value) {
    bool needs_quotes = value.empty() || value.find_first_of(" \"\\\n\r\t") != std::string::npos;
    if (!needs_quotes) {
      return value;
    }
    std::string quoted = "\"";
    for (char chr : value) {
      switch (chr) {
        case '"':
        case '\\':
          quoted += '\\';
          quoted += chr;
          break;
        case '\n':
          quoted += "\\n";
          break;
        case '\r':
          quoted += "\\r";
          break;
        case '\t':
          quoted += "\\t";
          break;
        default:
          quoted += chr;
      }
    }
    quoted += '"';
    return quoted;
  }

  std::string event_;
  std::string message_;
  nlohmann::ordered_json fields_ = nlohmann::ordered_json::object();
  static inline std::atomic<LogFormat> format_{LogFormat::JSON};
};

/**
 * @brief Log a successful store open in structured format
 */
inline void LogStoreOpen(const std::string& filepath, int64_t format_version, const std::string& counts) {
  StructuredLog()
      .Event("store_open")
      .Field("filepath", filepath)
      .Field("format_version", format_version)
      .Field("cases", counts)
      .Info();
}

/**
 * @brief Log storage error in structured format
 */
inline void LogStorageError(const std::string& operation, const std::string& filepath, const std::string& error_msg) {
  StructuredLog()
      .Event("storage_error")
      .Field("operation", operation)
      .Field("filepath", filepath)
      .Field("error", error_msg)
      .Error();
}

/**
 * @brief Log storage warning in structured format
 */
inline void LogStorageWarning(const std::string& operation, const std::string& message) {
  StructuredLog().Event("storage_warning").Field("operation", operation).Field("message", message).Warn();
}

/**
 * @brief Log a value that failed to decode
 */
inline void LogDecodeError(const std::string& table, const std::string& coordinate, const std::string& error_msg) {
  StructuredLog()
      .Event("case_decode_error")
      .Field("table", table)
      .Field("coordinate", coordinate)
      .Field("error", error_msg)
      .Error();
}

/**
 * @brief Log case cache activity (debug level)
 */
inline void LogCaseCache(const std::string& table, const std::string& coordinate, bool hit, uint64_t cache_size) {
  StructuredLog()
      .Event("case_cache")
      .Field("table", table)
      .Field("coordinate", coordinate)
      .Field("hit", hit)
      .Field("size", cache_size)
      .Debug();
}

/**
 * @brief Log hierarchy query in structured format
 */
inline void LogHierarchyQuery(const std::string& source, bool recurse, size_t result_count, double latency_us) {
  StructuredLog()
      .Event("hierarchy_query")
      .Field("source", source)
      .Field("recurse", recurse)
      .Field("result_count", static_cast<uint64_t>(result_count))
      .Field("latency_us", latency_us)
      .Debug();
}

}  // namespace casereader::utils
