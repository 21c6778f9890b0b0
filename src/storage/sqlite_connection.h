/**
 * @file sqlite_connection.h
 * @brief Read-only RAII wrappers around sqlite3 and sqlite3_stmt
 *
 * A case store is a SQLite file written by an external recorder. The reader
 * never writes to it, so the connection is opened with SQLITE_OPEN_READONLY
 * and no PRAGMAs are issued.
 */

#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "utils/error.h"
#include "utils/expected.h"

namespace casereader::storage {

/**
 * @brief Prepared statement (finalized on destruction)
 *
 * Column accessors are only meaningful after Step() returned true.
 */
class Statement {
 public:
  Statement() = default;
  Statement(sqlite3* db, sqlite3_stmt* stmt) : db_(db), stmt_(stmt) {}
  ~Statement();

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;
  Statement(Statement&& other) noexcept;
  Statement& operator=(Statement&& other) noexcept;

  /**
   * @brief Bind a text parameter (1-based index)
   */
  utils::Expected<void, utils::Error> BindText(int index, const std::string& value);

  /**
   * @brief Advance to the next row
   * @return true if a row is available, false when the result set is exhausted
   */
  utils::Expected<bool, utils::Error> Step();

  /**
   * @brief Rewind so the statement can be stepped again (bindings are kept)
   */
  void Reset();

  [[nodiscard]] int ColumnCount() const;
  [[nodiscard]] bool IsNull(int column) const;
  [[nodiscard]] int64_t ColumnInt64(int column) const;
  [[nodiscard]] double ColumnDouble(int column) const;
  [[nodiscard]] std::optional<double> ColumnOptionalDouble(int column) const;

  /**
   * @brief Column as text (empty for NULL)
   */
  [[nodiscard]] std::string ColumnText(int column) const;

  /**
   * @brief Column as raw bytes; works for BLOB and TEXT storage classes
   */
  [[nodiscard]] std::string ColumnBytes(int column) const;

 private:
  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

/**
 * @brief Read-only connection to a case store file
 */
class SqliteConnection {
 public:
  ~SqliteConnection();

  SqliteConnection(const SqliteConnection&) = delete;
  SqliteConnection& operator=(const SqliteConnection&) = delete;
  SqliteConnection(SqliteConnection&&) = delete;
  SqliteConnection& operator=(SqliteConnection&&) = delete;

  /**
   * @brief Open an existing SQLite file read-only
   *
   * Fails with kInvalidStore when the file does not exist, cannot be opened,
   * or is not a SQLite database.
   *
   * @param path File path
   */
  static utils::Expected<std::unique_ptr<SqliteConnection>, utils::Error> OpenReadOnly(const std::string& path);

  /**
   * @brief Prepare a statement
   * @return kStorageReadError if the SQL does not compile (e.g. missing table)
   */
  utils::Expected<Statement, utils::Error> Prepare(const std::string& sql) const;

  /**
   * @brief Check whether a table exists in the schema
   */
  utils::Expected<bool, utils::Error> TableExists(const std::string& table) const;

  [[nodiscard]] const std::string& Path() const { return path_; }
  [[nodiscard]] sqlite3* Handle() const { return db_; }

 private:
  SqliteConnection(sqlite3* db, std::string path) : db_(db), path_(std::move(path)) {}

  sqlite3* db_ = nullptr;
  std::string path_;
};

}  // namespace casereader::storage
