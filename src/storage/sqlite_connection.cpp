/**
 * @file sqlite_connection.cpp
 * @brief Read-only SQLite connection implementation
 */

#include "storage/sqlite_connection.h"

#include <filesystem>
#include <system_error>
#include <utility>

#include "utils/structured_log.h"

namespace casereader::storage {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

// ============================================================================
// Statement
// ============================================================================

Statement::~Statement() {
  if (stmt_ != nullptr) {
    sqlite3_finalize(stmt_);
  }
}

Statement::Statement(Statement&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)), stmt_(std::exchange(other.stmt_, nullptr)) {}

Statement& Statement::operator=(Statement&& other) noexcept {
  if (this != &other) {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
    }
    db_ = std::exchange(other.db_, nullptr);
    stmt_ = std::exchange(other.stmt_, nullptr);
  }
  return *this;
}

Expected<void, Error> Statement::BindText(int index, const std::string& value) {
  int rc = sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
  if (rc != SQLITE_OK) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageReadError, "sqlite bind: " + std::string(sqlite3_errmsg(db_))));
  }
  return {};
}

Expected<bool, Error> Statement::Step() {
  int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc == SQLITE_DONE) {
    return false;
  }
  return MakeUnexpected(MakeError(ErrorCode::kStorageReadError, "sqlite step: " + std::string(sqlite3_errmsg(db_))));
}

void Statement::Reset() {
  sqlite3_reset(stmt_);
}

int Statement::ColumnCount() const {
  return sqlite3_column_count(stmt_);
}

bool Statement::IsNull(int column) const {
  return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

int64_t Statement::ColumnInt64(int column) const {
  return static_cast<int64_t>(sqlite3_column_int64(stmt_, column));
}

double Statement::ColumnDouble(int column) const {
  return sqlite3_column_double(stmt_, column);
}

std::optional<double> Statement::ColumnOptionalDouble(int column) const {
  if (IsNull(column)) {
    return std::nullopt;
  }
  return ColumnDouble(column);
}

std::string Statement::ColumnText(int column) const {
  const unsigned char* text = sqlite3_column_text(stmt_, column);
  if (text == nullptr) {
    return {};
  }
  int len = sqlite3_column_bytes(stmt_, column);
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(len));
}

std::string Statement::ColumnBytes(int column) const {
  const void* blob = sqlite3_column_blob(stmt_, column);
  if (blob == nullptr) {
    return {};
  }
  int len = sqlite3_column_bytes(stmt_, column);
  return std::string(static_cast<const char*>(blob), static_cast<size_t>(len));
}

// ============================================================================
// SqliteConnection
// ============================================================================

SqliteConnection::~SqliteConnection() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

Expected<std::unique_ptr<SqliteConnection>, Error> SqliteConnection::OpenReadOnly(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    utils::LogStorageError("open", path, "file does not exist");
    return MakeUnexpected(MakeError(ErrorCode::kInvalidStore, "File does not exist", path));
  }

  sqlite3* db = nullptr;
  int rc = sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READONLY, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db != nullptr ? sqlite3_errmsg(db) : "sqlite open failed";
    if (db != nullptr) {
      sqlite3_close(db);
    }
    utils::LogStorageError("open", path, msg);
    return MakeUnexpected(MakeError(ErrorCode::kInvalidStore, "Cannot open store: " + msg, path));
  }

  std::unique_ptr<SqliteConnection> connection(new SqliteConnection(db, path));

  // sqlite3_open_v2 is lazy; touching the schema is what detects a non-database file.
  auto sanity_check = connection->Prepare("SELECT name FROM sqlite_master LIMIT 1");
  if (!sanity_check) {
    utils::LogStorageError("open", path, sanity_check.error().message());
    return MakeUnexpected(MakeError(ErrorCode::kInvalidStore, "File is not a valid sqlite database", path));
  }
  auto stepped = sanity_check->Step();
  if (!stepped) {
    utils::LogStorageError("open", path, stepped.error().message());
    return MakeUnexpected(MakeError(ErrorCode::kInvalidStore, "File is not a valid sqlite database", path));
  }

  return connection;
}

Expected<Statement, Error> SqliteConnection::Prepare(const std::string& sql) const {
  sqlite3_stmt* stmt = nullptr;
  int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    if (stmt != nullptr) {
      sqlite3_finalize(stmt);
    }
    return MakeUnexpected(MakeError(ErrorCode::kStorageReadError, "sqlite prepare: " + std::string(sqlite3_errmsg(db_)),
                                    sql));
  }
  return Statement(db_, stmt);
}

Expected<bool, Error> SqliteConnection::TableExists(const std::string& table) const {
  auto stmt = Prepare("SELECT 1 FROM sqlite_master WHERE type='table' AND name=?");
  if (!stmt) {
    return MakeUnexpected(stmt.error());
  }
  auto bound = stmt->BindText(1, table);
  if (!bound) {
    return MakeUnexpected(bound.error());
  }
  return stmt->Step();
}

}  // namespace casereader::storage
