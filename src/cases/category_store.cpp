/**
 * @file category_store.cpp
 * @brief Category store implementation
 */

#include "cases/category_store.h"

#include <spdlog/spdlog.h>

#include "codec/value_decoder.h"
#include "utils/structured_log.h"

namespace casereader::cases {

namespace {

constexpr int kCounterColumn = 1;
constexpr int kKeyColumn = 2;
constexpr int kTimestampColumn = 3;
constexpr int kSuccessColumn = 4;
constexpr int kMessageColumn = 5;

// First table version that always carries driver_derivatives and problem_cases
constexpr int64_t kRequiredOptionalTablesVersion = 2;

int RequiredColumns(Category category) {
  switch (category) {
    case Category::kDriver:
      return 8;
    case Category::kDriverDerivative:
      return 7;
    case Category::kSystem:
      return 9;
    case Category::kSolver:
      return 11;
    case Category::kProblem:
      return 7;
  }
  return 0;
}

std::optional<std::string> RawColumn(const storage::Statement& row, int column) {
  if (row.IsNull(column)) {
    return std::nullopt;
  }
  return row.ColumnBytes(column);
}

}  // namespace

const char* TableName(Category category) {
  switch (category) {
    case Category::kDriver:
      return "driver_iterations";
    case Category::kDriverDerivative:
      return "driver_derivatives";
    case Category::kSystem:
      return "system_iterations";
    case Category::kSolver:
      return "solver_iterations";
    case Category::kProblem:
      return "problem_cases";
  }
  return "";
}

std::string DeriveSource(Category category, const hierarchy::IterationCoordinate& coordinate) {
  std::optional<std::string> source;
  switch (category) {
    case Category::kDriver:
    case Category::kDriverDerivative:
      return "driver";
    case Category::kProblem:
      return "problem";
    case Category::kSystem:
      source = hierarchy::SystemSourceOf(coordinate);
      break;
    case Category::kSolver:
      source = hierarchy::SolverSourceOf(coordinate);
      break;
  }
  return source.value_or(CategoryToString(category));
}

// ---------------------------------------------------------------------------
// CaseCursor
// ---------------------------------------------------------------------------

utils::Expected<bool, utils::Error> CaseCursor::Next() {
  auto has_row = statement_.Step();
  if (!has_row) {
    return utils::MakeUnexpected(has_row.error());
  }
  if (!*has_row) {
    current_.reset();
    return false;
  }
  auto decoded = store_->DecodeRow(statement_);
  if (!decoded) {
    return utils::MakeUnexpected(decoded.error());
  }
  current_ = cache_ ? store_->Remember(*decoded) : *decoded;
  return true;
}

void CaseCursor::Restart() {
  statement_.Reset();
  current_.reset();
}

// ---------------------------------------------------------------------------
// CategoryStore
// ---------------------------------------------------------------------------

CategoryStore::CategoryStore(Category category, const storage::SqliteConnection& connection,
                             std::shared_ptr<const metadata::MetadataCatalog> catalog)
    : category_(category), connection_(connection), catalog_(std::move(catalog)) {}

const char* CategoryStore::KeyColumn() const {
  return category_ == Category::kProblem ? "case_name" : "iteration_coordinate";
}

utils::Expected<void, utils::Error> CategoryStore::LoadCoordinates() {
  coordinates_.clear();
  index_.clear();

  auto exists = connection_.TableExists(Table());
  if (!exists) {
    return utils::MakeUnexpected(exists.error());
  }
  if (!*exists) {
    bool optional_table = category_ == Category::kDriverDerivative || category_ == Category::kProblem;
    if (optional_table && catalog_->FormatVersion() < kRequiredOptionalTablesVersion) {
      table_present_ = false;
      spdlog::debug("Table {} not present in format {} store", Table(), catalog_->FormatVersion());
      return {};
    }
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidStore,
                                                  std::string("Missing table '") + Table() + "'",
                                                  connection_.Path()));
  }
  table_present_ = true;

  auto statement = connection_.Prepare(std::string("SELECT ") + KeyColumn() + ", counter FROM " + Table() +
                                       " ORDER BY id ASC");
  if (!statement) {
    return utils::MakeUnexpected(statement.error());
  }
  while (true) {
    auto has_row = statement->Step();
    if (!has_row) {
      return utils::MakeUnexpected(has_row.error());
    }
    if (!*has_row) {
      break;
    }
    CoordinateEntry entry{hierarchy::IterationCoordinate(statement->ColumnText(0)), statement->ColumnInt64(1)};
    index_.emplace(entry.coordinate.Raw(), coordinates_.size());
    coordinates_.push_back(std::move(entry));
  }
  return {};
}

std::optional<int64_t> CategoryStore::CounterOf(const std::string& key) const {
  auto iter = index_.find(key);
  if (iter == index_.end()) {
    return std::nullopt;
  }
  return coordinates_[iter->second].counter;
}

utils::Expected<CasePtr, utils::Error> CategoryStore::Get(const std::string& key, bool use_cache) {
  if (use_cache) {
    auto cached = cache_.find(key);
    bool hit = cached != cache_.end();
    utils::LogCaseCache(Table(), key, hit, static_cast<uint64_t>(cache_.size()));
    if (hit) {
      return cached->second;
    }
  }

  if (!table_present_) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kCaseNotFound, std::string("No ") + Table() + " recorded", key));
  }

  auto statement =
      connection_.Prepare(std::string("SELECT * FROM ") + Table() + " WHERE " + KeyColumn() + " = ?");
  if (!statement) {
    return utils::MakeUnexpected(statement.error());
  }
  auto bound = statement->BindText(1, key);
  if (!bound) {
    return utils::MakeUnexpected(bound.error());
  }
  auto has_row = statement->Step();
  if (!has_row) {
    return utils::MakeUnexpected(has_row.error());
  }
  if (!*has_row) {
    return utils::MakeUnexpected(utils::MakeError(
        utils::ErrorCode::kCaseNotFound, std::string("Case not found in ") + Table(), key));
  }

  auto decoded = DecodeRow(*statement);
  if (!decoded) {
    return utils::MakeUnexpected(decoded.error());
  }
  return use_cache ? Remember(*decoded) : *decoded;
}

utils::Expected<CaseCursor, utils::Error> CategoryStore::All(bool cache) {
  std::string sql = table_present_ ? std::string("SELECT * FROM ") + Table() + " ORDER BY id ASC"
                                   : std::string("SELECT NULL WHERE 0");
  auto statement = connection_.Prepare(sql);
  if (!statement) {
    return utils::MakeUnexpected(statement.error());
  }
  return CaseCursor(this, std::move(*statement), cache);
}

utils::Expected<void, utils::Error> CategoryStore::LoadAll() {
  auto cursor = All(true);
  if (!cursor) {
    return utils::MakeUnexpected(cursor.error());
  }
  while (true) {
    auto has_case = cursor->Next();
    if (!has_case) {
      return utils::MakeUnexpected(has_case.error());
    }
    if (!*has_case) {
      break;
    }
  }
  spdlog::debug("Loaded {} cases from {}", cache_.size(), Table());
  return {};
}

CasePtr CategoryStore::Remember(const CasePtr& decoded) {
  auto iter = cache_.emplace(decoded->Coordinate(), decoded).first;
  return iter->second;
}

utils::Expected<CasePtr, utils::Error> CategoryStore::DecodeRow(const storage::Statement& row) const {
  std::string key = row.ColumnText(kKeyColumn);
  if (row.ColumnCount() < RequiredColumns(category_)) {
    utils::LogDecodeError(Table(), key, "unexpected column count");
    return utils::MakeUnexpected(utils::MakeError(
        utils::ErrorCode::kDecodeError,
        std::string("Table ") + Table() + " has " + std::to_string(row.ColumnCount()) + " columns", key));
  }

  hierarchy::IterationCoordinate coordinate(key);
  CaseData data;
  data.category = category_;
  data.source = DeriveSource(category_, coordinate);
  data.coordinate = key;
  data.counter = row.ColumnInt64(kCounterColumn);
  data.timestamp = row.ColumnDouble(kTimestampColumn);
  data.success = row.ColumnInt64(kSuccessColumn) != 0;
  data.message = row.ColumnText(kMessageColumn);

  const int64_t version = catalog_->FormatVersion();
  auto shapes = catalog_->ShapeLookup();

  auto decode = [&](int column, metadata::IoKind io,
                    std::optional<VariableValues>& target) -> utils::Expected<void, utils::Error> {
    auto values = codec::DecodeValues(version, RawColumn(row, column), shapes, key);
    if (!values) {
      utils::LogDecodeError(Table(), key, values.error().message());
      return utils::MakeUnexpected(values.error());
    }
    if (*values) {
      target.emplace(std::move(**values), io, catalog_);
    }
    return {};
  };

  utils::Expected<void, utils::Error> status;
  switch (category_) {
    case Category::kDriver:
      status = decode(6, metadata::IoKind::kInput, data.inputs).and_then([&]() {
        return decode(7, metadata::IoKind::kOutput, data.outputs);
      });
      break;
    case Category::kSystem:
      status = decode(6, metadata::IoKind::kInput, data.inputs)
                   .and_then([&]() { return decode(7, metadata::IoKind::kOutput, data.outputs); })
                   .and_then([&]() { return decode(8, metadata::IoKind::kOutput, data.residuals); });
      break;
    case Category::kSolver:
      data.abs_err = row.ColumnOptionalDouble(6);
      data.rel_err = row.ColumnOptionalDouble(7);
      status = decode(8, metadata::IoKind::kInput, data.inputs)
                   .and_then([&]() { return decode(9, metadata::IoKind::kOutput, data.outputs); })
                   .and_then([&]() { return decode(10, metadata::IoKind::kOutput, data.residuals); });
      break;
    case Category::kProblem:
      status = decode(6, metadata::IoKind::kOutput, data.outputs);
      break;
    case Category::kDriverDerivative: {
      auto derivatives = codec::DecodeDerivatives(RawColumn(row, 6), key);
      if (!derivatives) {
        utils::LogDecodeError(Table(), key, derivatives.error().message());
        return utils::MakeUnexpected(derivatives.error());
      }
      if (*derivatives) {
        data.jacobian.emplace(std::move(**derivatives), catalog_);
      }
      break;
    }
  }
  if (!status) {
    return utils::MakeUnexpected(status.error());
  }
  return std::make_shared<const Case>(std::move(data), catalog_);
}

}  // namespace casereader::cases
