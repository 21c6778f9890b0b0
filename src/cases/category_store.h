/**
 * @file category_store.h
 * @brief Cases of one category: coordinate snapshot, point fetch and cache
 *
 * Each recorded table (driver_iterations, driver_derivatives,
 * system_iterations, solver_iterations, problem_cases) gets one store. The
 * ordered key list is read once at open; cases are decoded on demand.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "cases/case.h"
#include "hierarchy/iteration_coordinate.h"
#include "metadata/metadata_catalog.h"
#include "storage/sqlite_connection.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace casereader::cases {

/**
 * @brief Key of one recorded row in write order
 */
struct CoordinateEntry {
  hierarchy::IterationCoordinate coordinate;  ///< Case name for problem cases
  int64_t counter = 0;
};

/**
 * @brief Table name of a category
 */
const char* TableName(Category category);

/**
 * @brief Source a case of @p category reports
 *
 * "driver" for driver and derivative cases, "problem" for problem cases,
 * otherwise the hierarchy location derived from the coordinate. A coordinate
 * that does not name a system falls back to the category name.
 */
std::string DeriveSource(Category category, const hierarchy::IterationCoordinate& coordinate);

class CategoryStore;

/**
 * @brief Forward-only cursor over every row of a table, in write order
 *
 * Restart() rewinds to the first row.
 */
class CaseCursor {
 public:
  CaseCursor(CaseCursor&&) noexcept = default;
  CaseCursor& operator=(CaseCursor&&) noexcept = default;
  CaseCursor(const CaseCursor&) = delete;
  CaseCursor& operator=(const CaseCursor&) = delete;

  /**
   * @brief Decode the next row
   * @return false at the end of the table
   */
  utils::Expected<bool, utils::Error> Next();

  /// Case produced by the last successful Next()
  [[nodiscard]] const CasePtr& Current() const { return current_; }

  void Restart();

 private:
  friend class CategoryStore;

  CaseCursor(CategoryStore* store, storage::Statement statement, bool cache)
      : store_(store), statement_(std::move(statement)), cache_(cache) {}

  CategoryStore* store_ = nullptr;
  storage::Statement statement_;
  bool cache_ = false;
  CasePtr current_;
};

/**
 * @brief Store of one case category
 */
class CategoryStore {
 public:
  CategoryStore(Category category, const storage::SqliteConnection& connection,
                std::shared_ptr<const metadata::MetadataCatalog> catalog);

  CategoryStore(const CategoryStore&) = delete;
  CategoryStore& operator=(const CategoryStore&) = delete;

  /**
   * @brief Read the ordered key list
   *
   * driver_derivatives and problem_cases may be missing in stores older
   * than format 2; the store is then empty.
   *
   * @return kInvalidStore if a required table is missing
   */
  utils::Expected<void, utils::Error> LoadCoordinates();

  /**
   * @brief Fetch and decode one case
   *
   * @param key Iteration coordinate, or case name for problem cases
   * @param use_cache Return the cached case if present and cache a fresh one
   * @return kCaseNotFound if no row matches, kDecodeError if a value column
   *         cannot be decoded
   */
  utils::Expected<CasePtr, utils::Error> Get(const std::string& key, bool use_cache);

  /**
   * @brief Cursor over the whole table in write order
   * @param cache Insert every decoded case into the cache
   */
  utils::Expected<CaseCursor, utils::Error> All(bool cache);

  /**
   * @brief Decode every row into the cache
   */
  utils::Expected<void, utils::Error> LoadAll();

  [[nodiscard]] Category GetCategory() const { return category_; }
  [[nodiscard]] const char* Table() const { return TableName(category_); }
  [[nodiscard]] bool TablePresent() const { return table_present_; }

  /// Keys in write order
  [[nodiscard]] const std::vector<CoordinateEntry>& Coordinates() const { return coordinates_; }

  [[nodiscard]] bool Contains(const std::string& key) const { return index_.count(key) > 0; }
  [[nodiscard]] std::optional<int64_t> CounterOf(const std::string& key) const;
  [[nodiscard]] size_t Size() const { return coordinates_.size(); }

  [[nodiscard]] size_t CacheSize() const { return cache_.size(); }
  void ClearCache() { cache_.clear(); }

 private:
  friend class CaseCursor;

  [[nodiscard]] const char* KeyColumn() const;
  [[nodiscard]] utils::Expected<CasePtr, utils::Error> DecodeRow(const storage::Statement& row) const;

  /// Insert into the cache, keeping an already cached instance
  CasePtr Remember(const CasePtr& decoded);

  Category category_;
  const storage::SqliteConnection& connection_;
  std::shared_ptr<const metadata::MetadataCatalog> catalog_;

  bool table_present_ = false;
  std::vector<CoordinateEntry> coordinates_;
  std::unordered_map<std::string, size_t> index_;
  std::unordered_map<std::string, CasePtr> cache_;
};

}  // namespace casereader::cases
