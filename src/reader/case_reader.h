/**
 * @file case_reader.h
 * @brief Read-only access to a recorded case store
 *
 * CaseReader opens a SQLite case store, decodes its metadata, snapshots the
 * recorded coordinates of every category and answers queries over them:
 *
 * - sources: "driver", "problem", or a hierarchy location ("root",
 *   "root.mda.nonlinear_solver", ...)
 * - flat listings in execution order, or nested listings following the
 *   coordinate hierarchy
 * - single cases by coordinate or problem case name
 *
 * The coordinate snapshot is taken at open and not refreshed.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "cases/case.h"
#include "cases/category_store.h"
#include "codec/nd_array.h"
#include "config/config.h"
#include "hierarchy/hierarchy_resolver.h"
#include "metadata/metadata_catalog.h"
#include "reader/case_sequence.h"
#include "storage/sqlite_connection.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace casereader::reader {

/**
 * @brief Node of a nested case listing
 */
struct CaseNode {
  cases::CasePtr value;
  std::vector<CaseNode> children;
};

/**
 * @brief Variable names recorded by one source
 */
struct SourceVars {
  std::vector<std::string> inputs;
  std::vector<std::string> outputs;
  std::vector<std::string> residuals;
};

/**
 * @brief One row of ListInputs / ListOutputs
 *
 * Metadata fields are empty when the variable is missing from the catalog.
 */
struct VariableListing {
  std::string name;  ///< Absolute name
  std::optional<std::string> promoted_name;
  codec::NdArray value;
  std::optional<codec::NdArray> residuals;  ///< Outputs only; empty when not recorded
  std::optional<std::string> units;
  std::vector<size_t> shape;
  bool explicit_output = true;
  std::optional<codec::NdArray> lower;
  std::optional<codec::NdArray> upper;
  std::optional<codec::NdArray> ref;
  std::optional<codec::NdArray> ref0;
  std::optional<codec::NdArray> res_ref;
};

struct OutputListOptions {
  bool explicit_outputs = true;          ///< Include outputs of explicit components
  bool implicit_outputs = true;          ///< Include outputs of implicit components
  std::optional<double> residuals_tol;  ///< Drop outputs whose recorded residual norm is below this
};

class CaseReader {
 public:
  /**
   * @brief Open a case store
   *
   * @param path SQLite file written by the recorder
   * @param config Reader configuration (caching default, preload)
   * @return kInvalidStore for a missing, unreadable or non-SQLite file or a
   *         missing metadata row; kUnsupportedFormatVersion for an unknown
   *         format version
   */
  static utils::Expected<std::unique_ptr<CaseReader>, utils::Error> Open(const std::string& path,
                                                                         const config::ReaderConfig& config = {});

  CaseReader(const CaseReader&) = delete;
  CaseReader& operator=(const CaseReader&) = delete;

  [[nodiscard]] int64_t FormatVersion() const { return catalog_->FormatVersion(); }
  [[nodiscard]] const metadata::MetadataCatalog& Catalog() const { return *catalog_; }
  [[nodiscard]] const std::string& Path() const { return connection_->Path(); }

  /**
   * @brief Sources with recorded data
   *
   * "driver" and "problem" when those tables hold cases, then every system
   * and solver location in first-recorded order.
   */
  [[nodiscard]] std::vector<std::string> ListSources() const;

  /**
   * @brief Coordinates of a source in execution order
   *
   * @param source "driver", "problem", a hierarchy location, an iteration
   *        coordinate (which lists itself and its descendants) or empty for
   *        the root
   * @param recurse Also list every descendant of each listed case, driver
   *        and location cases included
   * @return kSourceNotFound for an unknown source
   */
  [[nodiscard]] utils::Expected<std::vector<std::string>, utils::Error> ListCases(const std::string& source = "",
                                                                                  bool recurse = false) const;

  /**
   * @brief Coordinates of a source as a tree
   *
   * Driver and location cases carry their subtrees when @p recurse.
   */
  [[nodiscard]] utils::Expected<std::vector<hierarchy::CoordinateNode>, utils::Error> ListCasesNested(
      const std::string& source = "", bool recurse = true) const;

  /**
   * @brief Fetch one case by iteration coordinate or problem case name
   *
   * Uses the configured caching default.
   *
   * @return kCaseNotFound when no category recorded the key
   */
  utils::Expected<cases::CasePtr, utils::Error> GetCase(const std::string& id);
  utils::Expected<cases::CasePtr, utils::Error> GetCase(const std::string& id, bool use_cache);

  /**
   * @brief Derivative case recorded at a driver coordinate
   */
  utils::Expected<cases::CasePtr, utils::Error> GetDerivativeCase(const std::string& coordinate);

  /**
   * @brief Cases of a source as a lazy sequence, in the order of ListCases
   */
  utils::Expected<CaseSequence, utils::Error> GetCases(const std::string& source = "problem", bool recurse = true);

  /**
   * @brief Cases of a source as a tree, in the shape of ListCasesNested
   */
  utils::Expected<std::vector<CaseNode>, utils::Error> GetCasesNested(const std::string& source = "problem",
                                                                      bool recurse = true);

  /**
   * @brief Variable names recorded by the first case of a source
   */
  utils::Expected<SourceVars, utils::Error> ListSourceVars(const std::string& source);

  /**
   * @brief Inputs of @p from_case, or the latest recorded inputs of every system
   *
   * Without a case, system cases are scanned from the newest; each system
   * (coordinate with its indices stripped) contributes once.
   */
  utils::Expected<std::vector<VariableListing>, utils::Error> ListInputs(const cases::Case* from_case = nullptr);

  /**
   * @brief Outputs of @p from_case, or the latest recorded outputs of every system
   *
   * Explicit outputs come first, then implicit ones.
   *
   * @return kInvalidArgument if both explicit and implicit outputs are excluded
   */
  utils::Expected<std::vector<VariableListing>, utils::Error> ListOutputs(const cases::Case* from_case = nullptr,
                                                                          const OutputListOptions& options = {});

  /**
   * @brief Decode every case into the category caches
   */
  utils::Expected<void, utils::Error> LoadCases();

  /// Decoded driver metadata (model viewer data)
  [[nodiscard]] utils::Expected<nlohmann::json, utils::Error> DriverMetadata() const {
    return catalog_->DriverMetadata();
  }

  [[nodiscard]] utils::Expected<nlohmann::json, utils::Error> SystemMetadata(const std::string& id) const {
    return catalog_->SystemMetadata(id);
  }

  [[nodiscard]] utils::Expected<nlohmann::json, utils::Error> SolverMetadata(const std::string& id) const {
    return catalog_->SolverMetadata(id);
  }

  /// Store of one category
  [[nodiscard]] cases::CategoryStore& Store(cases::Category category);
  [[nodiscard]] const cases::CategoryStore& Store(cases::Category category) const;

 private:
  CaseReader(std::unique_ptr<storage::SqliteConnection> connection,
             std::shared_ptr<const metadata::MetadataCatalog> catalog, const config::ReaderConfig& config);

  utils::Expected<void, utils::Error> LoadCoordinates();

  /**
   * @brief Flat plan for a source, in execution order
   */
  [[nodiscard]] utils::Expected<std::vector<hierarchy::ResolvedCoordinate>, utils::Error> Plan(
      const std::string& source, bool recurse) const;

  /// @p heads followed by every descendant of each, without repeats, in execution order
  [[nodiscard]] std::vector<hierarchy::ResolvedCoordinate> WithDescendants(
      std::vector<hierarchy::ResolvedCoordinate> heads) const;

  /// Coordinates recorded by a system or solver location, in execution order
  [[nodiscard]] std::vector<hierarchy::ResolvedCoordinate> LocationCoordinates(const std::string& source) const;

  utils::Expected<std::vector<CaseNode>, utils::Error> FetchTree(const std::vector<hierarchy::CoordinateNode>& nodes);

  /// Latest inputs or outputs of each recorded system (abs name -> case)
  utils::Expected<std::vector<std::pair<std::string, cases::CasePtr>>, utils::Error> LatestSystemVariables(
      bool outputs);

  static void CaseVariables(const cases::CasePtr& from_case, bool outputs,
                            std::vector<std::pair<std::string, cases::CasePtr>>& out);

  [[nodiscard]] utils::Expected<VariableListing, utils::Error> MakeListing(const std::string& abs_name,
                                                                           const cases::Case& from_case,
                                                                           bool outputs) const;

  std::unique_ptr<storage::SqliteConnection> connection_;
  std::shared_ptr<const metadata::MetadataCatalog> catalog_;
  config::ReaderConfig config_;

  cases::CategoryStore driver_;
  cases::CategoryStore driver_derivatives_;
  cases::CategoryStore system_;
  cases::CategoryStore solver_;
  cases::CategoryStore problem_;

  std::unique_ptr<hierarchy::HierarchyResolver> resolver_;
};

}  // namespace casereader::reader
