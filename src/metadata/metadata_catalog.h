/**
 * @file metadata_catalog.h
 * @brief Per-variable metadata and name maps of a case store
 *
 * The catalog is built once from the single `metadata` row and is read-only
 * afterwards. Absolute and promoted names are mapped separately for inputs
 * and outputs because one promoted name may exist in both namespaces.
 */

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "codec/nd_array.h"
#include "codec/value_decoder.h"
#include "storage/sqlite_connection.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace casereader::metadata {

/**
 * @brief Variable namespace
 */
enum class IoKind : std::uint8_t { kInput, kOutput };

const char* IoKindToString(IoKind io);

/**
 * @brief Metadata of one absolute variable
 */
struct VariableMeta {
  std::string name;  ///< Absolute name
  std::vector<size_t> shape;
  size_t size = 1;
  std::optional<std::string> units;
  bool explicit_output = true;          ///< Output of an explicit component
  std::vector<std::string> type_tags;   ///< "input", "output", "desvar", "objective", "constraint", ...
  std::optional<codec::NdArray> lower;  ///< Broadcast to shape
  std::optional<codec::NdArray> upper;  ///< Broadcast to shape
  std::optional<codec::NdArray> ref;
  std::optional<codec::NdArray> ref0;
  std::optional<codec::NdArray> res_ref;
  nlohmann::json var_settings;  ///< null unless recorded (format >= 4)

  [[nodiscard]] bool HasTag(const std::string& tag) const;
};

/**
 * @brief Decoded metadata catalog
 */
class MetadataCatalog {
 public:
  /**
   * @brief Read and decode the `metadata` row plus auxiliary metadata tables
   *
   * Errors:
   * - kInvalidStore: no `metadata` table or row
   * - kUnsupportedFormatVersion: format_version outside 1-4
   * - kDecodeError: a name map or abs2meta cannot be decoded
   */
  static utils::Expected<std::shared_ptr<const MetadataCatalog>, utils::Error> Build(
      const storage::SqliteConnection& connection);

  /**
   * @brief Build from already decoded maps (format >= 3 layout)
   */
  static utils::Expected<std::shared_ptr<const MetadataCatalog>, utils::Error> FromJson(
      int64_t format_version, const nlohmann::json& abs2prom, const nlohmann::json& prom2abs,
      const nlohmann::json& abs2meta, const nlohmann::json& var_settings);

  [[nodiscard]] int64_t FormatVersion() const { return format_version_; }

  /**
   * @brief Metadata for an absolute or promoted name
   *
   * Promoted names resolve through prom2abs of @p io. A promoted name that
   * maps to several absolute names (connected inputs) is ambiguous.
   *
   * @return kUnknownVariable when missing or ambiguous
   */
  [[nodiscard]] utils::Expected<const VariableMeta*, utils::Error> Meta(const std::string& name, IoKind io) const;

  /**
   * @brief Metadata by absolute name regardless of namespace
   */
  [[nodiscard]] const VariableMeta* FindAbsolute(const std::string& abs_name) const;

  /**
   * @brief Absolute names a promoted name maps to (empty if unknown)
   */
  [[nodiscard]] std::vector<std::string> AbsoluteNames(const std::string& prom_name, IoKind io) const;

  /**
   * @brief Promoted name of an absolute name
   */
  [[nodiscard]] std::optional<std::string> PromotedName(const std::string& abs_name, IoKind io) const;

  /**
   * @brief Declared shape of an absolute name, for value decoding
   */
  [[nodiscard]] std::optional<std::vector<size_t>> Shape(const std::string& abs_name) const;

  /**
   * @brief Shape callback bound to this catalog
   */
  [[nodiscard]] codec::ShapeLookup ShapeLookup() const;

  /**
   * @brief All absolute variable names, sorted
   */
  [[nodiscard]] std::vector<std::string> VariableNames() const;

  /**
   * @brief Raw var_settings object (null for format < 4)
   */
  [[nodiscard]] const nlohmann::json& VarSettings() const { return var_settings_; }

  /**
   * @brief Decoded driver_metadata.model_viewer_data
   * @return kNotFound when no driver metadata was recorded
   */
  [[nodiscard]] utils::Expected<nlohmann::json, utils::Error> DriverMetadata() const;

  /**
   * @brief Decoded system_metadata row {"scaling_factors", "component_options"}
   * @return kNotFound for an unknown id
   */
  [[nodiscard]] utils::Expected<nlohmann::json, utils::Error> SystemMetadata(const std::string& id) const;

  /**
   * @brief Decoded solver_metadata row {"solver_options", "solver_class"}
   * @return kNotFound for an unknown id
   */
  [[nodiscard]] utils::Expected<nlohmann::json, utils::Error> SolverMetadata(const std::string& id) const;

  [[nodiscard]] std::vector<std::string> SystemMetadataIds() const;
  [[nodiscard]] std::vector<std::string> SolverMetadataIds() const;

 private:
  struct SystemMetadataBlobs {
    std::optional<std::string> scaling_factors;
    std::optional<std::string> component_metadata;
  };

  struct SolverMetadataBlobs {
    std::optional<std::string> solver_options;
    std::string solver_class;
  };

  MetadataCatalog() = default;

  utils::Expected<void, utils::Error> LoadNameMaps(const nlohmann::json& abs2prom, const nlohmann::json& prom2abs);
  utils::Expected<void, utils::Error> LoadVariables(const nlohmann::json& abs2meta);
  utils::Expected<void, utils::Error> LoadAuxiliary(const storage::SqliteConnection& connection);

  static size_t Index(IoKind io) { return io == IoKind::kInput ? 0 : 1; }

  int64_t format_version_ = 0;
  std::unordered_map<std::string, std::string> abs2prom_[2];
  std::unordered_map<std::string, std::vector<std::string>> prom2abs_[2];
  std::map<std::string, VariableMeta> variables_;
  nlohmann::json var_settings_;

  std::optional<std::string> driver_metadata_;
  std::map<std::string, SystemMetadataBlobs> system_metadata_;
  std::map<std::string, SolverMetadataBlobs> solver_metadata_;
};

}  // namespace casereader::metadata
