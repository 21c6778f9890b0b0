/**
 * @file case.h
 * @brief Immutable record of one recorded event
 */

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "codec/nd_array.h"
#include "metadata/metadata_catalog.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace casereader::cases {

/**
 * @brief Table a case was read from
 */
enum class Category : std::uint8_t {
  kDriver,
  kDriverDerivative,
  kSystem,
  kSolver,
  kProblem,
};

/**
 * @brief Short category name ("driver", "driver_derivative", "system", "solver", "problem")
 */
const char* CategoryToString(Category category);

/**
 * @brief Name -> array mapping of one case attribute (inputs, outputs or residuals)
 *
 * Variables are stored under their recorded (absolute) names. Lookups also
 * accept promoted names, resolved through the catalog namespace the mapping
 * was recorded in.
 */
class VariableValues {
 public:
  VariableValues() = default;
  VariableValues(codec::NamedArrays values, metadata::IoKind io,
                 std::shared_ptr<const metadata::MetadataCatalog> catalog);

  /**
   * @brief Value by absolute or promoted name
   *
   * @return kUnknownVariable if no recorded variable matches, or if a promoted
   *         name matches several recorded absolute names
   */
  [[nodiscard]] utils::Expected<codec::NdArray, utils::Error> Get(const std::string& name) const;

  [[nodiscard]] bool Contains(const std::string& name) const;
  [[nodiscard]] size_t Size() const { return values_.size(); }
  [[nodiscard]] bool Empty() const { return values_.empty(); }

  /// Recorded (name, value) pairs in recorded order
  [[nodiscard]] const codec::NamedArrays& Items() const { return values_; }

  [[nodiscard]] std::vector<std::string> Names() const;

  /**
   * @brief Recorded names converted to absolute names
   *
   * A recorded promoted name maps to its first absolute name.
   */
  [[nodiscard]] std::vector<std::string> AbsoluteNames() const;

  [[nodiscard]] metadata::IoKind Io() const { return io_; }

  /// Value equality; the catalog is not compared
  bool operator==(const VariableValues& other) const;
  bool operator!=(const VariableValues& other) const { return !(*this == other); }

 private:
  const codec::NdArray* FindRecorded(const std::string& name) const;

  codec::NamedArrays values_;
  metadata::IoKind io_ = metadata::IoKind::kOutput;
  std::shared_ptr<const metadata::MetadataCatalog> catalog_;
};

/**
 * @brief Derivatives of a driver-derivative case keyed by (of, wrt)
 */
class Jacobian {
 public:
  Jacobian() = default;
  Jacobian(codec::NamedArrays entries, std::shared_ptr<const metadata::MetadataCatalog> catalog);

  /**
   * @brief Derivative block d(of)/d(wrt)
   *
   * Both names may be absolute or promoted.
   *
   * @return kUnknownVariable if the pair was not recorded
   */
  [[nodiscard]] utils::Expected<codec::NdArray, utils::Error> Get(const std::string& of, const std::string& wrt) const;

  /// Recorded keys, "of,wrt"
  [[nodiscard]] std::vector<std::string> Keys() const;
  [[nodiscard]] size_t Size() const { return entries_.size(); }

  bool operator==(const Jacobian& other) const { return entries_ == other.entries_; }
  bool operator!=(const Jacobian& other) const { return !(*this == other); }

 private:
  std::vector<std::string> Candidates(const std::string& name) const;

  std::map<std::string, codec::NdArray> entries_;
  std::shared_ptr<const metadata::MetadataCatalog> catalog_;
};

/**
 * @brief One recorded event
 *
 * Fields present depend on the category:
 * - driver: inputs, outputs
 * - driver_derivative: jacobian
 * - system: inputs, outputs, residuals
 * - solver: inputs, outputs, residuals, abs_err, rel_err
 * - problem: outputs
 *
 * Any of these may still be absent when the recorder stored NULL.
 */
struct CaseData {
  Category category = Category::kDriver;
  std::string source;
  std::string coordinate;  ///< Case name for problem cases
  int64_t counter = 0;
  double timestamp = 0.0;
  bool success = true;
  std::string message;

  std::optional<VariableValues> inputs;
  std::optional<VariableValues> outputs;
  std::optional<VariableValues> residuals;
  std::optional<double> abs_err;
  std::optional<double> rel_err;
  std::optional<Jacobian> jacobian;
};

class Case {
 public:
  Case(CaseData data, std::shared_ptr<const metadata::MetadataCatalog> catalog)
      : data_(std::move(data)), catalog_(std::move(catalog)) {}

  [[nodiscard]] Category GetCategory() const { return data_.category; }
  [[nodiscard]] const std::string& Source() const { return data_.source; }
  [[nodiscard]] const std::string& Coordinate() const { return data_.coordinate; }
  [[nodiscard]] const std::string& Name() const { return data_.coordinate; }
  [[nodiscard]] int64_t Counter() const { return data_.counter; }
  [[nodiscard]] double Timestamp() const { return data_.timestamp; }
  [[nodiscard]] bool Success() const { return data_.success; }
  [[nodiscard]] const std::string& Message() const { return data_.message; }

  [[nodiscard]] const std::optional<VariableValues>& Inputs() const { return data_.inputs; }
  [[nodiscard]] const std::optional<VariableValues>& Outputs() const { return data_.outputs; }
  [[nodiscard]] const std::optional<VariableValues>& Residuals() const { return data_.residuals; }
  [[nodiscard]] const std::optional<double>& AbsErr() const { return data_.abs_err; }
  [[nodiscard]] const std::optional<double>& RelErr() const { return data_.rel_err; }
  [[nodiscard]] const std::optional<Jacobian>& GetJacobian() const { return data_.jacobian; }

  /**
   * @brief Look a variable up in outputs, then inputs
   */
  [[nodiscard]] utils::Expected<codec::NdArray, utils::Error> Get(const std::string& name) const;

  /**
   * @brief Recorded outputs tagged "desvar", keyed by promoted name
   */
  [[nodiscard]] std::map<std::string, codec::NdArray> GetDesignVariables() const;

  /**
   * @brief Recorded outputs tagged "objective", keyed by promoted name
   */
  [[nodiscard]] std::map<std::string, codec::NdArray> GetObjectives() const;

  /**
   * @brief Recorded outputs tagged "constraint", keyed by promoted name
   */
  [[nodiscard]] std::map<std::string, codec::NdArray> GetConstraints() const;

  /**
   * @brief Objectives and constraints
   */
  [[nodiscard]] std::map<std::string, codec::NdArray> GetResponses() const;

  bool operator==(const Case& other) const;
  bool operator!=(const Case& other) const { return !(*this == other); }

 private:
  std::map<std::string, codec::NdArray> OutputsTagged(const std::vector<std::string>& tags) const;

  CaseData data_;
  std::shared_ptr<const metadata::MetadataCatalog> catalog_;
};

using CasePtr = std::shared_ptr<const Case>;

}  // namespace casereader::cases
