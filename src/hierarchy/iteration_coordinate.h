/**
 * @file iteration_coordinate.h
 * @brief Parsed iteration coordinate and hierarchy source derivation
 *
 * An iteration coordinate alternates identifier and index segments joined by
 * '|', for example:
 *
 *   rank0:SLSQP|0|root._solve_nonlinear|0|NLRunOnce|0
 *
 * Splitting on the pattern `\|\d+\|*` yields the identifier segments followed
 * by a trailing empty segment:
 *
 *   ["rank0:SLSQP", "root._solve_nonlinear", "NLRunOnce", ""]
 *
 * The number of pieces is the coordinate's length. A driver coordinate
 * ("rank0:SLSQP|3") has the base length 2.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace casereader::hierarchy {

/**
 * @brief Coordinate string with its split form computed once
 */
class IterationCoordinate {
 public:
  /// Length of a driver coordinate and of the implicit root
  static constexpr size_t kBaseLength = 2;

  IterationCoordinate() = default;
  explicit IterationCoordinate(std::string raw);

  /**
   * @brief Split a coordinate string on `\|\d+\|*`
   *
   * Every piece between matches is kept, including a trailing empty piece.
   * The empty string splits into an empty list.
   */
  static std::vector<std::string> Split(const std::string& raw);

  [[nodiscard]] const std::string& Raw() const { return raw_; }
  [[nodiscard]] const std::vector<std::string>& Segments() const { return segments_; }
  [[nodiscard]] size_t Length() const { return segments_.size(); }
  [[nodiscard]] bool Empty() const { return raw_.empty(); }

  /**
   * @brief True if @p parent is a literal prefix of this coordinate ending at a '|' boundary
   *
   * The empty parent (the root) is an ancestor of every coordinate.
   */
  [[nodiscard]] bool HasPrefix(const std::string& parent) const;

  bool operator==(const IterationCoordinate& other) const { return raw_ == other.raw_; }
  bool operator!=(const IterationCoordinate& other) const { return raw_ != other.raw_; }

 private:
  std::string raw_;
  std::vector<std::string> segments_;
};

/**
 * @brief Source of a system coordinate
 *
 * The last segment must name `<path>._solve_nonlinear`. "root" stays
 * "root"; any other path p becomes "root.p".
 */
std::optional<std::string> SystemSourceOf(const IterationCoordinate& coordinate);

/**
 * @brief Source of a solver coordinate
 *
 * The owning system is the last `._solve_nonlinear` segment. One identifier
 * after it gives "<system>.nonlinear_solver"; two give
 * "<system>.nonlinear_solver.linesearch".
 */
std::optional<std::string> SolverSourceOf(const IterationCoordinate& coordinate);

/**
 * @brief True if a source string names a hierarchy location ("root", "root.x", ...)
 */
bool IsHierarchySource(const std::string& source);

}  // namespace casereader::hierarchy
