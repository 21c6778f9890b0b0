/**
 * @file hierarchy_resolver.h
 * @brief Parent/child inference over the recorded iteration coordinates
 *
 * No parent pointers are stored. A case is a direct child of a parent when
 * the parent coordinate is its prefix (ending at a '|') and its segment count
 * is the next recorded depth after the parent's. The root (empty parent) has
 * the base depth 2.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "cases/category_store.h"

namespace casereader::hierarchy {

/**
 * @brief A recorded coordinate together with the store it lives in
 */
struct ResolvedCoordinate {
  cases::Category category = cases::Category::kDriver;
  std::string coordinate;
  int64_t counter = 0;

  bool operator==(const ResolvedCoordinate& other) const {
    return category == other.category && coordinate == other.coordinate && counter == other.counter;
  }
};

/**
 * @brief Node of a nested listing
 */
struct CoordinateNode {
  ResolvedCoordinate value;
  std::vector<CoordinateNode> children;
};

class HierarchyResolver {
 public:
  /**
   * @brief Snapshot depths of the given stores
   *
   * The stores must outlive the resolver.
   */
  HierarchyResolver(const cases::CategoryStore& driver, const cases::CategoryStore& system,
                    const cases::CategoryStore& solver);

  /// Sorted distinct segment counts of every recorded coordinate, always including 2
  [[nodiscard]] const std::vector<size_t>& CoordLengths() const { return coord_lengths_; }

  /**
   * @brief Depth of the direct children of a parent with @p parent_length segments
   * @return std::nullopt at the deepest recorded level
   */
  [[nodiscard]] std::optional<size_t> ExpectedChildLength(size_t parent_length) const;

  /**
   * @brief Direct children of @p parent
   *
   * Root children are every driver coordinate, or when no driver case was
   * recorded, the solver coordinates of the first recorded depth. Children
   * of a concrete parent are searched in driver, solver, system order.
   *
   * A store holding both driver cases and driver-less top-level solver
   * cases is not disambiguated: the driver cases alone become the root's
   * children.
   */
  [[nodiscard]] std::vector<ResolvedCoordinate> Children(const std::string& parent) const;

  /**
   * @brief Children of @p parent, each followed by its own descendants when @p recurse
   */
  [[nodiscard]] std::vector<ResolvedCoordinate> Descendants(const std::string& parent, bool recurse) const;

  /**
   * @brief Children of @p parent as a tree (one level unless @p recurse)
   */
  [[nodiscard]] std::vector<CoordinateNode> Tree(const std::string& parent, bool recurse) const;

  /**
   * @brief Locate a recorded coordinate (driver, solver, then system)
   */
  [[nodiscard]] std::optional<ResolvedCoordinate> Find(const std::string& coordinate) const;

 private:
  /**
   * @brief Children of a parent whose segment count is already known
   * @return the children and their common segment count
   */
  [[nodiscard]] std::pair<std::vector<ResolvedCoordinate>, size_t> ChildrenAt(const std::string& parent,
                                                                              size_t parent_length) const;

  void AppendDescendants(const std::string& parent, size_t parent_length, bool recurse,
                         std::vector<ResolvedCoordinate>& out) const;

  [[nodiscard]] std::vector<CoordinateNode> TreeAt(const std::string& parent, size_t parent_length,
                                                   bool recurse) const;

  const cases::CategoryStore& driver_;
  const cases::CategoryStore& system_;
  const cases::CategoryStore& solver_;
  std::vector<size_t> coord_lengths_;
};

/**
 * @brief Sort by counter (execution order), keeping the relative order of equal counters
 */
void SortByCounter(std::vector<ResolvedCoordinate>& coordinates);

}  // namespace casereader::hierarchy
