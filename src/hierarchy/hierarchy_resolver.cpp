/**
 * @file hierarchy_resolver.cpp
 * @brief Coordinate hierarchy resolution
 */

#include "hierarchy/hierarchy_resolver.h"

#include <algorithm>
#include <initializer_list>
#include <set>
#include <utility>

namespace casereader::hierarchy {

namespace {

ResolvedCoordinate Resolve(cases::Category category, const cases::CoordinateEntry& entry) {
  return ResolvedCoordinate{category, entry.coordinate.Raw(), entry.counter};
}

}  // namespace

HierarchyResolver::HierarchyResolver(const cases::CategoryStore& driver, const cases::CategoryStore& system,
                                     const cases::CategoryStore& solver)
    : driver_(driver), system_(system), solver_(solver) {
  std::set<size_t> lengths{IterationCoordinate::kBaseLength};
  for (const cases::CategoryStore* store : {&driver_, &system_, &solver_}) {
    for (const auto& entry : store->Coordinates()) {
      lengths.insert(entry.coordinate.Length());
    }
  }
  coord_lengths_.assign(lengths.begin(), lengths.end());
}

std::optional<size_t> HierarchyResolver::ExpectedChildLength(size_t parent_length) const {
  auto iter = std::upper_bound(coord_lengths_.begin(), coord_lengths_.end(), parent_length);
  if (iter == coord_lengths_.end()) {
    return std::nullopt;
  }
  return *iter;
}

std::vector<ResolvedCoordinate> HierarchyResolver::Children(const std::string& parent) const {
  size_t parent_length = parent.empty() ? 0 : IterationCoordinate::Split(parent).size();
  return ChildrenAt(parent, parent_length).first;
}

std::pair<std::vector<ResolvedCoordinate>, size_t> HierarchyResolver::ChildrenAt(const std::string& parent,
                                                                                 size_t parent_length) const {
  std::vector<ResolvedCoordinate> children;

  // Driver cases take the root even when driver-less top-level solver cases exist
  if (parent.empty()) {
    if (driver_.Size() > 0) {
      for (const auto& entry : driver_.Coordinates()) {
        children.push_back(Resolve(cases::Category::kDriver, entry));
      }
      return {std::move(children), IterationCoordinate::kBaseLength};
    }
    if (coord_lengths_.size() > 1) {
      size_t first_depth = coord_lengths_[1];
      for (const auto& entry : solver_.Coordinates()) {
        if (entry.coordinate.Length() == first_depth) {
          children.push_back(Resolve(cases::Category::kSolver, entry));
        }
      }
      return {std::move(children), first_depth};
    }
    return {std::move(children), 0};
  }

  auto expected = ExpectedChildLength(parent_length);
  if (!expected) {
    return {std::move(children), 0};
  }
  const std::pair<cases::Category, const cases::CategoryStore*> stores[] = {
      {cases::Category::kDriver, &driver_},
      {cases::Category::kSolver, &solver_},
      {cases::Category::kSystem, &system_},
  };
  for (const auto& [category, store] : stores) {
    for (const auto& entry : store->Coordinates()) {
      if (entry.coordinate.Length() == *expected && entry.coordinate.HasPrefix(parent)) {
        children.push_back(Resolve(category, entry));
      }
    }
  }
  return {std::move(children), *expected};
}

void HierarchyResolver::AppendDescendants(const std::string& parent, size_t parent_length, bool recurse,
                                          std::vector<ResolvedCoordinate>& out) const {
  auto [children, child_length] = ChildrenAt(parent, parent_length);
  for (auto& child : children) {
    std::string coordinate = child.coordinate;
    out.push_back(std::move(child));
    if (recurse) {
      AppendDescendants(coordinate, child_length, recurse, out);
    }
  }
}

std::vector<ResolvedCoordinate> HierarchyResolver::Descendants(const std::string& parent, bool recurse) const {
  std::vector<ResolvedCoordinate> out;
  size_t parent_length = parent.empty() ? 0 : IterationCoordinate::Split(parent).size();
  AppendDescendants(parent, parent_length, recurse, out);
  return out;
}

std::vector<CoordinateNode> HierarchyResolver::TreeAt(const std::string& parent, size_t parent_length,
                                                      bool recurse) const {
  auto [children, child_length] = ChildrenAt(parent, parent_length);
  std::vector<CoordinateNode> nodes;
  nodes.reserve(children.size());
  for (auto& child : children) {
    CoordinateNode node;
    node.value = std::move(child);
    if (recurse) {
      node.children = TreeAt(node.value.coordinate, child_length, recurse);
    }
    nodes.push_back(std::move(node));
  }
  return nodes;
}

std::vector<CoordinateNode> HierarchyResolver::Tree(const std::string& parent, bool recurse) const {
  size_t parent_length = parent.empty() ? 0 : IterationCoordinate::Split(parent).size();
  return TreeAt(parent, parent_length, recurse);
}

std::optional<ResolvedCoordinate> HierarchyResolver::Find(const std::string& coordinate) const {
  const std::pair<cases::Category, const cases::CategoryStore*> stores[] = {
      {cases::Category::kDriver, &driver_},
      {cases::Category::kSolver, &solver_},
      {cases::Category::kSystem, &system_},
  };
  for (const auto& [category, store] : stores) {
    auto counter = store->CounterOf(coordinate);
    if (counter) {
      return ResolvedCoordinate{category, coordinate, *counter};
    }
  }
  return std::nullopt;
}

void SortByCounter(std::vector<ResolvedCoordinate>& coordinates) {
  std::stable_sort(coordinates.begin(), coordinates.end(),
                   [](const ResolvedCoordinate& a, const ResolvedCoordinate& b) { return a.counter < b.counter; });
}

}  // namespace casereader::hierarchy
