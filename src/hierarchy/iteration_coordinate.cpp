/**
 * @file iteration_coordinate.cpp
 * @brief Iteration coordinate parsing
 */

#include "hierarchy/iteration_coordinate.h"

#include <regex>
#include <utility>

namespace casereader::hierarchy {

namespace {

constexpr const char* kSolveSuffix = "._solve_nonlinear";
constexpr const char* kRootName = "root";

const std::regex& SplitPattern() {
  static const std::regex kPattern(R"(\|\d+\|*)");
  return kPattern;
}

bool EndsWith(const std::string& text, const std::string& suffix) {
  return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/**
 * @brief System path of a "[rankN:]<path>._solve_nonlinear" segment
 */
std::optional<std::string> SystemPath(const std::string& segment) {
  const std::string suffix(kSolveSuffix);
  if (!EndsWith(segment, suffix)) {
    return std::nullopt;
  }
  std::string path = segment.substr(0, segment.size() - suffix.size());
  size_t colon = path.rfind(':');
  if (colon != std::string::npos) {
    path = path.substr(colon + 1);
  }
  if (path.empty()) {
    return std::nullopt;
  }
  return path;
}

std::string SourceFromPath(const std::string& path) {
  if (path == kRootName) {
    return kRootName;
  }
  return std::string(kRootName) + "." + path;
}

/**
 * @brief Identifier segments (trailing empty piece dropped)
 */
std::vector<std::string> Identifiers(const IterationCoordinate& coordinate) {
  std::vector<std::string> ids = coordinate.Segments();
  while (!ids.empty() && ids.back().empty()) {
    ids.pop_back();
  }
  return ids;
}

}  // namespace

IterationCoordinate::IterationCoordinate(std::string raw) : raw_(std::move(raw)), segments_(Split(raw_)) {}

std::vector<std::string> IterationCoordinate::Split(const std::string& raw) {
  std::vector<std::string> pieces;
  if (raw.empty()) {
    return pieces;
  }
  auto begin = std::sregex_iterator(raw.begin(), raw.end(), SplitPattern());
  auto end = std::sregex_iterator();
  size_t last = 0;
  for (auto iter = begin; iter != end; ++iter) {
    auto position = static_cast<size_t>(iter->position(0));
    pieces.push_back(raw.substr(last, position - last));
    last = position + static_cast<size_t>(iter->length(0));
  }
  pieces.push_back(raw.substr(last));
  return pieces;
}

bool IterationCoordinate::HasPrefix(const std::string& parent) const {
  if (parent.empty()) {
    return true;
  }
  return raw_.size() > parent.size() && raw_.compare(0, parent.size(), parent) == 0 && raw_[parent.size()] == '|';
}

std::optional<std::string> SystemSourceOf(const IterationCoordinate& coordinate) {
  auto ids = Identifiers(coordinate);
  if (ids.empty()) {
    return std::nullopt;
  }
  auto path = SystemPath(ids.back());
  if (!path) {
    return std::nullopt;
  }
  return SourceFromPath(*path);
}

std::optional<std::string> SolverSourceOf(const IterationCoordinate& coordinate) {
  auto ids = Identifiers(coordinate);
  for (size_t i = ids.size(); i-- > 0;) {
    auto path = SystemPath(ids[i]);
    if (!path) {
      continue;
    }
    size_t trailing = ids.size() - 1 - i;
    std::string source = SourceFromPath(*path) + ".nonlinear_solver";
    if (trailing == 1) {
      return source;
    }
    if (trailing == 2) {
      return source + ".linesearch";
    }
    return std::nullopt;
  }
  return std::nullopt;
}

bool IsHierarchySource(const std::string& source) {
  return source == kRootName || source.rfind(std::string(kRootName) + ".", 0) == 0;
}

}  // namespace casereader::hierarchy
