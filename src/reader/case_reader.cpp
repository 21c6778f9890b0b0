/**
 * @file case_reader.cpp
 * @brief Case store reader implementation
 */

#include "reader/case_reader.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <set>
#include <unordered_map>
#include <utility>

#include "hierarchy/iteration_coordinate.h"
#include "utils/structured_log.h"

namespace casereader::reader {

namespace {

using cases::Category;
using hierarchy::ResolvedCoordinate;

constexpr const char* kDriverSource = "driver";
constexpr const char* kProblemSource = "problem";

utils::Unexpected<utils::Error> SourceNotFound(const std::string& source) {
  return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kSourceNotFound, "Unknown source", source));
}

bool IsCoordinateSource(const std::string& source) {
  return source.find('|') != std::string::npos;
}

std::vector<ResolvedCoordinate> AllOf(const cases::CategoryStore& store) {
  std::vector<ResolvedCoordinate> coordinates;
  coordinates.reserve(store.Size());
  for (const auto& entry : store.Coordinates()) {
    coordinates.push_back(ResolvedCoordinate{store.GetCategory(), entry.coordinate.Raw(), entry.counter});
  }
  return coordinates;
}

/**
 * @brief Coordinate with its iteration indices removed, identifying one system
 */
std::string StrippedKey(const hierarchy::IterationCoordinate& coordinate) {
  std::string key;
  const auto& segments = coordinate.Segments();
  for (size_t i = 0; i < segments.size(); ++i) {
    if (i > 0) {
      key += ':';
    }
    key += segments[i];
  }
  return key;
}

double Norm(const codec::NdArray& array) {
  double sum = 0.0;
  for (double value : array.data) {
    sum += value * value;
  }
  return std::sqrt(sum);
}

std::vector<std::string> SortedNames(const std::optional<cases::VariableValues>& values) {
  if (!values) {
    return {};
  }
  std::set<std::string> names;
  for (const auto& item : values->Items()) {
    names.insert(item.first);
  }
  return {names.begin(), names.end()};
}

double MicrosecondsSince(std::chrono::steady_clock::time_point start) {
  auto elapsed = std::chrono::steady_clock::now() - start;
  return std::chrono::duration<double, std::micro>(elapsed).count();
}

}  // namespace

CaseReader::CaseReader(std::unique_ptr<storage::SqliteConnection> connection,
                       std::shared_ptr<const metadata::MetadataCatalog> catalog, const config::ReaderConfig& config)
    : connection_(std::move(connection)),
      catalog_(std::move(catalog)),
      config_(config),
      driver_(Category::kDriver, *connection_, catalog_),
      driver_derivatives_(Category::kDriverDerivative, *connection_, catalog_),
      system_(Category::kSystem, *connection_, catalog_),
      solver_(Category::kSolver, *connection_, catalog_),
      problem_(Category::kProblem, *connection_, catalog_) {}

utils::Expected<std::unique_ptr<CaseReader>, utils::Error> CaseReader::Open(const std::string& path,
                                                                            const config::ReaderConfig& config) {
  auto connection = storage::SqliteConnection::OpenReadOnly(path);
  if (!connection) {
    utils::LogStorageError("open", path, connection.error().message());
    return utils::MakeUnexpected(connection.error());
  }

  auto catalog = metadata::MetadataCatalog::Build(**connection);
  if (!catalog) {
    utils::LogStorageError("read_metadata", path, catalog.error().message());
    return utils::MakeUnexpected(catalog.error());
  }

  std::unique_ptr<CaseReader> reader(new CaseReader(std::move(*connection), std::move(*catalog), config));
  auto loaded = reader->LoadCoordinates();
  if (!loaded) {
    utils::LogStorageError("read_coordinates", path, loaded.error().message());
    return utils::MakeUnexpected(loaded.error());
  }

  std::string counts = "driver=" + std::to_string(reader->driver_.Size()) +
                       " driver_derivatives=" + std::to_string(reader->driver_derivatives_.Size()) +
                       " system=" + std::to_string(reader->system_.Size()) +
                       " solver=" + std::to_string(reader->solver_.Size()) +
                       " problem=" + std::to_string(reader->problem_.Size());
  utils::LogStoreOpen(path, reader->FormatVersion(), counts);

  if (config.preload) {
    auto preloaded = reader->LoadCases();
    if (!preloaded) {
      return utils::MakeUnexpected(preloaded.error());
    }
  }
  return reader;
}

utils::Expected<void, utils::Error> CaseReader::LoadCoordinates() {
  for (auto* store : {&driver_, &driver_derivatives_, &system_, &solver_, &problem_}) {
    auto loaded = store->LoadCoordinates();
    if (!loaded) {
      return loaded;
    }
  }
  resolver_ = std::make_unique<hierarchy::HierarchyResolver>(driver_, system_, solver_);
  return {};
}

cases::CategoryStore& CaseReader::Store(Category category) {
  return const_cast<cases::CategoryStore&>(static_cast<const CaseReader&>(*this).Store(category));
}

const cases::CategoryStore& CaseReader::Store(Category category) const {
  switch (category) {
    case Category::kDriver:
      return driver_;
    case Category::kDriverDerivative:
      return driver_derivatives_;
    case Category::kSystem:
      return system_;
    case Category::kSolver:
      return solver_;
    case Category::kProblem:
      return problem_;
  }
  return driver_;
}

std::vector<std::string> CaseReader::ListSources() const {
  std::vector<std::string> sources;
  if (driver_.Size() > 0) {
    sources.emplace_back(kDriverSource);
  }
  if (problem_.Size() > 0) {
    sources.emplace_back(kProblemSource);
  }
  std::set<std::string> seen;
  for (const auto* store : {&system_, &solver_}) {
    for (const auto& entry : store->Coordinates()) {
      std::string source = cases::DeriveSource(store->GetCategory(), entry.coordinate);
      if (seen.insert(source).second) {
        sources.push_back(std::move(source));
      }
    }
  }
  return sources;
}

std::vector<ResolvedCoordinate> CaseReader::LocationCoordinates(const std::string& source) const {
  std::vector<ResolvedCoordinate> coordinates;
  for (const auto* store : {&system_, &solver_}) {
    for (const auto& entry : store->Coordinates()) {
      if (cases::DeriveSource(store->GetCategory(), entry.coordinate) == source) {
        coordinates.push_back(ResolvedCoordinate{store->GetCategory(), entry.coordinate.Raw(), entry.counter});
      }
    }
  }
  hierarchy::SortByCounter(coordinates);
  return coordinates;
}

std::vector<ResolvedCoordinate> CaseReader::WithDescendants(std::vector<ResolvedCoordinate> heads) const {
  std::vector<ResolvedCoordinate> expanded;
  std::set<std::string> seen;
  for (auto& head : heads) {
    auto below = resolver_->Descendants(head.coordinate, true);
    if (seen.insert(head.coordinate).second) {
      expanded.push_back(std::move(head));
    }
    for (auto& entry : below) {
      if (seen.insert(entry.coordinate).second) {
        expanded.push_back(std::move(entry));
      }
    }
  }
  hierarchy::SortByCounter(expanded);
  return expanded;
}

utils::Expected<std::vector<ResolvedCoordinate>, utils::Error> CaseReader::Plan(const std::string& source,
                                                                                bool recurse) const {
  if (source == kDriverSource) {
    return recurse ? WithDescendants(AllOf(driver_)) : AllOf(driver_);
  }
  if (source == kProblemSource) {
    return AllOf(problem_);
  }
  if (!IsCoordinateSource(source) && hierarchy::IsHierarchySource(source)) {
    auto coordinates = LocationCoordinates(source);
    if (coordinates.empty()) {
      return SourceNotFound(source);
    }
    return recurse ? WithDescendants(std::move(coordinates)) : coordinates;
  }

  std::vector<ResolvedCoordinate> coordinates = resolver_->Descendants(source, recurse);
  if (!source.empty()) {
    auto self = resolver_->Find(source);
    if (!self && coordinates.empty()) {
      return SourceNotFound(source);
    }
    if (self) {
      coordinates.push_back(std::move(*self));
    }
  }
  hierarchy::SortByCounter(coordinates);
  return coordinates;
}

utils::Expected<std::vector<std::string>, utils::Error> CaseReader::ListCases(const std::string& source,
                                                                              bool recurse) const {
  auto start = std::chrono::steady_clock::now();
  auto plan = Plan(source, recurse);
  if (!plan) {
    return utils::MakeUnexpected(plan.error());
  }
  std::vector<std::string> coordinates;
  coordinates.reserve(plan->size());
  for (auto& entry : *plan) {
    coordinates.push_back(std::move(entry.coordinate));
  }
  utils::LogHierarchyQuery(source, recurse, coordinates.size(), MicrosecondsSince(start));
  return coordinates;
}

utils::Expected<std::vector<hierarchy::CoordinateNode>, utils::Error> CaseReader::ListCasesNested(
    const std::string& source, bool recurse) const {
  if (source.empty()) {
    return resolver_->Tree(source, recurse);
  }

  if (source == kDriverSource || source == kProblemSource || !IsCoordinateSource(source)) {
    auto plan = Plan(source, false);
    if (!plan) {
      return utils::MakeUnexpected(plan.error());
    }
    bool expand = recurse && source != kProblemSource;
    std::vector<hierarchy::CoordinateNode> nodes;
    nodes.reserve(plan->size());
    for (const auto& entry : *plan) {
      if (!expand) {
        nodes.push_back(hierarchy::CoordinateNode{entry, {}});
        continue;
      }
      // Location cases below another case of the same location appear inside its subtree
      hierarchy::IterationCoordinate parsed(entry.coordinate);
      bool nested = std::any_of(plan->begin(), plan->end(), [&parsed, &entry](const ResolvedCoordinate& other) {
        return other.coordinate != entry.coordinate && parsed.HasPrefix(other.coordinate);
      });
      if (!nested) {
        nodes.push_back(hierarchy::CoordinateNode{entry, resolver_->Tree(entry.coordinate, true)});
      }
    }
    return nodes;
  }

  auto children = resolver_->Tree(source, recurse);
  auto self = resolver_->Find(source);
  if (self) {
    std::vector<hierarchy::CoordinateNode> root;
    root.push_back(hierarchy::CoordinateNode{std::move(*self), std::move(children)});
    return root;
  }
  if (children.empty()) {
    return SourceNotFound(source);
  }
  return children;
}

utils::Expected<cases::CasePtr, utils::Error> CaseReader::GetCase(const std::string& id) {
  return GetCase(id, config_.cache_cases);
}

utils::Expected<cases::CasePtr, utils::Error> CaseReader::GetCase(const std::string& id, bool use_cache) {
  for (auto* store : {&driver_, &solver_, &system_, &problem_}) {
    if (store->Contains(id)) {
      return store->Get(id, use_cache);
    }
  }
  return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kCaseNotFound, "Case not found", id));
}

utils::Expected<cases::CasePtr, utils::Error> CaseReader::GetDerivativeCase(const std::string& coordinate) {
  return driver_derivatives_.Get(coordinate, config_.cache_cases);
}

utils::Expected<CaseSequence, utils::Error> CaseReader::GetCases(const std::string& source, bool recurse) {
  auto start = std::chrono::steady_clock::now();
  auto plan = Plan(source, recurse);
  if (!plan) {
    return utils::MakeUnexpected(plan.error());
  }
  std::vector<CaseSequence::Entry> entries;
  entries.reserve(plan->size());
  for (auto& coordinate : *plan) {
    entries.push_back(CaseSequence::Entry{coordinate.category, std::move(coordinate.coordinate)});
  }
  utils::LogHierarchyQuery(source, recurse, entries.size(), MicrosecondsSince(start));

  bool use_cache = config_.cache_cases;
  return CaseSequence(std::move(entries), [this, use_cache](const CaseSequence::Entry& entry) {
    return Store(entry.category).Get(entry.key, use_cache);
  });
}

utils::Expected<std::vector<CaseNode>, utils::Error> CaseReader::FetchTree(
    const std::vector<hierarchy::CoordinateNode>& nodes) {
  std::vector<CaseNode> fetched;
  fetched.reserve(nodes.size());
  for (const auto& node : nodes) {
    auto value = Store(node.value.category).Get(node.value.coordinate, config_.cache_cases);
    if (!value) {
      return utils::MakeUnexpected(value.error());
    }
    auto children = FetchTree(node.children);
    if (!children) {
      return utils::MakeUnexpected(children.error());
    }
    fetched.push_back(CaseNode{std::move(*value), std::move(*children)});
  }
  return fetched;
}

utils::Expected<std::vector<CaseNode>, utils::Error> CaseReader::GetCasesNested(const std::string& source,
                                                                                bool recurse) {
  auto nodes = ListCasesNested(source, recurse);
  if (!nodes) {
    return utils::MakeUnexpected(nodes.error());
  }
  return FetchTree(*nodes);
}

utils::Expected<SourceVars, utils::Error> CaseReader::ListSourceVars(const std::string& source) {
  utils::Expected<cases::CasePtr, utils::Error> first =
      utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kSourceNotFound, "Unknown source", source));

  if (IsCoordinateSource(source) && resolver_->Find(source)) {
    first = GetCase(source);
  } else {
    auto plan = Plan(source, false);
    if (!plan) {
      return utils::MakeUnexpected(plan.error());
    }
    if (plan->empty()) {
      return SourceVars{};
    }
    first = Store(plan->front().category).Get(plan->front().coordinate, config_.cache_cases);
  }
  if (!first) {
    return utils::MakeUnexpected(first.error());
  }

  const cases::Case& recorded = **first;
  return SourceVars{SortedNames(recorded.Inputs()), SortedNames(recorded.Outputs()),
                    SortedNames(recorded.Residuals())};
}

void CaseReader::CaseVariables(const cases::CasePtr& from_case, bool outputs,
                               std::vector<std::pair<std::string, cases::CasePtr>>& out) {
  const auto& values = outputs ? from_case->Outputs() : from_case->Inputs();
  if (!values) {
    return;
  }
  std::set<std::string> seen;
  for (const auto& entry : out) {
    seen.insert(entry.first);
  }
  for (const auto& abs_name : values->AbsoluteNames()) {
    if (seen.insert(abs_name).second) {
      out.emplace_back(abs_name, from_case);
    }
  }
}

utils::Expected<std::vector<std::pair<std::string, cases::CasePtr>>, utils::Error> CaseReader::LatestSystemVariables(
    bool outputs) {
  std::vector<std::pair<std::string, cases::CasePtr>> variables;
  const auto& coordinates = system_.Coordinates();
  if (coordinates.empty()) {
    utils::LogStorageWarning(outputs ? "list_outputs" : "list_inputs", "No system cases recorded");
    return variables;
  }

  std::unordered_map<std::string, bool> visited;
  for (const auto& entry : coordinates) {
    visited.emplace(StrippedKey(entry.coordinate), false);
  }

  size_t remaining = visited.size();
  for (size_t i = coordinates.size(); i-- > 0 && remaining > 0;) {
    const auto& entry = coordinates[i];
    bool& done = visited[StrippedKey(entry.coordinate)];
    if (done) {
      continue;
    }
    done = true;
    --remaining;

    auto system_case = system_.Get(entry.coordinate.Raw(), config_.cache_cases);
    if (!system_case) {
      return utils::MakeUnexpected(system_case.error());
    }
    CaseVariables(*system_case, outputs, variables);
  }
  return variables;
}

utils::Expected<VariableListing, utils::Error> CaseReader::MakeListing(const std::string& abs_name,
                                                                       const cases::Case& from_case,
                                                                       bool outputs) const {
  const auto& values = outputs ? from_case.Outputs() : from_case.Inputs();
  auto value = values->Get(abs_name);
  if (!value) {
    return utils::MakeUnexpected(value.error());
  }

  VariableListing listing;
  listing.name = abs_name;
  listing.value = std::move(*value);
  listing.shape = listing.value.shape;

  metadata::IoKind io = outputs ? metadata::IoKind::kOutput : metadata::IoKind::kInput;
  listing.promoted_name = catalog_->PromotedName(abs_name, io);

  if (outputs && from_case.Residuals()) {
    auto residual = from_case.Residuals()->Get(abs_name);
    if (residual) {
      listing.residuals = std::move(*residual);
    }
  }

  if (const auto* meta = catalog_->FindAbsolute(abs_name)) {
    listing.units = meta->units;
    listing.shape = meta->shape;
    listing.explicit_output = meta->explicit_output;
    listing.lower = meta->lower;
    listing.upper = meta->upper;
    listing.ref = meta->ref;
    listing.ref0 = meta->ref0;
    listing.res_ref = meta->res_ref;
  }
  return listing;
}

utils::Expected<std::vector<VariableListing>, utils::Error> CaseReader::ListInputs(const cases::Case* from_case) {
  std::vector<std::pair<std::string, cases::CasePtr>> variables;
  if (from_case != nullptr) {
    // Non-owning alias: the caller keeps the case alive for this call
    CaseVariables(cases::CasePtr(cases::CasePtr(), from_case), false, variables);
  } else {
    auto latest = LatestSystemVariables(false);
    if (!latest) {
      return utils::MakeUnexpected(latest.error());
    }
    variables = std::move(*latest);
  }

  std::vector<VariableListing> listings;
  listings.reserve(variables.size());
  for (const auto& [abs_name, owner] : variables) {
    auto listing = MakeListing(abs_name, *owner, false);
    if (!listing) {
      return utils::MakeUnexpected(listing.error());
    }
    listings.push_back(std::move(*listing));
  }
  return listings;
}

utils::Expected<std::vector<VariableListing>, utils::Error> CaseReader::ListOutputs(const cases::Case* from_case,
                                                                                   const OutputListOptions& options) {
  if (!options.explicit_outputs && !options.implicit_outputs) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidArgument,
                                                  "Both explicit and implicit outputs are excluded"));
  }

  std::vector<std::pair<std::string, cases::CasePtr>> variables;
  if (from_case != nullptr) {
    CaseVariables(cases::CasePtr(cases::CasePtr(), from_case), true, variables);
  } else {
    auto latest = LatestSystemVariables(true);
    if (!latest) {
      return utils::MakeUnexpected(latest.error());
    }
    variables = std::move(*latest);
  }

  std::vector<VariableListing> explicit_listings;
  std::vector<VariableListing> implicit_listings;
  for (const auto& [abs_name, owner] : variables) {
    auto listing = MakeListing(abs_name, *owner, true);
    if (!listing) {
      return utils::MakeUnexpected(listing.error());
    }
    if (options.residuals_tol && listing->residuals && Norm(*listing->residuals) < *options.residuals_tol) {
      continue;
    }
    if (listing->explicit_output) {
      if (options.explicit_outputs) {
        explicit_listings.push_back(std::move(*listing));
      }
    } else if (options.implicit_outputs) {
      implicit_listings.push_back(std::move(*listing));
    }
  }

  for (auto& listing : implicit_listings) {
    explicit_listings.push_back(std::move(listing));
  }
  return explicit_listings;
}

utils::Expected<void, utils::Error> CaseReader::LoadCases() {
  auto start = std::chrono::steady_clock::now();
  for (auto* store : {&driver_, &driver_derivatives_, &solver_, &system_, &problem_}) {
    auto loaded = store->LoadAll();
    if (!loaded) {
      return loaded;
    }
  }
  spdlog::info("Loaded all cases from {} in {:.1f} us", Path(), MicrosecondsSince(start));
  return {};
}

}  // namespace casereader::reader
