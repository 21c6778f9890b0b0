/**
 * @file case.cpp
 * @brief Case value lookups
 */

#include "cases/case.h"

#include <algorithm>

namespace casereader::cases {

namespace {

utils::Unexpected<utils::Error> UnknownVariable(const std::string& message, const std::string& name) {
  return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kUnknownVariable, message, name));
}

}  // namespace

const char* CategoryToString(Category category) {
  switch (category) {
    case Category::kDriver:
      return "driver";
    case Category::kDriverDerivative:
      return "driver_derivative";
    case Category::kSystem:
      return "system";
    case Category::kSolver:
      return "solver";
    case Category::kProblem:
      return "problem";
  }
  return "unknown";
}

// ---------------------------------------------------------------------------
// VariableValues
// ---------------------------------------------------------------------------

VariableValues::VariableValues(codec::NamedArrays values, metadata::IoKind io,
                               std::shared_ptr<const metadata::MetadataCatalog> catalog)
    : values_(std::move(values)), io_(io), catalog_(std::move(catalog)) {}

const codec::NdArray* VariableValues::FindRecorded(const std::string& name) const {
  for (const auto& [recorded, value] : values_) {
    if (recorded == name) {
      return &value;
    }
  }
  return nullptr;
}

utils::Expected<codec::NdArray, utils::Error> VariableValues::Get(const std::string& name) const {
  if (const auto* value = FindRecorded(name)) {
    return *value;
  }
  if (!catalog_) {
    return UnknownVariable("Variable not recorded", name);
  }

  // Promoted name recorded under its absolute name(s)
  const codec::NdArray* match = nullptr;
  size_t matches = 0;
  for (const auto& abs_name : catalog_->AbsoluteNames(name, io_)) {
    if (const auto* value = FindRecorded(abs_name)) {
      match = value;
      ++matches;
    }
  }
  if (matches > 1) {
    return UnknownVariable("Ambiguous promoted name; use an absolute name", name);
  }
  if (match != nullptr) {
    return *match;
  }

  // Absolute name recorded under its promoted name
  auto promoted = catalog_->PromotedName(name, io_);
  if (promoted) {
    if (const auto* value = FindRecorded(*promoted)) {
      return *value;
    }
  }
  return UnknownVariable("Variable not recorded", name);
}

bool VariableValues::Contains(const std::string& name) const {
  return Get(name).has_value();
}

std::vector<std::string> VariableValues::Names() const {
  std::vector<std::string> names;
  names.reserve(values_.size());
  for (const auto& item : values_) {
    names.push_back(item.first);
  }
  return names;
}

std::vector<std::string> VariableValues::AbsoluteNames() const {
  std::vector<std::string> names;
  names.reserve(values_.size());
  for (const auto& item : values_) {
    const std::string& recorded = item.first;
    if (catalog_ && catalog_->FindAbsolute(recorded) == nullptr) {
      auto abs_names = catalog_->AbsoluteNames(recorded, io_);
      if (!abs_names.empty()) {
        names.push_back(abs_names.front());
        continue;
      }
    }
    names.push_back(recorded);
  }
  return names;
}

bool VariableValues::operator==(const VariableValues& other) const {
  return io_ == other.io_ && values_ == other.values_;
}

// ---------------------------------------------------------------------------
// Jacobian
// ---------------------------------------------------------------------------

Jacobian::Jacobian(codec::NamedArrays entries, std::shared_ptr<const metadata::MetadataCatalog> catalog)
    : catalog_(std::move(catalog)) {
  for (auto& [key, value] : entries) {
    entries_.emplace(key, std::move(value));
  }
}

std::vector<std::string> Jacobian::Candidates(const std::string& name) const {
  std::vector<std::string> names{name};
  if (!catalog_) {
    return names;
  }
  auto add = [&names](const std::string& candidate) {
    if (std::find(names.begin(), names.end(), candidate) == names.end()) {
      names.push_back(candidate);
    }
  };
  for (auto io : {metadata::IoKind::kOutput, metadata::IoKind::kInput}) {
    for (const auto& abs_name : catalog_->AbsoluteNames(name, io)) {
      add(abs_name);
    }
    if (auto promoted = catalog_->PromotedName(name, io)) {
      add(*promoted);
    }
  }
  return names;
}

utils::Expected<codec::NdArray, utils::Error> Jacobian::Get(const std::string& of, const std::string& wrt) const {
  for (const auto& of_name : Candidates(of)) {
    for (const auto& wrt_name : Candidates(wrt)) {
      auto iter = entries_.find(of_name + "," + wrt_name);
      if (iter != entries_.end()) {
        return iter->second;
      }
    }
  }
  return UnknownVariable("Derivative not recorded", of + "," + wrt);
}

std::vector<std::string> Jacobian::Keys() const {
  std::vector<std::string> keys;
  keys.reserve(entries_.size());
  for (const auto& entry : entries_) {
    keys.push_back(entry.first);
  }
  return keys;
}

// ---------------------------------------------------------------------------
// Case
// ---------------------------------------------------------------------------

utils::Expected<codec::NdArray, utils::Error> Case::Get(const std::string& name) const {
  if (data_.outputs) {
    auto value = data_.outputs->Get(name);
    if (value || !data_.inputs) {
      return value;
    }
  }
  if (data_.inputs) {
    return data_.inputs->Get(name);
  }
  return UnknownVariable("Variable not recorded", name);
}

std::map<std::string, codec::NdArray> Case::OutputsTagged(const std::vector<std::string>& tags) const {
  std::map<std::string, codec::NdArray> result;
  if (!data_.outputs || !catalog_) {
    return result;
  }
  for (const auto& [recorded, value] : data_.outputs->Items()) {
    const metadata::VariableMeta* meta = catalog_->FindAbsolute(recorded);
    if (meta == nullptr) {
      auto abs_names = catalog_->AbsoluteNames(recorded, metadata::IoKind::kOutput);
      if (!abs_names.empty()) {
        meta = catalog_->FindAbsolute(abs_names.front());
      }
    }
    if (meta == nullptr) {
      continue;
    }
    bool tagged = std::any_of(tags.begin(), tags.end(), [meta](const std::string& tag) { return meta->HasTag(tag); });
    if (!tagged) {
      continue;
    }
    auto promoted = catalog_->PromotedName(meta->name, metadata::IoKind::kOutput);
    result.emplace(promoted.value_or(recorded), value);
  }
  return result;
}

std::map<std::string, codec::NdArray> Case::GetDesignVariables() const {
  return OutputsTagged({"desvar"});
}

std::map<std::string, codec::NdArray> Case::GetObjectives() const {
  return OutputsTagged({"objective"});
}

std::map<std::string, codec::NdArray> Case::GetConstraints() const {
  return OutputsTagged({"constraint"});
}

std::map<std::string, codec::NdArray> Case::GetResponses() const {
  return OutputsTagged({"objective", "constraint"});
}

bool Case::operator==(const Case& other) const {
  const CaseData& a = data_;
  const CaseData& b = other.data_;
  return a.category == b.category && a.source == b.source && a.coordinate == b.coordinate &&
         a.counter == b.counter && a.timestamp == b.timestamp && a.success == b.success && a.message == b.message &&
         a.inputs == b.inputs && a.outputs == b.outputs && a.residuals == b.residuals && a.abs_err == b.abs_err &&
         a.rel_err == b.rel_err && a.jacobian == b.jacobian;
}

}  // namespace casereader::cases
