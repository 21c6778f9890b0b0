/**
 * @file metadata_catalog.cpp
 * @brief Metadata catalog construction and lookups
 */

#include "metadata/metadata_catalog.h"

#include <algorithm>

#include "codec/pickle_reader.h"
#include "utils/structured_log.h"

namespace casereader::metadata {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

constexpr const char* kIoKeys[2] = {"input", "output"};

/**
 * @brief Decode a metadata blob as JSON (format >= 3 text columns) or pickle
 */
Expected<nlohmann::json, Error> DecodeBlob(const std::optional<std::string>& raw, bool as_json,
                                           const std::string& what) {
  if (!raw || raw->empty()) {
    return nlohmann::json(nullptr);
  }
  if (as_json) {
    try {
      return nlohmann::json::parse(*raw);
    } catch (const nlohmann::json::parse_error& e) {
      return MakeUnexpected(MakeError(ErrorCode::kDecodeError, std::string("JSON parse error: ") + e.what(), what));
    }
  }
  auto decoded = codec::DecodePickle(*raw);
  if (!decoded) {
    return MakeUnexpected(MakeError(ErrorCode::kDecodeError, decoded.error().message(), what));
  }
  return decoded;
}

std::optional<std::string> OptionalBytes(const storage::Statement& stmt, int column) {
  if (stmt.IsNull(column)) {
    return std::nullopt;
  }
  return stmt.ColumnBytes(column);
}

std::vector<std::string> StringList(const nlohmann::json& value) {
  std::vector<std::string> result;
  if (value.is_string()) {
    result.push_back(value.get<std::string>());
  } else if (value.is_array()) {
    for (const auto& item : value) {
      if (item.is_string()) {
        result.push_back(item.get<std::string>());
      }
    }
  }
  return result;
}

Expected<std::optional<codec::NdArray>, Error> OptionalArray(const nlohmann::json& meta, const char* key,
                                                             const std::vector<size_t>& shape,
                                                             const std::string& abs_name) {
  if (!meta.contains(key) || meta[key].is_null()) {
    return std::optional<codec::NdArray>();
  }
  auto array = codec::JsonToArray(meta[key], shape);
  if (!array) {
    return MakeUnexpected(
        MakeError(ErrorCode::kDecodeError, std::string("Malformed '") + key + "' in abs2meta", abs_name));
  }
  return std::optional<codec::NdArray>(std::move(*array));
}

}  // namespace

const char* IoKindToString(IoKind io) {
  return io == IoKind::kInput ? "input" : "output";
}

bool VariableMeta::HasTag(const std::string& tag) const {
  return std::find(type_tags.begin(), type_tags.end(), tag) != type_tags.end();
}

Expected<std::shared_ptr<const MetadataCatalog>, Error> MetadataCatalog::Build(
    const storage::SqliteConnection& connection) {
  auto has_table = connection.TableExists("metadata");
  if (!has_table) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidStore, has_table.error().message(), connection.Path()));
  }
  if (!*has_table) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidStore, "Missing 'metadata' table", connection.Path()));
  }

  auto stmt = connection.Prepare("SELECT * FROM metadata");
  if (!stmt) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidStore, stmt.error().message(), connection.Path()));
  }
  auto row = stmt->Step();
  if (!row) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidStore, row.error().message(), connection.Path()));
  }
  if (!*row) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidStore, "Empty 'metadata' table", connection.Path()));
  }
  if (stmt->ColumnCount() < 4) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidStore, "Malformed 'metadata' table", connection.Path()));
  }

  int64_t format_version = stmt->ColumnInt64(0);
  auto version_ok = codec::CheckFormatVersion(format_version);
  if (!version_ok) {
    utils::LogStorageError("open", connection.Path(), version_ok.error().message());
    return MakeUnexpected(version_ok.error());
  }

  bool as_json = format_version >= codec::kFirstJsonFormatVersion;
  auto abs2prom = DecodeBlob(OptionalBytes(*stmt, 1), as_json, "metadata.abs2prom");
  if (!abs2prom) {
    return MakeUnexpected(abs2prom.error());
  }
  auto prom2abs = DecodeBlob(OptionalBytes(*stmt, 2), as_json, "metadata.prom2abs");
  if (!prom2abs) {
    return MakeUnexpected(prom2abs.error());
  }
  auto abs2meta = DecodeBlob(OptionalBytes(*stmt, 3), as_json, "metadata.abs2meta");
  if (!abs2meta) {
    return MakeUnexpected(abs2meta.error());
  }

  nlohmann::json var_settings;
  if (format_version >= codec::kFirstVarSettingsFormatVersion && stmt->ColumnCount() > 4) {
    auto decoded = DecodeBlob(OptionalBytes(*stmt, 4), true, "metadata.var_settings");
    if (!decoded) {
      return MakeUnexpected(decoded.error());
    }
    var_settings = std::move(*decoded);
  }

  std::shared_ptr<MetadataCatalog> catalog(new MetadataCatalog());
  catalog->format_version_ = format_version;
  catalog->var_settings_ = std::move(var_settings);

  auto maps = catalog->LoadNameMaps(*abs2prom, *prom2abs);
  if (!maps) {
    return MakeUnexpected(maps.error());
  }
  auto variables = catalog->LoadVariables(*abs2meta);
  if (!variables) {
    return MakeUnexpected(variables.error());
  }
  auto auxiliary = catalog->LoadAuxiliary(connection);
  if (!auxiliary) {
    return MakeUnexpected(auxiliary.error());
  }

  return std::shared_ptr<const MetadataCatalog>(std::move(catalog));
}

Expected<std::shared_ptr<const MetadataCatalog>, Error> MetadataCatalog::FromJson(int64_t format_version,
                                                                                const nlohmann::json& abs2prom,
                                                                                const nlohmann::json& prom2abs,
                                                                                const nlohmann::json& abs2meta,
                                                                                const nlohmann::json& var_settings) {
  auto version_ok = codec::CheckFormatVersion(format_version);
  if (!version_ok) {
    return MakeUnexpected(version_ok.error());
  }
  std::shared_ptr<MetadataCatalog> catalog(new MetadataCatalog());
  catalog->format_version_ = format_version;
  catalog->var_settings_ = var_settings;
  auto maps = catalog->LoadNameMaps(abs2prom, prom2abs);
  if (!maps) {
    return MakeUnexpected(maps.error());
  }
  auto variables = catalog->LoadVariables(abs2meta);
  if (!variables) {
    return MakeUnexpected(variables.error());
  }
  return std::shared_ptr<const MetadataCatalog>(std::move(catalog));
}

Expected<void, Error> MetadataCatalog::LoadNameMaps(const nlohmann::json& abs2prom, const nlohmann::json& prom2abs) {
  if (!abs2prom.is_null() && !abs2prom.is_object()) {
    return MakeUnexpected(MakeError(ErrorCode::kDecodeError, "abs2prom is not a mapping", "metadata.abs2prom"));
  }
  if (!prom2abs.is_null() && !prom2abs.is_object()) {
    return MakeUnexpected(MakeError(ErrorCode::kDecodeError, "prom2abs is not a mapping", "metadata.prom2abs"));
  }

  for (size_t io = 0; io < 2; ++io) {
    const char* key = kIoKeys[io];
    if (abs2prom.is_object() && abs2prom.contains(key) && abs2prom[key].is_object()) {
      for (const auto& [abs_name, prom_name] : abs2prom[key].items()) {
        if (prom_name.is_string()) {
          abs2prom_[io][abs_name] = prom_name.get<std::string>();
        }
      }
    }
    if (prom2abs.is_object() && prom2abs.contains(key) && prom2abs[key].is_object()) {
      for (const auto& [prom_name, abs_names] : prom2abs[key].items()) {
        prom2abs_[io][prom_name] = StringList(abs_names);
      }
    }
  }
  return {};
}

Expected<void, Error> MetadataCatalog::LoadVariables(const nlohmann::json& abs2meta) {
  if (abs2meta.is_null()) {
    return {};
  }
  if (!abs2meta.is_object()) {
    return MakeUnexpected(MakeError(ErrorCode::kDecodeError, "abs2meta is not a mapping", "metadata.abs2meta"));
  }

  for (const auto& [abs_name, meta] : abs2meta.items()) {
    if (!meta.is_object()) {
      return MakeUnexpected(MakeError(ErrorCode::kDecodeError, "abs2meta entry is not a mapping", abs_name));
    }
    VariableMeta entry;
    entry.name = abs_name;

    if (meta.contains("shape") && !meta["shape"].is_null()) {
      const auto& shape = meta["shape"];
      if (shape.is_number_integer()) {
        if (shape.get<int64_t>() < 0) {
          return MakeUnexpected(MakeError(ErrorCode::kDecodeError, "Negative 'shape' in abs2meta", abs_name));
        }
        entry.shape.push_back(shape.get<size_t>());
      } else if (shape.is_array()) {
        for (const auto& dim : shape) {
          if (!dim.is_number_integer() || dim.get<int64_t>() < 0) {
            return MakeUnexpected(MakeError(ErrorCode::kDecodeError, "Malformed 'shape' in abs2meta", abs_name));
          }
          entry.shape.push_back(dim.get<size_t>());
        }
      }
    }
    if (meta.contains("size") && meta["size"].is_number_integer()) {
      if (meta["size"].get<int64_t>() < 0) {
        return MakeUnexpected(MakeError(ErrorCode::kDecodeError, "Negative 'size' in abs2meta", abs_name));
      }
      entry.size = meta["size"].get<size_t>();
      if (entry.shape.empty() && !meta.contains("shape")) {
        entry.shape.push_back(entry.size);
      }
    } else {
      auto size = codec::CheckedShapeSize(entry.shape);
      if (!size) {
        return MakeUnexpected(MakeError(ErrorCode::kDecodeError, "'shape' in abs2meta is too large", abs_name));
      }
      entry.size = *size;
    }
    if (meta.contains("units") && meta["units"].is_string()) {
      entry.units = meta["units"].get<std::string>();
    }
    if (meta.contains("explicit") && meta["explicit"].is_boolean()) {
      entry.explicit_output = meta["explicit"].get<bool>();
    }
    if (meta.contains("type")) {
      entry.type_tags = StringList(meta["type"]);
    }

    struct {
      const char* key;
      std::optional<codec::NdArray>* target;
    } arrays[] = {{"lower", &entry.lower},
                  {"upper", &entry.upper},
                  {"ref", &entry.ref},
                  {"ref0", &entry.ref0},
                  {"res_ref", &entry.res_ref}};
    for (const auto& field : arrays) {
      auto value = OptionalArray(meta, field.key, entry.shape, abs_name);
      if (!value) {
        return MakeUnexpected(value.error());
      }
      *field.target = std::move(*value);
    }

    if (var_settings_.is_object() && var_settings_.contains(abs_name)) {
      entry.var_settings = var_settings_[abs_name];
    }

    variables_.emplace(abs_name, std::move(entry));
  }
  return {};
}

Expected<void, Error> MetadataCatalog::LoadAuxiliary(const storage::SqliteConnection& connection) {
  auto has_driver = connection.TableExists("driver_metadata");
  if (!has_driver) {
    return MakeUnexpected(has_driver.error());
  }
  if (*has_driver) {
    auto stmt = connection.Prepare("SELECT model_viewer_data FROM driver_metadata");
    if (!stmt) {
      return MakeUnexpected(stmt.error());
    }
    auto row = stmt->Step();
    if (!row) {
      return MakeUnexpected(row.error());
    }
    if (*row) {
      driver_metadata_ = OptionalBytes(*stmt, 0);
    }
  }

  auto has_system = connection.TableExists("system_metadata");
  if (!has_system) {
    return MakeUnexpected(has_system.error());
  }
  if (*has_system) {
    auto stmt = connection.Prepare("SELECT id, scaling_factors, component_metadata FROM system_metadata");
    if (!stmt) {
      return MakeUnexpected(stmt.error());
    }
    while (true) {
      auto row = stmt->Step();
      if (!row) {
        return MakeUnexpected(row.error());
      }
      if (!*row) {
        break;
      }
      SystemMetadataBlobs blobs;
      blobs.scaling_factors = OptionalBytes(*stmt, 1);
      blobs.component_metadata = OptionalBytes(*stmt, 2);
      system_metadata_[stmt->ColumnText(0)] = std::move(blobs);
    }
  }

  auto has_solver = connection.TableExists("solver_metadata");
  if (!has_solver) {
    return MakeUnexpected(has_solver.error());
  }
  if (*has_solver) {
    auto stmt = connection.Prepare("SELECT id, solver_options, solver_class FROM solver_metadata");
    if (!stmt) {
      return MakeUnexpected(stmt.error());
    }
    while (true) {
      auto row = stmt->Step();
      if (!row) {
        return MakeUnexpected(row.error());
      }
      if (!*row) {
        break;
      }
      SolverMetadataBlobs blobs;
      blobs.solver_options = OptionalBytes(*stmt, 1);
      blobs.solver_class = stmt->ColumnText(2);
      solver_metadata_[stmt->ColumnText(0)] = std::move(blobs);
    }
  }
  return {};
}

Expected<const VariableMeta*, Error> MetadataCatalog::Meta(const std::string& name, IoKind io) const {
  const auto& abs2prom = abs2prom_[Index(io)];
  if (abs2prom.count(name) > 0) {
    if (const VariableMeta* meta = FindAbsolute(name)) {
      return meta;
    }
    return MakeUnexpected(MakeError(ErrorCode::kUnknownVariable, "No metadata recorded for variable", name));
  }

  const auto& prom2abs = prom2abs_[Index(io)];
  auto iter = prom2abs.find(name);
  if (iter != prom2abs.end()) {
    if (iter->second.size() > 1) {
      return MakeUnexpected(MakeError(ErrorCode::kUnknownVariable,
                                      std::string("Ambiguous promoted ") + IoKindToString(io) + " name", name));
    }
    if (iter->second.size() == 1) {
      if (const VariableMeta* meta = FindAbsolute(iter->second.front())) {
        return meta;
      }
    }
  }

  if (const VariableMeta* meta = FindAbsolute(name)) {
    return meta;
  }
  return MakeUnexpected(
      MakeError(ErrorCode::kUnknownVariable, std::string("Unknown ") + IoKindToString(io) + " variable", name));
}

const VariableMeta* MetadataCatalog::FindAbsolute(const std::string& abs_name) const {
  auto iter = variables_.find(abs_name);
  return iter == variables_.end() ? nullptr : &iter->second;
}

std::vector<std::string> MetadataCatalog::AbsoluteNames(const std::string& prom_name, IoKind io) const {
  const auto& prom2abs = prom2abs_[Index(io)];
  auto iter = prom2abs.find(prom_name);
  if (iter == prom2abs.end()) {
    return {};
  }
  return iter->second;
}

std::optional<std::string> MetadataCatalog::PromotedName(const std::string& abs_name, IoKind io) const {
  const auto& abs2prom = abs2prom_[Index(io)];
  auto iter = abs2prom.find(abs_name);
  if (iter == abs2prom.end()) {
    return std::nullopt;
  }
  return iter->second;
}

std::optional<std::vector<size_t>> MetadataCatalog::Shape(const std::string& abs_name) const {
  const VariableMeta* meta = FindAbsolute(abs_name);
  if (meta == nullptr) {
    return std::nullopt;
  }
  return meta->shape;
}

codec::ShapeLookup MetadataCatalog::ShapeLookup() const {
  return [this](const std::string& name) { return Shape(name); };
}

std::vector<std::string> MetadataCatalog::VariableNames() const {
  std::vector<std::string> names;
  names.reserve(variables_.size());
  for (const auto& [name, meta] : variables_) {
    names.push_back(name);
  }
  return names;
}

Expected<nlohmann::json, Error> MetadataCatalog::DriverMetadata() const {
  if (!driver_metadata_) {
    return MakeUnexpected(MakeError(ErrorCode::kNotFound, "No driver metadata recorded"));
  }
  return DecodeBlob(driver_metadata_, format_version_ >= codec::kFirstJsonFormatVersion,
                    "driver_metadata.model_viewer_data");
}

Expected<nlohmann::json, Error> MetadataCatalog::SystemMetadata(const std::string& id) const {
  auto iter = system_metadata_.find(id);
  if (iter == system_metadata_.end()) {
    return MakeUnexpected(MakeError(ErrorCode::kNotFound, "No system metadata recorded", id));
  }
  auto scaling = DecodeBlob(iter->second.scaling_factors, false, "system_metadata.scaling_factors");
  if (!scaling) {
    return MakeUnexpected(scaling.error());
  }
  auto options = DecodeBlob(iter->second.component_metadata, false, "system_metadata.component_metadata");
  if (!options) {
    return MakeUnexpected(options.error());
  }
  nlohmann::json result;
  result["scaling_factors"] = std::move(*scaling);
  result["component_options"] = std::move(*options);
  return result;
}

Expected<nlohmann::json, Error> MetadataCatalog::SolverMetadata(const std::string& id) const {
  auto iter = solver_metadata_.find(id);
  if (iter == solver_metadata_.end()) {
    return MakeUnexpected(MakeError(ErrorCode::kNotFound, "No solver metadata recorded", id));
  }
  auto options = DecodeBlob(iter->second.solver_options, false, "solver_metadata.solver_options");
  if (!options) {
    return MakeUnexpected(options.error());
  }
  nlohmann::json result;
  result["solver_options"] = std::move(*options);
  result["solver_class"] = iter->second.solver_class;
  return result;
}

std::vector<std::string> MetadataCatalog::SystemMetadataIds() const {
  std::vector<std::string> ids;
  for (const auto& [id, blobs] : system_metadata_) {
    ids.push_back(id);
  }
  return ids;
}

std::vector<std::string> MetadataCatalog::SolverMetadataIds() const {
  std::vector<std::string> ids;
  for (const auto& [id, blobs] : solver_metadata_) {
    ids.push_back(id);
  }
  return ids;
}

}  // namespace casereader::metadata
