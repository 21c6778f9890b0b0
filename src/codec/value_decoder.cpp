/**
 * @file value_decoder.cpp
 * @brief Value column decoding
 */

#include "codec/value_decoder.h"

#include <limits>

#include "codec/npy_format.h"

namespace casereader::codec {

namespace {

utils::Unexpected<utils::Error> DecodeFailure(const std::string& message, const std::string& coordinate) {
  return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kDecodeError, message, coordinate));
}

/**
 * @brief Depth-first flatten of a nested list, recording the shape
 *
 * @return false when the list is ragged or holds a non-numeric element
 */
bool Flatten(const nlohmann::json& value, size_t depth, std::vector<size_t>& shape, std::vector<double>& out) {
  if (value.is_array()) {
    if (depth == shape.size()) {
      shape.push_back(value.size());
    } else if (shape[depth] != value.size()) {
      return false;
    }
    for (const auto& item : value) {
      if (!Flatten(item, depth + 1, shape, out)) {
        return false;
      }
    }
    return true;
  }
  if (depth != shape.size()) {
    return false;
  }
  if (value.is_number()) {
    out.push_back(value.get<double>());
    return true;
  }
  if (value.is_boolean()) {
    out.push_back(value.get<bool>() ? 1.0 : 0.0);
    return true;
  }
  if (value.is_null()) {
    out.push_back(std::numeric_limits<double>::quiet_NaN());
    return true;
  }
  return false;
}

nlohmann::json NestedJson(const NdArray& array, size_t depth, size_t& cursor) {
  if (depth == array.shape.size()) {
    return array.data[cursor++];
  }
  nlohmann::json list = nlohmann::json::array();
  for (size_t i = 0; i < array.shape[depth]; ++i) {
    list.push_back(NestedJson(array, depth + 1, cursor));
  }
  return list;
}

}  // namespace

utils::Expected<void, utils::Error> CheckFormatVersion(int64_t format_version) {
  if (format_version < kMinFormatVersion || format_version > kMaxFormatVersion) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kUnsupportedFormatVersion,
                                                  "Unhandled format version: " + std::to_string(format_version)));
  }
  return {};
}

utils::Expected<NdArray, utils::Error> JsonToArray(const nlohmann::json& value,
                                                   const std::optional<std::vector<size_t>>& declared_shape) {
  NdArray array;
  if (!Flatten(value, 0, array.shape, array.data) || ShapeSize(array.shape) != array.data.size()) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kDecodeError, "Malformed array value"));
  }

  if (declared_shape) {
    auto checked_size = CheckedShapeSize(*declared_shape);
    if (!checked_size || *checked_size > array.data.max_size()) {
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kDecodeError, "Declared shape is too large"));
    }
    size_t declared_size = *checked_size;
    if (array.data.size() == declared_size) {
      array.shape = *declared_shape;
    } else if (array.data.size() == 1) {
      double fill = array.data.front();
      array.shape = *declared_shape;
      array.data.assign(declared_size, fill);
    }
  } else if (array.shape.empty()) {
    array.shape = {1};
  }
  return array;
}

nlohmann::json ArrayToJson(const NdArray& array) {
  if (array.shape.empty()) {
    return array.data.empty() ? nlohmann::json(nullptr) : nlohmann::json(array.data.front());
  }
  if (ShapeSize(array.shape) != array.data.size()) {
    nlohmann::json flat = nlohmann::json::array();
    for (double value : array.data) {
      flat.push_back(value);
    }
    return flat;
  }
  size_t cursor = 0;
  return NestedJson(array, 0, cursor);
}

utils::Expected<std::optional<NamedArrays>, utils::Error> DecodeValues(int64_t format_version,
                                                                       const std::optional<std::string>& raw,
                                                                       const ShapeLookup& shapes,
                                                                       const std::string& coordinate) {
  auto version_ok = CheckFormatVersion(format_version);
  if (!version_ok) {
    return utils::MakeUnexpected(version_ok.error());
  }
  if (!raw || raw->empty()) {
    return std::optional<NamedArrays>();
  }

  if (format_version < kFirstJsonFormatVersion) {
    auto fields = ReadStructuredNpy(*raw);
    if (!fields) {
      return DecodeFailure(fields.error().message(), coordinate);
    }
    return std::optional<NamedArrays>(std::move(*fields));
  }

  nlohmann::json parsed;
  try {
    parsed = nlohmann::json::parse(*raw);
  } catch (const nlohmann::json::parse_error& e) {
    return DecodeFailure(std::string("JSON parse error: ") + e.what(), coordinate);
  }
  if (parsed.is_null()) {
    return std::optional<NamedArrays>();
  }
  if (!parsed.is_object()) {
    return DecodeFailure("Value column is not a JSON object", coordinate);
  }

  NamedArrays values;
  values.reserve(parsed.size());
  for (const auto& [name, value] : parsed.items()) {
    if (value.is_null()) {
      continue;
    }
    std::optional<std::vector<size_t>> declared;
    if (shapes) {
      declared = shapes(name);
    }
    auto array = JsonToArray(value, declared);
    if (!array) {
      return DecodeFailure(array.error().message() + " for variable '" + name + "'", coordinate);
    }
    values.emplace_back(name, std::move(*array));
  }
  return std::optional<NamedArrays>(std::move(values));
}

utils::Expected<std::optional<NamedArrays>, utils::Error> DecodeDerivatives(const std::optional<std::string>& raw,
                                                                            const std::string& coordinate) {
  if (!raw || raw->empty()) {
    return std::optional<NamedArrays>();
  }
  auto fields = ReadStructuredNpy(*raw);
  if (!fields) {
    return DecodeFailure(fields.error().message(), coordinate);
  }
  return std::optional<NamedArrays>(std::move(*fields));
}

std::string EncodeValues(int64_t format_version, const NamedArrays& values) {
  if (format_version < kFirstJsonFormatVersion) {
    return WriteStructuredNpy(values);
  }
  nlohmann::json object = nlohmann::json::object();
  for (const auto& [name, array] : values) {
    object[name] = ArrayToJson(array);
  }
  return object.dump();
}

}  // namespace casereader::codec
