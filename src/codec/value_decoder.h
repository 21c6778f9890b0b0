/**
 * @file value_decoder.h
 * @brief Format-version dispatch for stored variable values
 *
 * Value columns hold a name->array mapping. The representation depends on the
 * store's format version:
 * - 1-2: structured .npy blob (see npy_format.h)
 * - 3+:  JSON object {name: number | nested list | null}
 *
 * Derivative blobs are .npy in every version.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "codec/nd_array.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace casereader::codec {

/// Oldest format version this reader understands
constexpr int64_t kMinFormatVersion = 1;
/// Newest format version written by the recorder
constexpr int64_t kMaxFormatVersion = 4;
/// First version whose values and metadata are JSON
constexpr int64_t kFirstJsonFormatVersion = 3;
/// First version that records var_settings
constexpr int64_t kFirstVarSettingsFormatVersion = 4;

/**
 * @brief Declared shape of a variable, if the catalog knows it
 */
using ShapeLookup = std::function<std::optional<std::vector<size_t>>(const std::string& name)>;

/**
 * @brief Fail with kUnsupportedFormatVersion unless 1 <= version <= 4
 */
utils::Expected<void, utils::Error> CheckFormatVersion(int64_t format_version);

/**
 * @brief Decode a value column
 *
 * NULL (nullopt), an empty blob and JSON null all mean "not recorded" and
 * yield nullopt. A variable whose JSON value is null is omitted.
 *
 * @param format_version Store format version
 * @param raw Column bytes, nullopt for SQL NULL
 * @param shapes Declared variable shapes used to reshape JSON arrays
 * @param coordinate Reported as error context on failure
 */
utils::Expected<std::optional<NamedArrays>, utils::Error> DecodeValues(int64_t format_version,
                                                                       const std::optional<std::string>& raw,
                                                                       const ShapeLookup& shapes,
                                                                       const std::string& coordinate);

/**
 * @brief Decode a derivative blob (.npy with "of,wrt" field names)
 */
utils::Expected<std::optional<NamedArrays>, utils::Error> DecodeDerivatives(const std::optional<std::string>& raw,
                                                                            const std::string& coordinate);

/**
 * @brief Encode values in the representation used by @p format_version
 */
std::string EncodeValues(int64_t format_version, const NamedArrays& values);

/**
 * @brief Convert a JSON number or nested list to an array
 *
 * The result takes @p declared_shape when its element count matches, is
 * broadcast to it when the input is a single number, and otherwise keeps the
 * nested-list shape.
 *
 * @return kDecodeError for ragged lists or non-numeric elements
 */
utils::Expected<NdArray, utils::Error> JsonToArray(const nlohmann::json& value,
                                                   const std::optional<std::vector<size_t>>& declared_shape);

/**
 * @brief Convert an array to a JSON number (0-d) or nested list
 */
nlohmann::json ArrayToJson(const NdArray& array);

}  // namespace casereader::codec
