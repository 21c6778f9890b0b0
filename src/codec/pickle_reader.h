/**
 * @file pickle_reader.h
 * @brief Restricted pickle decoder for legacy metadata blobs
 *
 * Stores written with format versions 1-2 pickle their metadata maps. This
 * decoder runs the subset of the pickle virtual machine needed for plain
 * containers and a handful of known globals, and converts the result to JSON.
 * It never executes arbitrary callables: any global outside the allow-list is
 * rejected with kDecodeError.
 *
 * Supported:
 * - protocols 0-4 binary opcodes (plus INT/LONG/FLOAT/PUT/GET text forms)
 * - dict, list, tuple, set, frozenset, str, bytes, int, float, bool, None
 * - collections.OrderedDict
 * - numpy.dtype, numpy scalars and numpy.ndarray (via _reconstruct)
 * - _codecs.encode (bytes written by Python 3 at protocol 2)
 *
 * JSON mapping: tuples and sets become arrays, numpy arrays become nested
 * lists following their shape (0-d arrays and scalars become numbers), dict
 * keys that are not strings are rendered as text (tuple keys are joined with
 * ',').
 */

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "utils/error.h"
#include "utils/expected.h"

namespace casereader::codec {

/**
 * @brief Decode a pickle byte string into JSON
 *
 * @param bytes Pickled data
 * @return Decoded value, or kDecodeError
 */
utils::Expected<nlohmann::json, utils::Error> DecodePickle(const std::string& bytes);

}  // namespace casereader::codec
