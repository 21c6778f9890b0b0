/**
 * @file dtype.h
 * @brief NumPy dtype strings ("<f8", "|b1", ">i4", ...) and element reads
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "utils/error.h"
#include "utils/expected.h"

namespace casereader::codec {

/**
 * @brief Parsed scalar dtype
 */
struct Dtype {
  enum class Kind : std::uint8_t {
    kFloat,     ///< 'f'
    kInt,       ///< 'i'
    kUnsigned,  ///< 'u'
    kBool,      ///< 'b'
    kVoid,      ///< 'V' (padding)
  };

  Kind kind = Kind::kFloat;
  size_t itemsize = 8;
  bool little_endian = true;
};

/**
 * @brief Parse a dtype string
 *
 * Accepts an optional byte-order prefix ('<', '>', '|', '=') followed by a
 * kind character and an item size. Supported: f4, f8, i1-i8, u1-u8, b1, Vn.
 *
 * @return kDecodeError for anything else (object, complex, strings, ...)
 */
utils::Expected<Dtype, utils::Error> ParseDtype(const std::string& descr);

/**
 * @brief Read one element at @p data as double
 *
 * @p data must point to at least dtype.itemsize bytes. Must not be called for
 * kVoid.
 */
double ReadElement(const char* data, const Dtype& dtype);

/**
 * @brief True when the host is little-endian
 */
bool HostIsLittleEndian();

}  // namespace casereader::codec
