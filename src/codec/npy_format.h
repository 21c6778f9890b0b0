/**
 * @file npy_format.h
 * @brief NumPy .npy container for one-record structured arrays
 *
 * Legacy stores (format versions 1-2) keep every value column as the bytes of
 * an .npy file whose dtype is a structured record with one field per
 * variable. Derivative blobs use the same container in every version.
 *
 * File layout:
 * - magic "\x93NUMPY" (6 bytes)
 * - major, minor version (1 byte each)
 * - header length (uint16 LE for 1.x, uint32 LE for 2.x/3.x)
 * - header: Python dict literal with 'descr', 'fortran_order', 'shape'
 * - raw record bytes
 */

#pragma once

#include <string>

#include "codec/nd_array.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace casereader::codec {

/**
 * @brief Decode a structured .npy blob into its fields
 *
 * For an array of shape (N,) with a field of sub-shape S, the returned array
 * has shape S when N == 1 and (N, S...) otherwise.
 *
 * @param bytes Complete .npy file contents
 * @return Fields in descr order, or kDecodeError
 */
utils::Expected<NamedArrays, utils::Error> ReadStructuredNpy(const std::string& bytes);

/**
 * @brief Encode fields as a one-record structured .npy (version 1.0, '<f8')
 */
std::string WriteStructuredNpy(const NamedArrays& fields);

}  // namespace casereader::codec
