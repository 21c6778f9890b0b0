/**
 * @file nd_array.h
 * @brief Shaped numeric array and ordered name->array mapping
 */

#pragma once

#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace casereader::codec {

/**
 * @brief Dense row-major array of doubles
 *
 * An empty shape denotes a 0-d value holding exactly one element.
 */
struct NdArray {
  std::vector<size_t> shape;
  std::vector<double> data;

  NdArray() = default;
  NdArray(std::vector<size_t> array_shape, std::vector<double> values)
      : shape(std::move(array_shape)), data(std::move(values)) {}

  /**
   * @brief Single value with shape (1,)
   */
  static NdArray Scalar(double value) { return NdArray({1}, {value}); }

  [[nodiscard]] size_t Size() const { return data.size(); }

  bool operator==(const NdArray& other) const { return shape == other.shape && data == other.data; }
  bool operator!=(const NdArray& other) const { return !(*this == other); }
};

/**
 * @brief Number of elements implied by a shape (1 for the empty shape)
 */
inline size_t ShapeSize(const std::vector<size_t>& shape) {
  size_t size = 1;
  for (size_t dim : shape) {
    size *= dim;
  }
  return size;
}

/**
 * @brief ShapeSize that reports overflow of size_t as std::nullopt
 */
inline std::optional<size_t> CheckedShapeSize(const std::vector<size_t>& shape) {
  size_t size = 1;
  for (size_t dim : shape) {
    if (dim != 0 && size > std::numeric_limits<size_t>::max() / dim) {
      return std::nullopt;
    }
    size *= dim;
  }
  return size;
}

/**
 * @brief Ordered name->array mapping (recorded order is preserved)
 */
using NamedArrays = std::vector<std::pair<std::string, NdArray>>;

}  // namespace casereader::codec
