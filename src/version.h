/**
 * @file version.h
 * @brief casereader version information
 */

#pragma once

#include <cstdint>
#include <string>

#include "codec/value_decoder.h"

namespace casereader {

/**
 * @brief Version information
 */
class Version {
 public:
  /**
   * @brief Get version string
   * @return Version string (e.g., "0.1.0")
   */
  static std::string String() { return "0.1.0"; }

  static int Major() { return 0; }
  static int Minor() { return 1; }
  static int Patch() { return 0; }

  /**
   * @brief Newest case store format this build reads
   */
  static int64_t MaxFormatVersion() { return codec::kMaxFormatVersion; }
};

}  // namespace casereader
