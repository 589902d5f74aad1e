#pragma once

#include "Types.hpp"

namespace slowfetch::utils::types {
  /**
   * @struct ResourceUsage
   * @brief Used and total size of a resource (RAM, disk space), in bytes.
   */
  struct ResourceUsage {
    u64 usedBytes;
    u64 totalBytes;

    ResourceUsage() = default;

    ResourceUsage(const u64& usedBytes, const u64& totalBytes)
      : usedBytes(usedBytes), totalBytes(totalBytes) {}

    /// Percentage in [0, 100]; 0 when the total is unknown.
    [[nodiscard]] auto percent() const -> f64 {
      return totalBytes == 0 ? 0.0 : (static_cast<f64>(usedBytes) / static_cast<f64>(totalBytes)) * 100.0;
    }
  };
} // namespace slowfetch::utils::types
