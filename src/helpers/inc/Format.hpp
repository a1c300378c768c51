#ifndef PROXWATCH_HELPERS_FORMAT_HPP
#define PROXWATCH_HELPERS_FORMAT_HPP
/**
 * @file Format.hpp
 * @brief Human-readable formatting for bit rates and metric values.
 *
 * @note Cold path: all functions return std::string.
 */

#include <optional>
#include <string>

#include <fmt/core.h>

namespace proxwatch {
namespace helpers {
namespace format {

/* ----------------------------- API ----------------------------- */

/**
 * @brief Format a bit rate using decimal units (bps, Kbps, Mbps, Gbps).
 * @param bitsPerSec Rate in bits per second.
 * @return Formatted string (e.g., "1.50 Gbps").
 */
[[nodiscard]] inline std::string bitRate(double bitsPerSec) {
  if (bitsPerSec <= 0.0) {
    return "0 bps";
  }

  constexpr double KBPS = 1'000.0;
  constexpr double MBPS = 1'000'000.0;
  constexpr double GBPS = 1'000'000'000.0;

  if (bitsPerSec >= GBPS) {
    return fmt::format("{:.2f} Gbps", bitsPerSec / GBPS);
  }
  if (bitsPerSec >= MBPS) {
    return fmt::format("{:.2f} Mbps", bitsPerSec / MBPS);
  }
  if (bitsPerSec >= KBPS) {
    return fmt::format("{:.2f} Kbps", bitsPerSec / KBPS);
  }

  return fmt::format("{:.0f} bps", bitsPerSec);
}

/**
 * @brief Format an optional metric value with two decimals, "-" when absent.
 */
[[nodiscard]] inline std::string metricOrDash(const std::optional<double>& value) {
  if (!value) {
    return "-";
  }
  return fmt::format("{:.2f}", *value);
}

} // namespace format
} // namespace helpers
} // namespace proxwatch

#endif // PROXWATCH_HELPERS_FORMAT_HPP
