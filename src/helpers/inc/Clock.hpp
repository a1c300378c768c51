#ifndef PROXWATCH_HELPERS_CLOCK_HPP
#define PROXWATCH_HELPERS_CLOCK_HPP
/**
 * @file Clock.hpp
 * @brief Monotonic and wall-clock timestamp helpers.
 *
 * Rate computation uses the monotonic clock so wall-clock adjustments never
 * produce negative or inflated intervals. Wall-clock time is only used to
 * stamp records for display and persistence.
 */

#include <cstdint>
#include <ctime> // clock_gettime, CLOCK_MONOTONIC

namespace proxwatch {
namespace helpers {
namespace clock {

/* ----------------------------- API ----------------------------- */

/**
 * @brief Get monotonic timestamp in nanoseconds.
 * @return Current CLOCK_MONOTONIC time in nanoseconds.
 */
[[nodiscard]] inline std::uint64_t getMonotonicNs() noexcept {
  struct timespec ts{};
  ::clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<std::uint64_t>(ts.tv_sec) * 1'000'000'000ULL +
         static_cast<std::uint64_t>(ts.tv_nsec);
}

/// @brief Monotonic timestamp in fractional seconds.
[[nodiscard]] inline double getMonotonicSec() noexcept {
  return static_cast<double>(getMonotonicNs()) / 1'000'000'000.0;
}

} // namespace clock
} // namespace helpers
} // namespace proxwatch

#endif // PROXWATCH_HELPERS_CLOCK_HPP
