#ifndef PROXWATCH_COLLECTOR_RATE_CACHE_HPP
#define PROXWATCH_COLLECTOR_RATE_CACHE_HPP
/**
 * @file RateCache.hpp
 * @brief Cross-cycle interface counter cache and bit-rate computation.
 * @note Thread-safe: RateCache methods lock an internal mutex for the lookup,
 *       computation and insert only; no I/O happens under the lock.
 *
 * Per (device, interface) key the cache moves from "no sample" to "has sample"
 * on the first poll and is overwritten on every poll after that. A rate is
 * produced only when a prior sample exists and the elapsed time lies within
 * [MIN_RATE_INTERVAL_SEC, MAX_RATE_INTERVAL_SEC].
 */

#include "src/collector/inc/ResourceRecord.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace proxwatch {

namespace collector {

/* ----------------------------- Constants ----------------------------- */

/// Shortest poll interval that yields a rate (seconds).
inline constexpr double MIN_RATE_INTERVAL_SEC = 1.0;

/// Longest poll interval that yields a rate (seconds); older samples are stale.
inline constexpr double MAX_RATE_INTERVAL_SEC = 300.0;

/* ----------------------------- Rate Math ----------------------------- */

/**
 * @brief Counter difference with wraparound correction.
 *
 * A current value below prev is treated as a roll-over of the 64-bit counter:
 * (UINT64_MAX - prev) + current + 1.
 */
[[nodiscard]] std::uint64_t counterDelta(std::uint64_t prev, std::uint64_t current) noexcept;

/**
 * @brief Bits per second between two octet counter readings.
 * @return 0 when elapsedSec <= 0.
 */
[[nodiscard]] double calculateBps(std::uint64_t prev, std::uint64_t current,
                                  double elapsedSec) noexcept;

/* ----------------------------- RateCache ----------------------------- */

/**
 * @brief Mutex-guarded map (device id, interface) -> last raw counters.
 */
class RateCache {
public:
  /// Last stored reading. A direction that was not obtained is stored as 0.
  struct Sample {
    std::uint64_t inOctets{0};
    std::uint64_t outOctets{0};
    double observedAtSec{0.0}; ///< Monotonic seconds
  };

  /**
   * @brief Feed one poll's counters and get the rate over the last interval.
   * @param deviceId Device id.
   * @param ifname Interface name.
   * @param inOctets Inbound counter, if fetched.
   * @param outOctets Outbound counter, if fetched.
   * @param nowSec Monotonic time of this poll in seconds.
   * @return Traffic when a prior sample lies within the rate window and at
   *         least one direction's rate is above zero; nullopt otherwise.
   *
   * The entry is always overwritten with this poll's counters. A direction
   * missing from this poll rates as 0.
   */
  [[nodiscard]] std::optional<InterfaceTraffic> update(std::uint32_t deviceId,
                                                       const std::string& ifname,
                                                       std::optional<std::uint64_t> inOctets,
                                                       std::optional<std::uint64_t> outOctets,
                                                       double nowSec);

  /// @brief Stored sample for a key, if any.
  [[nodiscard]] std::optional<Sample> lookup(std::uint32_t deviceId,
                                             const std::string& ifname) const;

  /// @brief Number of cached keys.
  [[nodiscard]] std::size_t size() const;

  /// @brief Drop every cached sample.
  void clear();

  /// @brief Process-wide cache used by default collectors.
  [[nodiscard]] static std::shared_ptr<RateCache> shared();

private:
  using Key = std::pair<std::uint32_t, std::string>;

  mutable std::mutex mtx_;
  std::map<Key, Sample> samples_;
};

} // namespace collector

} // namespace proxwatch

#endif // PROXWATCH_COLLECTOR_RATE_CACHE_HPP
