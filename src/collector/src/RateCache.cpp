/**
 * @file RateCache.cpp
 * @brief RateCache implementation.
 */

#include "src/collector/inc/RateCache.hpp"

#include <limits>

namespace proxwatch {

namespace collector {

/* ----------------------------- Rate Math ----------------------------- */

std::uint64_t counterDelta(std::uint64_t prev, std::uint64_t current) noexcept {
  if (current >= prev) {
    return current - prev;
  }
  // Explicit form of the modular difference
  return (std::numeric_limits<std::uint64_t>::max() - prev) + current + 1;
}

double calculateBps(std::uint64_t prev, std::uint64_t current, double elapsedSec) noexcept {
  if (elapsedSec <= 0.0) {
    return 0.0;
  }
  return static_cast<double>(counterDelta(prev, current)) * 8.0 / elapsedSec;
}

/* ----------------------------- RateCache Methods ----------------------------- */

std::optional<InterfaceTraffic> RateCache::update(std::uint32_t deviceId,
                                                  const std::string& ifname,
                                                  std::optional<std::uint64_t> inOctets,
                                                  std::optional<std::uint64_t> outOctets,
                                                  double nowSec) {
  const Sample CURRENT{inOctets.value_or(0), outOctets.value_or(0), nowSec};
  std::optional<InterfaceTraffic> traffic;

  std::lock_guard<std::mutex> lock(mtx_);

  auto it = samples_.find(Key{deviceId, ifname});
  if (it == samples_.end()) {
    samples_.emplace(Key{deviceId, ifname}, CURRENT);
    return traffic;
  }

  const Sample PREV = it->second;
  it->second = CURRENT;

  const double ELAPSED = nowSec - PREV.observedAtSec;
  if (ELAPSED < MIN_RATE_INTERVAL_SEC || ELAPSED > MAX_RATE_INTERVAL_SEC) {
    return traffic;
  }

  const double IN_BPS = inOctets ? calculateBps(PREV.inOctets, *inOctets, ELAPSED) : 0.0;
  const double OUT_BPS = outOctets ? calculateBps(PREV.outOctets, *outOctets, ELAPSED) : 0.0;
  if (IN_BPS > 0.0 || OUT_BPS > 0.0) {
    traffic = InterfaceTraffic{ifname, IN_BPS, OUT_BPS};
  }
  return traffic;
}

std::optional<RateCache::Sample> RateCache::lookup(std::uint32_t deviceId,
                                                   const std::string& ifname) const {
  std::lock_guard<std::mutex> lock(mtx_);
  const auto IT = samples_.find(Key{deviceId, ifname});
  if (IT == samples_.end()) {
    return std::nullopt;
  }
  return IT->second;
}

std::size_t RateCache::size() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return samples_.size();
}

void RateCache::clear() {
  std::lock_guard<std::mutex> lock(mtx_);
  samples_.clear();
}

std::shared_ptr<RateCache> RateCache::shared() {
  static const std::shared_ptr<RateCache> INSTANCE = std::make_shared<RateCache>();
  return INSTANCE;
}

} // namespace collector

} // namespace proxwatch
