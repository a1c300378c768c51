#ifndef PROXWATCH_COLLECTOR_RESOURCE_COLLECTOR_HPP
#define PROXWATCH_COLLECTOR_RESOURCE_COLLECTOR_HPP
/**
 * @file ResourceCollector.hpp
 * @brief Concurrent per-device fetch and fleet fan-out.
 * @note Blocking: collectDevice() returns within about taskTimeout and
 *       collectFleet() within about deviceTimeout, whatever the devices do.
 * @note Thread-safe: const methods; all state reachable from worker threads is
 *       shared-owned so abandoned workers never dangle.
 *
 * Every configured metric and every interface direction is fetched on its own
 * worker and awaited against its own deadline. A metric that times out or fails
 * is logged and left absent; it never affects its siblings. Fleet fan-out runs
 * one worker per device and always yields exactly one record per device.
 */

#include "src/collector/inc/RateCache.hpp"
#include "src/collector/inc/ResourceRecord.hpp"
#include "src/collector/inc/SshMetricSource.hpp"
#include "src/config/inc/CollectorConfig.hpp"
#include "src/config/inc/Device.hpp"
#include "src/snmp/inc/SnmpClient.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace proxwatch {

namespace collector {

/* ----------------------------- Types ----------------------------- */

/// Produces the SNMP getter used for one device (community may differ per device).
using GetterFactory =
    std::function<std::shared_ptr<const snmp::SnmpGetter>(const config::Device&)>;

/// Called with (completed, total) after each device settles.
using ProgressCallback = std::function<void(std::size_t, std::size_t)>;

/**
 * @brief Outcome of a fleet fan-out.
 */
struct FleetCollection {
  bool ok{true};                        ///< False only when every device failed
  std::vector<ResourceRecord> records{}; ///< One per device, sorted by device id
  std::string error{};                  ///< Reason when !ok

  [[nodiscard]] std::size_t failedCount() const noexcept;
  [[nodiscard]] std::size_t succeededCount() const noexcept {
    return records.size() - failedCount();
  }
};

/* ----------------------------- Factories ----------------------------- */

/**
 * @brief Factory building an SnmpClient per device from the collector config.
 */
[[nodiscard]] GetterFactory snmpClientFactory(const config::CollectorConfig& cfg);

/**
 * @brief Factory returning the same getter for every device.
 */
[[nodiscard]] GetterFactory fixedGetter(std::shared_ptr<const snmp::SnmpGetter> getter);

/* ----------------------------- ResourceCollector ----------------------------- */

/**
 * @brief Collects resource records from devices.
 */
class ResourceCollector {
public:
  /**
   * @brief Construct a collector.
   * @param cfg Metrics, interfaces and timeouts.
   * @param getters SNMP getter factory (see snmpClientFactory()).
   * @param ssh SSH memory source; nullptr leaves "ssh" metrics absent.
   * @param cache Rate cache; defaults to the process-wide cache.
   */
  ResourceCollector(config::CollectorConfig cfg, GetterFactory getters,
                    std::shared_ptr<const SshMetricSource> ssh = nullptr,
                    std::shared_ptr<RateCache> cache = RateCache::shared());

  /**
   * @brief Fetch every configured metric and interface of one device.
   * @return Exactly one record; failed iff metrics were configured and none arrived.
   */
  [[nodiscard]] ResourceRecord collectDevice(const config::Device& device) const;

  /**
   * @brief Fetch all devices concurrently.
   * @param devices Devices to poll (already filtered by the caller).
   * @param progress Optional progress callback, invoked on the calling thread.
   * @return Records sorted by device id. ok is false only when devices is
   *         non-empty and every record failed.
   */
  [[nodiscard]] FleetCollection collectFleet(const std::vector<config::Device>& devices,
                                             const ProgressCallback& progress = {}) const;

  [[nodiscard]] const config::CollectorConfig& config() const noexcept;

  struct Context;

private:
  std::shared_ptr<const Context> ctx_;
};

} // namespace collector

} // namespace proxwatch

#endif // PROXWATCH_COLLECTOR_RESOURCE_COLLECTOR_HPP
