#ifndef PROXWATCH_COLLECTOR_RESOURCE_RECORD_HPP
#define PROXWATCH_COLLECTOR_RESOURCE_RECORD_HPP
/**
 * @file ResourceRecord.hpp
 * @brief Per-device result of one collection cycle.
 * @note Thread-safe: Plain value types.
 *
 * Absent metrics are simply missing from the record; they are never zero-filled.
 */

#include "src/config/inc/Device.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace proxwatch {

namespace collector {

/* ----------------------------- Values ----------------------------- */

/**
 * @brief One collected metric.
 */
struct MetricValue {
  std::string name{}; ///< Metric key, e.g. "cpu"
  double value{0.0};  ///< Value as reported by the device
};

/**
 * @brief Bit rates of one interface over the last poll interval.
 */
struct InterfaceTraffic {
  std::string name{}; ///< Interface name
  double inBps{0.0};  ///< Inbound bits per second (>= 0)
  double outBps{0.0}; ///< Outbound bits per second (>= 0)
};

/* ----------------------------- ResourceRecord ----------------------------- */

/**
 * @brief Everything collected from one device in one cycle.
 */
struct ResourceRecord {
  std::uint32_t deviceId{0};                          ///< Device id
  std::string host{};                                 ///< Device host
  std::string alias{};                                ///< Device alias, may be empty
  std::vector<MetricValue> metrics{};                 ///< Present metrics, column order
  std::vector<InterfaceTraffic> interfaces{};         ///< Emitted rates, sorted by name
  std::chrono::system_clock::time_point collectedAt{}; ///< Wall-clock completion time
  std::size_t configuredMetrics{0};                   ///< Metrics requested for this device
  bool failed{false};                                 ///< True when nothing configured came back
  std::string errorMessage{};                         ///< Reason when failed

  /// @brief Value of a metric if present.
  [[nodiscard]] std::optional<double> metric(std::string_view name) const noexcept;

  /// @brief Traffic entry for an interface, or nullptr.
  [[nodiscard]] const InterfaceTraffic* findInterface(std::string_view name) const noexcept;

  /// @brief Alias when set, host otherwise.
  [[nodiscard]] const std::string& displayName() const noexcept {
    return alias.empty() ? host : alias;
  }

  /// @brief One-line summary for logs and CLI output.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- Classification ----------------------------- */

/**
 * @brief Failure rule for a device record.
 * @return true iff at least one metric was configured and none came back.
 */
[[nodiscard]] constexpr bool isCollectionFailed(std::size_t configured,
                                                std::size_t present) noexcept {
  return configured > 0 && present == 0;
}

/**
 * @brief Record for a device that produced no data at all.
 */
[[nodiscard]] ResourceRecord failedRecord(const config::Device& device, std::size_t configured,
                                          std::string message);

} // namespace collector

} // namespace proxwatch

#endif // PROXWATCH_COLLECTOR_RESOURCE_RECORD_HPP
