#ifndef PROXWATCH_CONFIG_COLLECTOR_CONFIG_HPP
#define PROXWATCH_CONFIG_COLLECTOR_CONFIG_HPP
/**
 * @file CollectorConfig.hpp
 * @brief What to collect from each device and how long to wait for it.
 * @note Thread-safe: Plain value types; shared read-only across worker threads.
 *
 * A metric's source is decided once, when configuration is loaded: the literal
 * "ssh" (any case) selects the SSH memory collaborator, any other non-blank
 * string is an OID, and a blank string means the metric is not configured.
 */

#include "src/config/inc/Device.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace proxwatch {

namespace config {

/* ----------------------------- Constants ----------------------------- */

/// Default transport timeout for one SNMP GET.
inline constexpr std::chrono::milliseconds DEFAULT_SNMP_TIMEOUT{5000};

/// Per-metric task bound = snmpTimeout + this margin.
inline constexpr std::chrono::milliseconds TASK_TIMEOUT_MARGIN{2000};

/// Per-device bound = taskTimeout + this margin.
inline constexpr std::chrono::milliseconds DEVICE_TIMEOUT_MARGIN{1000};

/// Default SNMP agent port.
inline constexpr std::uint16_t DEFAULT_SNMP_PORT = 161;

/// Default community string.
inline constexpr std::string_view DEFAULT_COMMUNITY = "public";

/// Canonical column order for well-known metrics; others follow alphabetically.
inline constexpr std::array<std::string_view, 7> KNOWN_METRICS = {"cpu", "mem",  "cc", "cs",
                                                                  "http", "https", "ftp"};

/* ----------------------------- MetricSource ----------------------------- */

/// Metric fetched with an SNMP GET of one OID.
struct SnmpOid {
  std::string oid{};
};

/// Memory percentage fetched through the SSH collaborator.
struct SshMemory {};

/// Where a metric value comes from.
using MetricSource = std::variant<SnmpOid, SshMemory>;

/**
 * @brief Classify a configured metric string.
 * @param text Raw configured value.
 * @param out Receives the source when configured.
 * @return false when text is blank (metric not configured).
 */
[[nodiscard]] bool parseMetricSource(std::string_view text, MetricSource& out);

/// @brief OID text, or "ssh" for the SSH source.
[[nodiscard]] std::string describe(const MetricSource& source);

/**
 * @brief One configured metric.
 */
struct MetricSpec {
  std::string name{};     ///< Metric key, e.g. "cpu"
  MetricSource source{};  ///< Where the value comes from
};

/* ----------------------------- InterfaceOids ----------------------------- */

/**
 * @brief Inbound and outbound octet-counter OIDs of one interface.
 */
struct InterfaceOids {
  std::string inOid{};  ///< Inbound counter OID, empty if not polled
  std::string outOid{}; ///< Outbound counter OID, empty if not polled

  [[nodiscard]] bool empty() const noexcept { return inOid.empty() && outOid.empty(); }
};

/* ----------------------------- CollectorConfig ----------------------------- */

/**
 * @brief Collector configuration shared by every device in a cycle.
 */
struct CollectorConfig {
  std::string community{DEFAULT_COMMUNITY};                  ///< Default community
  std::vector<MetricSpec> metrics{};                         ///< Configured metrics, column order
  std::map<std::string, InterfaceOids> interfaces{};         ///< Interface name -> OIDs
  std::chrono::milliseconds snmpTimeout{DEFAULT_SNMP_TIMEOUT}; ///< Transport timeout
  std::chrono::milliseconds taskTimeout{DEFAULT_SNMP_TIMEOUT + TASK_TIMEOUT_MARGIN};
  std::chrono::milliseconds deviceTimeout{DEFAULT_SNMP_TIMEOUT + TASK_TIMEOUT_MARGIN +
                                          DEVICE_TIMEOUT_MARGIN};
  std::uint16_t snmpPort{DEFAULT_SNMP_PORT}; ///< Agent UDP port

  /**
   * @brief Set the transport timeout and re-derive the two outer bounds.
   */
  void setSnmpTimeout(std::chrono::milliseconds timeout) noexcept;

  /**
   * @brief Check that each bound encloses the one inside it.
   * @param error Receives the offending pair on failure.
   * @return false unless snmpTimeout < taskTimeout <= deviceTimeout.
   *
   * A task bound at or below the transport timeout would report a slow but
   * answering agent as a task timeout instead of an SNMP timeout.
   */
  [[nodiscard]] bool checkTimeouts(std::string& error) const;

  /**
   * @brief Add a metric from its configured string.
   * @return false when text is blank; the metric is then not added.
   *
   * Re-adding a name replaces its source. Metrics are kept in column order.
   */
  bool addMetric(const std::string& name, std::string_view text);

  /// @brief Community to use for a device (its override or the default).
  [[nodiscard]] const std::string& communityFor(const Device& device) const noexcept {
    return device.community.empty() ? community : device.community;
  }

  /// @brief Metric names in column order.
  [[nodiscard]] std::vector<std::string> metricNames() const;

  /// @brief Interface names, sorted.
  [[nodiscard]] std::vector<std::string> interfaceNames() const;
};

/**
 * @brief Column position of a metric name (well-known first, then alphabetical).
 */
[[nodiscard]] bool metricOrderLess(std::string_view a, std::string_view b) noexcept;

} // namespace config

} // namespace proxwatch

#endif // PROXWATCH_CONFIG_COLLECTOR_CONFIG_HPP
