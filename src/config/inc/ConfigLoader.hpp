#ifndef PROXWATCH_CONFIG_CONFIG_LOADER_HPP
#define PROXWATCH_CONFIG_CONFIG_LOADER_HPP
/**
 * @file ConfigLoader.hpp
 * @brief JSON loaders for the collector configuration and the device inventory.
 * @note Never throws: parse and type errors are reported through the error string.
 *
 * Collector configuration:
 * @code
 *   {
 *     "community": "public",
 *     "snmp_timeout_ms": 5000,
 *     "oids": { "cpu": "1.3.6.1.4.1.2021.11.9.0", "mem": "ssh", "cc": "" },
 *     "interface_oids": {
 *       "eth0": ["1.3.6.1.2.1.31.1.1.1.6.1", "1.3.6.1.2.1.31.1.1.1.10.1"],
 *       "eth1": { "in": "1.3.6.1.2.1.31.1.1.1.6.2" }
 *     }
 *   }
 * @endcode
 *
 * Device inventory:
 * @code
 *   { "proxies": [ { "id": 1, "host": "10.0.0.1", "port": 22, "username": "admin",
 *                    "password": "...", "group": "dc1", "alias": "edge-1",
 *                    "community": "private" } ] }
 * @endcode
 */

#include "src/config/inc/CollectorConfig.hpp"
#include "src/config/inc/Device.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace proxwatch {

namespace config {

/* ----------------------------- Collector Config ----------------------------- */

/**
 * @brief Parse collector configuration JSON.
 * @param text JSON document.
 * @param out Receives the configuration (reset to defaults first).
 * @param error Receives a description on failure.
 * @return false on malformed JSON, a wrong field type or a non-positive timeout.
 *
 * Blank OIDs drop their metric; interfaces with no OID in either direction are dropped.
 * Optional "task_timeout_ms" and "device_timeout_ms" override the derived bounds.
 */
[[nodiscard]] bool parseCollectorConfig(std::string_view text, CollectorConfig& out,
                                        std::string& error);

/// @brief Read and parse a collector configuration file.
[[nodiscard]] bool loadCollectorConfig(const std::string& path, CollectorConfig& out,
                                       std::string& error);

/* ----------------------------- Device Inventory ----------------------------- */

/**
 * @brief Parse the device inventory JSON.
 * @param text JSON document with a "proxies" array.
 * @param out Receives the devices in document order (cleared first).
 * @param error Receives a description on failure.
 * @return false on malformed JSON, a missing id or host, a port outside 1..65535,
 *         or a duplicate id.
 *
 * "snmp_community" is accepted as a synonym for "community".
 */
[[nodiscard]] bool parseDeviceList(std::string_view text, std::vector<Device>& out,
                                   std::string& error);

/// @brief Read and parse a device inventory file.
[[nodiscard]] bool loadDeviceList(const std::string& path, std::vector<Device>& out,
                                  std::string& error);

} // namespace config

} // namespace proxwatch

#endif // PROXWATCH_CONFIG_CONFIG_LOADER_HPP
