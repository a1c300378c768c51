#ifndef PROXWATCH_CONFIG_DEVICE_HPP
#define PROXWATCH_CONFIG_DEVICE_HPP
/**
 * @file Device.hpp
 * @brief Monitored proxy appliance and fleet selection helpers.
 * @note Thread-safe: Plain value type; immutable during a collection cycle.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace proxwatch {

namespace config {

/* ----------------------------- Constants ----------------------------- */

/// Default SSH port for the memory collaborator.
inline constexpr std::uint16_t DEFAULT_SSH_PORT = 22;

/* ----------------------------- Device ----------------------------- */

/**
 * @brief One monitored appliance.
 */
struct Device {
  std::uint32_t id{0};                  ///< Unique identifier (records sort by it)
  std::string host{};                   ///< IPv4 literal or DNS name
  std::uint16_t sshPort{DEFAULT_SSH_PORT}; ///< SSH port (memory collaborator)
  std::string username{};               ///< SSH user
  std::string password{};               ///< SSH password
  std::string group{};                  ///< Fleet group label
  std::string alias{};                  ///< Display name, empty if none
  std::string community{};              ///< Per-device community, empty = use configured

  /// @brief Alias when set, host otherwise.
  [[nodiscard]] const std::string& displayName() const noexcept {
    return alias.empty() ? host : alias;
  }
};

/* ----------------------------- Selection ----------------------------- */

/**
 * @brief Devices whose group equals group (exact match).
 * @param devices Full inventory.
 * @param group Group label; empty keeps every device.
 * @return Matching devices in inventory order.
 */
[[nodiscard]] std::vector<Device> filterByGroup(const std::vector<Device>& devices,
                                                std::string_view group);

/**
 * @brief Distinct non-empty group labels, sorted.
 */
[[nodiscard]] std::vector<std::string> listGroups(const std::vector<Device>& devices);

} // namespace config

} // namespace proxwatch

#endif // PROXWATCH_CONFIG_DEVICE_HPP
