#ifndef PROXWATCH_SNMP_SNMP_CLIENT_HPP
#define PROXWATCH_SNMP_SNMP_CLIENT_HPP
/**
 * @file SnmpClient.hpp
 * @brief Blocking SNMPv2c GET client.
 * @note Blocking: each get() waits up to the configured timeout. Run on a worker thread.
 * @note Thread-safe: get() is const and keeps no per-call state in the object.
 *
 * Usage:
 * @code
 *   proxwatch::snmp::SnmpClient client({"public", std::chrono::seconds(5)});
 *   auto res = client.get("10.0.0.1", "1.3.6.1.2.1.1.3.0");
 *   if (res.ok()) {
 *     fmt::print("uptime ticks: {}\n", res.value);
 *   }
 * @endcode
 */

#include "src/snmp/inc/SnmpResult.hpp"
#include "src/snmp/inc/UdpTransport.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace proxwatch {

namespace snmp {

/* ----------------------------- SnmpGetter ----------------------------- */

/**
 * @brief Anything that can fetch one numeric value for an OID from a host.
 *
 * The collector depends on this interface so tests can substitute a fake agent.
 * Implementations must be safe to call from several threads at once.
 */
class SnmpGetter {
public:
  virtual ~SnmpGetter() = default;

  /**
   * @brief Fetch one value.
   * @param host Agent address (IPv4 literal or DNS name).
   * @param oid Dotted OID text.
   * @return Result with value on success, status and message otherwise.
   */
  [[nodiscard]] virtual SnmpResult get(const std::string& host, const std::string& oid) const = 0;
};

/* ----------------------------- SnmpClient ----------------------------- */

/**
 * @brief Client configuration.
 */
struct SnmpClientConfig {
  std::string community{"public"};                        ///< Community string
  std::chrono::milliseconds timeout{std::chrono::seconds(5)}; ///< Per-request timeout
  std::uint16_t port{SNMP_PORT};                         ///< Agent UDP port
};

/**
 * @brief SnmpGetter backed by UDP and the BER codec.
 */
class SnmpClient final : public SnmpGetter {
public:
  explicit SnmpClient(SnmpClientConfig config);

  [[nodiscard]] SnmpResult get(const std::string& host, const std::string& oid) const override;

  [[nodiscard]] const SnmpClientConfig& config() const noexcept { return config_; }

private:
  SnmpClientConfig config_;
};

} // namespace snmp

} // namespace proxwatch

#endif // PROXWATCH_SNMP_SNMP_CLIENT_HPP
