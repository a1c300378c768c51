#ifndef PROXWATCH_SNMP_SNMP_RESULT_HPP
#define PROXWATCH_SNMP_SNMP_RESULT_HPP
/**
 * @file SnmpResult.hpp
 * @brief Status codes and result record for SNMP GET operations.
 * @note Thread-safe: Plain value types.
 *
 * Every codec, transport and client operation reports through SnmpStatus;
 * nothing on the data path throws.
 */

#include <cstdint>
#include <string>

namespace proxwatch {

namespace snmp {

/* ----------------------------- SnmpStatus ----------------------------- */

/**
 * @brief Outcome of an SNMP operation.
 */
enum class SnmpStatus : std::uint8_t {
  OK = 0,
  INVALID_OID,        ///< OID text yields no arcs (configuration error)
  TIMEOUT,            ///< No reply within the transport timeout
  AGENT_ERROR,        ///< Agent answered with non-zero error-status
  MALFORMED_RESPONSE, ///< Reply bytes do not form a GetResponse
  UNSUPPORTED_VALUE,  ///< Reply value is not a scalar number
  TRANSPORT_ERROR,    ///< Socket create/bind/send/receive failure
  PARTIAL_SEND,       ///< Fewer bytes sent than encoded
  RESOLVE_FAILED,     ///< Host name did not resolve
  TASK_FAILURE,       ///< Worker task did not run to completion
};

/**
 * @brief Human-readable status string.
 */
[[nodiscard]] const char* toString(SnmpStatus status) noexcept;

/**
 * @brief True for transient failures worth retrying on the next cycle.
 */
[[nodiscard]] bool isRetryable(SnmpStatus status) noexcept;

/**
 * @brief Label for an SNMP error-status value (tooBig, noSuchName, ...).
 * @return "unknown" for values outside 1..5.
 */
[[nodiscard]] const char* errorStatusLabel(std::int64_t errorStatus) noexcept;

/* ----------------------------- SnmpResult ----------------------------- */

/**
 * @brief Result of one SNMP GET.
 */
struct SnmpResult {
  SnmpStatus status{SnmpStatus::OK}; ///< Outcome
  double value{0.0};                 ///< Decoded value (valid when ok())
  bool isCounter{false};             ///< Value came from an unsigned type
  std::uint64_t counter{0};          ///< Exact unsigned value when isCounter
  std::string message{};             ///< Diagnostic text when !ok()
  std::int64_t errorStatus{0};       ///< Agent error-status (AGENT_ERROR)
  std::int64_t errorIndex{0};        ///< Agent error-index (AGENT_ERROR)
  std::int32_t requestId{0};         ///< Request id used, 0 if never sent

  /// @brief True on success.
  [[nodiscard]] bool ok() const noexcept { return status == SnmpStatus::OK; }

  /// @brief Build a failed result.
  [[nodiscard]] static SnmpResult failure(SnmpStatus status, std::string message);

  /// @brief Build a successful result.
  [[nodiscard]] static SnmpResult success(double value) noexcept;

  /// @brief Build a successful result from a Counter/Gauge/TimeTicks value.
  [[nodiscard]] static SnmpResult successCounter(std::uint64_t counter) noexcept;

  /// @brief One-line summary, e.g. "TIMEOUT: no response ...".
  [[nodiscard]] std::string toString() const;
};

} // namespace snmp

} // namespace proxwatch

#endif // PROXWATCH_SNMP_SNMP_RESULT_HPP
