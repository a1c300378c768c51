#ifndef PROXWATCH_SNMP_UDP_TRANSPORT_HPP
#define PROXWATCH_SNMP_UDP_TRANSPORT_HPP
/**
 * @file UdpTransport.hpp
 * @brief One-datagram-out, one-datagram-in UDP exchange for SNMP.
 * @note Linux/POSIX sockets. Blocking: run on a worker thread.
 * @note Thread-safe: exchange() owns its socket; nextRequestId() is a lock-free atomic.
 *
 * Each exchange opens a fresh socket bound to an ephemeral port, so replies to an
 * abandoned request can never be read by a later one.
 */

#include "src/snmp/inc/BerCodec.hpp"
#include "src/snmp/inc/SnmpResult.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace proxwatch {

namespace snmp {

/* ----------------------------- Constants ----------------------------- */

/// Standard SNMP agent port.
inline constexpr std::uint16_t SNMP_PORT = 161;

/// Receive buffer size (one Ethernet MTU).
inline constexpr std::size_t MAX_DATAGRAM_SIZE = 1500;

/// Largest request sent (MTU minus IPv4 and UDP headers).
inline constexpr std::size_t MAX_REQUEST_SIZE = 1472;

/// Receive buffer type.
using DatagramBuffer = std::array<std::uint8_t, MAX_DATAGRAM_SIZE>;

/* ----------------------------- Request IDs ----------------------------- */

/**
 * @brief Next process-wide request identifier.
 *
 * Monotonic from 1, wrapped into the positive int32 range. Used to correlate
 * replies in logs and timeout messages; not a security token.
 */
[[nodiscard]] std::int32_t nextRequestId() noexcept;

/* ----------------------------- UdpSocket ----------------------------- */

/**
 * @brief Owning wrapper around a UDP socket descriptor.
 */
class UdpSocket {
public:
  UdpSocket() = default;
  explicit UdpSocket(int fd) noexcept : fd_(fd) {}
  ~UdpSocket();

  UdpSocket(const UdpSocket&) = delete;
  UdpSocket& operator=(const UdpSocket&) = delete;
  UdpSocket(UdpSocket&& other) noexcept;
  UdpSocket& operator=(UdpSocket&& other) noexcept;

  [[nodiscard]] int fd() const noexcept { return fd_; }
  [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

  /// @brief Close the descriptor if open.
  void reset() noexcept;

private:
  int fd_{-1};
};

/* ----------------------------- Exchange ----------------------------- */

/**
 * @brief Result of one request/reply exchange.
 */
struct TransportResult {
  SnmpStatus status{SnmpStatus::OK}; ///< OK, TIMEOUT, TRANSPORT_ERROR, PARTIAL_SEND, RESOLVE_FAILED
  std::size_t received{0};           ///< Reply length in bytes (valid when ok())
  std::string message{};             ///< Diagnostic text when !ok()

  [[nodiscard]] bool ok() const noexcept { return status == SnmpStatus::OK; }
};

/**
 * @brief Send one datagram to host:port and wait for one reply.
 * @param host IPv4 literal or DNS name.
 * @param port Destination UDP port.
 * @param request Encoded request (at most MAX_REQUEST_SIZE bytes).
 * @param timeout Send and receive timeout (clamped to at least 1 ms).
 * @param response Receives the reply datagram.
 * @return Status and reply length.
 *
 * Resolution failure is RESOLVE_FAILED; a short send is PARTIAL_SEND; a receive
 * timeout is TIMEOUT; a zero-length reply is MALFORMED_RESPONSE.
 */
[[nodiscard]] TransportResult exchange(const std::string& host, std::uint16_t port,
                                       ber::ByteView request, std::chrono::milliseconds timeout,
                                       DatagramBuffer& response);

} // namespace snmp

} // namespace proxwatch

#endif // PROXWATCH_SNMP_UDP_TRANSPORT_HPP
