/**
 * @file UdpTransport.cpp
 * @brief UDP exchange implementation (POSIX sockets).
 */

#include "src/snmp/inc/UdpTransport.hpp"

#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <memory>
#include <system_error>

#include <fmt/core.h>

namespace proxwatch {

namespace snmp {

namespace {

/* ----------------------------- State ----------------------------- */

std::atomic<std::uint32_t> g_requestIdCounter{1};

/* ----------------------------- Socket Helpers ----------------------------- */

inline std::string errnoText(int err) {
  return std::error_code(err, std::generic_category()).message();
}

/**
 * Set both send and receive timeouts.
 */
inline bool setSocketTimeouts(int fd, std::chrono::milliseconds timeout) noexcept {
  struct timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  return ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0 &&
         ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
}

/**
 * Bind to an ephemeral port on the wildcard address, falling back to loopback
 * (some sandboxes refuse wildcard binds).
 */
inline bool bindEphemeral(int fd, int family) noexcept {
  if (family == AF_INET6) {
    struct sockaddr_in6 addr{};
    addr.sin6_family = AF_INET6;
    addr.sin6_addr = in6addr_any;
    if (::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0) {
      return true;
    }
    addr.sin6_addr = in6addr_loopback;
    return ::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0;
  }

  struct sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  if (::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0) {
    return true;
  }
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  return ::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0;
}

using AddrInfoPtr = std::unique_ptr<struct addrinfo, decltype(&::freeaddrinfo)>;

/**
 * Resolve host:port, preferring an IPv4 result.
 */
inline const struct addrinfo* pickAddress(const struct addrinfo* list) noexcept {
  for (const struct addrinfo* ai = list; ai != nullptr; ai = ai->ai_next) {
    if (ai->ai_family == AF_INET) {
      return ai;
    }
  }
  return list;
}

inline TransportResult failed(SnmpStatus status, std::string message) {
  TransportResult res;
  res.status = status;
  res.message = std::move(message);
  return res;
}

} // namespace

/* ----------------------------- Request IDs ----------------------------- */

std::int32_t nextRequestId() noexcept {
  const std::uint32_t RAW = g_requestIdCounter.fetch_add(1, std::memory_order_relaxed);
  return static_cast<std::int32_t>(RAW & 0x7FFFFFFFU);
}

/* ----------------------------- UdpSocket Methods ----------------------------- */

UdpSocket::~UdpSocket() { reset(); }

UdpSocket::UdpSocket(UdpSocket&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

UdpSocket& UdpSocket::operator=(UdpSocket&& other) noexcept {
  if (this != &other) {
    reset();
    fd_ = other.fd_;
    other.fd_ = -1;
  }
  return *this;
}

void UdpSocket::reset() noexcept {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

/* ----------------------------- Exchange ----------------------------- */

TransportResult exchange(const std::string& host, std::uint16_t port, ber::ByteView request,
                         std::chrono::milliseconds timeout, DatagramBuffer& response) {
  if (request.size() > MAX_REQUEST_SIZE) {
    return failed(SnmpStatus::TRANSPORT_ERROR,
                  fmt::format("request of {} bytes exceeds {} byte limit", request.size(),
                              MAX_REQUEST_SIZE));
  }
  if (timeout < std::chrono::milliseconds(1)) {
    timeout = std::chrono::milliseconds(1);
  }

  struct addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_DGRAM;
  hints.ai_protocol = IPPROTO_UDP;

  struct addrinfo* rawList = nullptr;
  const std::string PORT_STR = std::to_string(port);
  const int GAI = ::getaddrinfo(host.c_str(), PORT_STR.c_str(), &hints, &rawList);
  if (GAI != 0 || rawList == nullptr) {
    return failed(SnmpStatus::RESOLVE_FAILED, fmt::format("failed to resolve {}: {}", host,
                                                          GAI != 0 ? ::gai_strerror(GAI)
                                                                   : "no addresses"));
  }
  const AddrInfoPtr LIST(rawList, &::freeaddrinfo);
  const struct addrinfo* target = pickAddress(LIST.get());

  UdpSocket sock(::socket(target->ai_family, SOCK_DGRAM | SOCK_CLOEXEC, 0));
  if (!sock.valid()) {
    return failed(SnmpStatus::TRANSPORT_ERROR, fmt::format("socket: {}", errnoText(errno)));
  }
  if (!bindEphemeral(sock.fd(), target->ai_family)) {
    return failed(SnmpStatus::TRANSPORT_ERROR, fmt::format("bind: {}", errnoText(errno)));
  }
  if (!setSocketTimeouts(sock.fd(), timeout)) {
    return failed(SnmpStatus::TRANSPORT_ERROR, fmt::format("setsockopt: {}", errnoText(errno)));
  }

  ssize_t sent = 0;
  do {
    sent = ::sendto(sock.fd(), request.data(), request.size(), 0, target->ai_addr,
                    target->ai_addrlen);
  } while (sent < 0 && errno == EINTR);

  if (sent < 0) {
    return failed(SnmpStatus::TRANSPORT_ERROR,
                  fmt::format("send to {}: {}", host, errnoText(errno)));
  }
  if (static_cast<std::size_t>(sent) != request.size()) {
    return failed(SnmpStatus::PARTIAL_SEND,
                  fmt::format("partial send: sent {}/{} bytes", sent, request.size()));
  }

  ssize_t got = 0;
  do {
    got = ::recvfrom(sock.fd(), response.data(), response.size(), 0, nullptr, nullptr);
  } while (got < 0 && errno == EINTR);

  if (got < 0) {
    const int ERR = errno;
    if (ERR == EAGAIN || ERR == EWOULDBLOCK || ERR == ETIMEDOUT) {
      return failed(SnmpStatus::TIMEOUT, fmt::format("no reply from {}:{} within {} ms", host,
                                                     port, timeout.count()));
    }
    return failed(SnmpStatus::TRANSPORT_ERROR,
                  fmt::format("receive from {}: {}", host, errnoText(ERR)));
  }
  if (got == 0) {
    return failed(SnmpStatus::MALFORMED_RESPONSE, fmt::format("empty datagram from {}", host));
  }

  TransportResult res;
  res.received = static_cast<std::size_t>(got);
  return res;
}

} // namespace snmp

} // namespace proxwatch
