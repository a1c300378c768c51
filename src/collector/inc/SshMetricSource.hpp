#ifndef PROXWATCH_COLLECTOR_SSH_METRIC_SOURCE_HPP
#define PROXWATCH_COLLECTOR_SSH_METRIC_SOURCE_HPP
/**
 * @file SshMetricSource.hpp
 * @brief Interface to the SSH collaborator that reports memory usage.
 *
 * The SSH session itself lives outside this project. An implementation runs
 * MEMINFO_COMMAND on the device and hands its output to parseMemoryPercent().
 */

#include "src/config/inc/Device.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace proxwatch {

namespace collector {

/* ----------------------------- Constants ----------------------------- */

/// Remote command printing used memory as a whole percentage.
inline constexpr std::string_view MEMINFO_COMMAND =
    "awk '/MemTotal/ {total=$2} /MemAvailable/ {available=$2} "
    "END {printf \"%.0f\", 100 - (available / total * 100)}' /proc/meminfo";

/* ----------------------------- SshMetricSource ----------------------------- */

/**
 * @brief Memory usage provider reached over SSH.
 * @note Implementations are called from worker threads and must be thread-safe.
 */
class SshMetricSource {
public:
  virtual ~SshMetricSource() = default;

  /**
   * @brief Used memory of a device in percent.
   * @param device Target (host, sshPort, username, password).
   * @param timeout Bound the implementation must honor.
   * @param percent Receives the value on success.
   * @param error Receives a description on failure.
   * @return true on success.
   */
  [[nodiscard]] virtual bool getMemoryPercent(const config::Device& device,
                                              std::chrono::milliseconds timeout, double& percent,
                                              std::string& error) const = 0;
};

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Parse MEMINFO_COMMAND output.
 * @param output Raw command output (surrounding whitespace ignored).
 * @param percent Receives the value clamped to [0, 100].
 * @param error Receives a description on failure.
 * @return false when output is not a finite number.
 */
[[nodiscard]] bool parseMemoryPercent(std::string_view output, double& percent,
                                      std::string& error);

} // namespace collector

} // namespace proxwatch

#endif // PROXWATCH_COLLECTOR_SSH_METRIC_SOURCE_HPP
