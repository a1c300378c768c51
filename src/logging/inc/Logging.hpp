#ifndef PROXWATCH_LOGGING_LOGGING_HPP
#define PROXWATCH_LOGGING_LOGGING_HPP
/**
 * @file Logging.hpp
 * @brief Process-wide spdlog setup for proxwatch.
 *
 * Installs a default logger with two sinks:
 *  - console (stderr, colored) at the configured level
 *  - append-only error log file at warn and above, so every metric/device
 *    failure lands on disk regardless of the aggregate cycle outcome
 *
 * Library code logs through the spdlog free functions (spdlog::warn, ...), which
 * route to whatever default logger is installed. Without initLogging() spdlog's
 * own stdout default is used.
 */

#include <string>

#include <spdlog/common.h>

namespace proxwatch {

namespace logging {

/* ----------------------------- LogConfig ----------------------------- */

/**
 * @brief Logger configuration.
 */
struct LogConfig {
  std::string name{"proxwatch"};                        ///< Logger name
  spdlog::level::level_enum consoleLevel{spdlog::level::info}; ///< Console threshold
  std::string errorLogDir{"logs"};                     ///< Directory of error.log; empty disables
  std::string errorLogFile{"error.log"};               ///< File name inside errorLogDir
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Install the default logger described by cfg.
 * @param cfg Logger configuration.
 * @param error Receives the reason when the error log cannot be opened.
 * @return false if the file sink failed; the console sink is installed either way.
 */
[[nodiscard]] bool initLogging(const LogConfig& cfg, std::string& error);

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn", "error", "off").
 * @return spdlog::level::info for unknown names.
 */
[[nodiscard]] spdlog::level::level_enum parseLevel(const std::string& name) noexcept;

/// @brief Flush and drop all registered loggers.
void shutdownLogging() noexcept;

} // namespace logging

} // namespace proxwatch

#endif // PROXWATCH_LOGGING_LOGGING_HPP
