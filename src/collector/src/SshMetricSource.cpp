/**
 * @file SshMetricSource.cpp
 * @brief Parsing of the remote memory command output.
 */

#include "src/collector/inc/SshMetricSource.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>

#include <fmt/core.h>

namespace proxwatch {

namespace collector {

bool parseMemoryPercent(std::string_view output, double& percent, std::string& error) {
  const std::string_view TEXT = helpers::strings::trim(output);

  double value = 0.0;
  const auto RES = std::from_chars(TEXT.data(), TEXT.data() + TEXT.size(), value);
  if (TEXT.empty() || RES.ec != std::errc{} || RES.ptr != TEXT.data() + TEXT.size() ||
      !std::isfinite(value)) {
    error = fmt::format("unexpected memory command output '{}'", TEXT);
    return false;
  }

  percent = std::clamp(value, 0.0, 100.0);
  return true;
}

} // namespace collector

} // namespace proxwatch
