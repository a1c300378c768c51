/**
 * @file ResourceRecord.cpp
 * @brief ResourceRecord accessors and formatting.
 */

#include "src/collector/inc/ResourceRecord.hpp"
#include "src/helpers/inc/Format.hpp"

#include <utility>

#include <fmt/core.h>

namespace proxwatch {

namespace collector {

/* ----------------------------- ResourceRecord Methods ----------------------------- */

std::optional<double> ResourceRecord::metric(std::string_view name) const noexcept {
  for (const MetricValue& m : metrics) {
    if (m.name == name) {
      return m.value;
    }
  }
  return std::nullopt;
}

const InterfaceTraffic* ResourceRecord::findInterface(std::string_view name) const noexcept {
  for (const InterfaceTraffic& t : interfaces) {
    if (t.name == name) {
      return &t;
    }
  }
  return nullptr;
}

std::string ResourceRecord::toString() const {
  std::string out = fmt::format("[{}] {}", deviceId, displayName());

  if (failed) {
    out += fmt::format(" FAILED: {}", errorMessage);
    return out;
  }

  for (const MetricValue& m : metrics) {
    out += fmt::format(" {}={:.2f}", m.name, m.value);
  }
  for (const InterfaceTraffic& t : interfaces) {
    out += fmt::format(" {}=in:{}/out:{}", t.name, helpers::format::bitRate(t.inBps),
                       helpers::format::bitRate(t.outBps));
  }
  if (metrics.size() < configuredMetrics) {
    out += fmt::format(" ({}/{} metrics)", metrics.size(), configuredMetrics);
  }
  return out;
}

/* ----------------------------- Classification ----------------------------- */

ResourceRecord failedRecord(const config::Device& device, std::size_t configured,
                            std::string message) {
  ResourceRecord rec;
  rec.deviceId = device.id;
  rec.host = device.host;
  rec.alias = device.alias;
  rec.collectedAt = std::chrono::system_clock::now();
  rec.configuredMetrics = configured;
  rec.failed = true;
  rec.errorMessage = std::move(message);
  return rec;
}

} // namespace collector

} // namespace proxwatch
