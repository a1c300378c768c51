/**
 * @file CollectorConfig.cpp
 * @brief Metric source classification and collector configuration helpers.
 */

#include "src/config/inc/CollectorConfig.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <algorithm>
#include <utility>

#include <fmt/core.h>

namespace proxwatch {

namespace config {

namespace {

constexpr std::string_view SSH_SENTINEL = "ssh";

/// Index in KNOWN_METRICS, or KNOWN_METRICS.size() for other names.
std::size_t knownRank(std::string_view name) noexcept {
  const auto IT = std::find(KNOWN_METRICS.begin(), KNOWN_METRICS.end(), name);
  return static_cast<std::size_t>(IT - KNOWN_METRICS.begin());
}

} // namespace

/* ----------------------------- MetricSource ----------------------------- */

bool parseMetricSource(std::string_view text, MetricSource& out) {
  const std::string_view TRIMMED = helpers::strings::trim(text);
  if (TRIMMED.empty()) {
    return false;
  }
  if (helpers::strings::iequals(TRIMMED, SSH_SENTINEL)) {
    out = SshMemory{};
  } else {
    out = SnmpOid{std::string(TRIMMED)};
  }
  return true;
}

std::string describe(const MetricSource& source) {
  if (const auto* OID = std::get_if<SnmpOid>(&source)) {
    return OID->oid;
  }
  return std::string(SSH_SENTINEL);
}

bool metricOrderLess(std::string_view a, std::string_view b) noexcept {
  const std::size_t RA = knownRank(a);
  const std::size_t RB = knownRank(b);
  if (RA != RB) {
    return RA < RB;
  }
  return a < b;
}

/* ----------------------------- CollectorConfig Methods ----------------------------- */

void CollectorConfig::setSnmpTimeout(std::chrono::milliseconds timeout) noexcept {
  snmpTimeout = timeout;
  taskTimeout = timeout + TASK_TIMEOUT_MARGIN;
  deviceTimeout = taskTimeout + DEVICE_TIMEOUT_MARGIN;
}

bool CollectorConfig::checkTimeouts(std::string& error) const {
  if (snmpTimeout.count() <= 0) {
    error = fmt::format("snmp timeout must be positive (got {} ms)", snmpTimeout.count());
    return false;
  }
  if (taskTimeout <= snmpTimeout) {
    error = fmt::format("task timeout ({} ms) must exceed snmp timeout ({} ms)",
                        taskTimeout.count(), snmpTimeout.count());
    return false;
  }
  if (deviceTimeout < taskTimeout) {
    error = fmt::format("device timeout ({} ms) must not be below task timeout ({} ms)",
                        deviceTimeout.count(), taskTimeout.count());
    return false;
  }
  return true;
}

bool CollectorConfig::addMetric(const std::string& name, std::string_view text) {
  MetricSource source;
  if (!parseMetricSource(text, source)) {
    return false;
  }

  const auto EXISTING = std::find_if(metrics.begin(), metrics.end(),
                                     [&name](const MetricSpec& m) { return m.name == name; });
  if (EXISTING != metrics.end()) {
    EXISTING->source = std::move(source);
    return true;
  }

  const auto POS = std::find_if(metrics.begin(), metrics.end(), [&name](const MetricSpec& m) {
    return metricOrderLess(name, m.name);
  });
  metrics.insert(POS, MetricSpec{name, std::move(source)});
  return true;
}

std::vector<std::string> CollectorConfig::metricNames() const {
  std::vector<std::string> names;
  names.reserve(metrics.size());
  for (const MetricSpec& m : metrics) {
    names.push_back(m.name);
  }
  return names;
}

std::vector<std::string> CollectorConfig::interfaceNames() const {
  std::vector<std::string> names;
  names.reserve(interfaces.size());
  for (const auto& KV : interfaces) {
    names.push_back(KV.first);
  }
  return names;
}

} // namespace config

} // namespace proxwatch
