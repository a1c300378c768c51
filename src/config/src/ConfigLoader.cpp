/**
 * @file ConfigLoader.cpp
 * @brief nlohmann_json based configuration loaders.
 */

#include "src/config/inc/ConfigLoader.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <cstdint>
#include <limits>
#include <set>
#include <utility>

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace proxwatch {

namespace config {

namespace {

using nlohmann::json;

/* ----------------------------- Field Helpers ----------------------------- */

/// Optional positive millisecond field.
bool readTimeout(const json& j, const char* key, std::chrono::milliseconds& out,
                 std::string& error) {
  if (!j.contains(key)) {
    return true;
  }
  const json& v = j.at(key);
  if (!v.is_number_integer() || v.get<std::int64_t>() <= 0) {
    error = fmt::format("'{}' must be a positive integer", key);
    return false;
  }
  out = std::chrono::milliseconds(v.get<std::int64_t>());
  return true;
}

/// Optional port field in 1..65535.
bool readPort(const json& j, const char* key, std::uint16_t& out, std::string& error) {
  if (!j.contains(key)) {
    return true;
  }
  const json& v = j.at(key);
  if (!v.is_number_integer() || v.get<std::int64_t>() < 1 || v.get<std::int64_t>() > 65535) {
    error = fmt::format("'{}' must be an integer in 1..65535", key);
    return false;
  }
  out = static_cast<std::uint16_t>(v.get<std::int64_t>());
  return true;
}

/// Interface entry as ["in", "out"] or {"in": ..., "out": ...}.
bool readInterface(const std::string& name, const json& v, InterfaceOids& out,
                   std::string& error) {
  if (v.is_array()) {
    if (v.size() != 2 || !v[0].is_string() || !v[1].is_string()) {
      error = fmt::format("interface '{}': expected [\"<in oid>\", \"<out oid>\"]", name);
      return false;
    }
    out.inOid = std::string(helpers::strings::trim(v[0].get<std::string>()));
    out.outOid = std::string(helpers::strings::trim(v[1].get<std::string>()));
    return true;
  }
  if (v.is_object()) {
    out.inOid = std::string(helpers::strings::trim(v.value("in", std::string{})));
    out.outOid = std::string(helpers::strings::trim(v.value("out", std::string{})));
    return true;
  }
  error = fmt::format("interface '{}': expected an array or object", name);
  return false;
}

} // namespace

/* ----------------------------- Collector Config ----------------------------- */

bool parseCollectorConfig(std::string_view text, CollectorConfig& out, std::string& error) {
  out = CollectorConfig{};

  try {
    const json ROOT = json::parse(text);
    if (!ROOT.is_object()) {
      error = "collector configuration must be a JSON object";
      return false;
    }

    out.community = ROOT.value("community", std::string(DEFAULT_COMMUNITY));

    std::chrono::milliseconds snmpTimeout = DEFAULT_SNMP_TIMEOUT;
    if (!readTimeout(ROOT, "snmp_timeout_ms", snmpTimeout, error)) {
      return false;
    }
    out.setSnmpTimeout(snmpTimeout);
    if (!readTimeout(ROOT, "task_timeout_ms", out.taskTimeout, error) ||
        !readTimeout(ROOT, "device_timeout_ms", out.deviceTimeout, error) ||
        !readPort(ROOT, "snmp_port", out.snmpPort, error)) {
      return false;
    }
    if (!out.checkTimeouts(error)) {
      return false;
    }

    if (ROOT.contains("oids")) {
      const json& OIDS = ROOT.at("oids");
      if (!OIDS.is_object()) {
        error = "'oids' must be an object";
        return false;
      }
      for (const auto& [name, value] : OIDS.items()) {
        if (!value.is_string()) {
          spdlog::warn("metric '{}' ignored: OID must be a string", name);
          continue;
        }
        if (!out.addMetric(name, value.get<std::string>())) {
          spdlog::debug("metric '{}' not configured (blank OID)", name);
        }
      }
    }

    if (ROOT.contains("interface_oids")) {
      const json& IFACES = ROOT.at("interface_oids");
      if (!IFACES.is_object()) {
        error = "'interface_oids' must be an object";
        return false;
      }
      for (const auto& [name, value] : IFACES.items()) {
        InterfaceOids oids;
        if (!readInterface(name, value, oids, error)) {
          return false;
        }
        if (oids.empty()) {
          spdlog::debug("interface '{}' not configured (no OIDs)", name);
          continue;
        }
        out.interfaces[name] = std::move(oids);
      }
    }
  } catch (const json::exception& ex) {
    error = fmt::format("invalid collector configuration: {}", ex.what());
    return false;
  }

  return true;
}

bool loadCollectorConfig(const std::string& path, CollectorConfig& out, std::string& error) {
  std::string text;
  if (!helpers::files::readTextFile(path, text, error)) {
    return false;
  }
  if (!parseCollectorConfig(text, out, error)) {
    error = fmt::format("{}: {}", path, error);
    return false;
  }
  return true;
}

/* ----------------------------- Device Inventory ----------------------------- */

bool parseDeviceList(std::string_view text, std::vector<Device>& out, std::string& error) {
  out.clear();

  try {
    const json ROOT = json::parse(text);
    if (!ROOT.is_object() || !ROOT.contains("proxies") || !ROOT.at("proxies").is_array()) {
      error = "device inventory must be an object with a 'proxies' array";
      return false;
    }

    std::set<std::uint32_t> ids;
    std::size_t index = 0;
    for (const json& entry : ROOT.at("proxies")) {
      const std::string WHERE = fmt::format("proxies[{}]", index++);
      if (!entry.is_object()) {
        error = fmt::format("{}: expected an object", WHERE);
        return false;
      }

      Device d;
      if (!entry.contains("id") || !entry.at("id").is_number_unsigned() ||
          entry.at("id").get<std::uint64_t>() > std::numeric_limits<std::uint32_t>::max()) {
        error = fmt::format("{}: 'id' must be an unsigned 32-bit integer", WHERE);
        return false;
      }
      d.id = entry.at("id").get<std::uint32_t>();

      d.host = std::string(helpers::strings::trim(entry.value("host", std::string{})));
      if (d.host.empty()) {
        error = fmt::format("{}: 'host' is required", WHERE);
        return false;
      }

      if (!readPort(entry, "port", d.sshPort, error)) {
        error = fmt::format("{}: {}", WHERE, error);
        return false;
      }
      d.username = entry.value("username", std::string{});
      d.password = entry.value("password", std::string{});
      d.group = entry.value("group", std::string{});
      d.alias = entry.value("alias", std::string{});
      d.community = entry.value("community", entry.value("snmp_community", std::string{}));

      if (!ids.insert(d.id).second) {
        error = fmt::format("{}: duplicate device id {}", WHERE, d.id);
        return false;
      }
      out.push_back(std::move(d));
    }
  } catch (const json::exception& ex) {
    error = fmt::format("invalid device inventory: {}", ex.what());
    out.clear();
    return false;
  }

  return true;
}

bool loadDeviceList(const std::string& path, std::vector<Device>& out, std::string& error) {
  std::string text;
  if (!helpers::files::readTextFile(path, text, error)) {
    return false;
  }
  if (!parseDeviceList(text, out, error)) {
    error = fmt::format("{}: {}", path, error);
    return false;
  }
  return true;
}

} // namespace config

} // namespace proxwatch
