/**
 * @file SnmpResult.cpp
 * @brief Status strings and SnmpResult helpers.
 */

#include "src/snmp/inc/SnmpResult.hpp"

#include <utility>

#include <fmt/core.h>

namespace proxwatch {

namespace snmp {

/* ----------------------------- Status Helpers ----------------------------- */

const char* toString(SnmpStatus status) noexcept {
  switch (status) {
  case SnmpStatus::OK:
    return "OK";
  case SnmpStatus::INVALID_OID:
    return "INVALID_OID";
  case SnmpStatus::TIMEOUT:
    return "TIMEOUT";
  case SnmpStatus::AGENT_ERROR:
    return "AGENT_ERROR";
  case SnmpStatus::MALFORMED_RESPONSE:
    return "MALFORMED_RESPONSE";
  case SnmpStatus::UNSUPPORTED_VALUE:
    return "UNSUPPORTED_VALUE";
  case SnmpStatus::TRANSPORT_ERROR:
    return "TRANSPORT_ERROR";
  case SnmpStatus::PARTIAL_SEND:
    return "PARTIAL_SEND";
  case SnmpStatus::RESOLVE_FAILED:
    return "RESOLVE_FAILED";
  case SnmpStatus::TASK_FAILURE:
    return "TASK_FAILURE";
  }
  return "UNKNOWN";
}

bool isRetryable(SnmpStatus status) noexcept {
  switch (status) {
  case SnmpStatus::TIMEOUT:
  case SnmpStatus::MALFORMED_RESPONSE:
  case SnmpStatus::TRANSPORT_ERROR:
  case SnmpStatus::TASK_FAILURE:
    return true;
  default:
    return false;
  }
}

const char* errorStatusLabel(std::int64_t errorStatus) noexcept {
  switch (errorStatus) {
  case 1:
    return "tooBig";
  case 2:
    return "noSuchName";
  case 3:
    return "badValue";
  case 4:
    return "readOnly";
  case 5:
    return "genErr";
  default:
    return "unknown";
  }
}

/* ----------------------------- SnmpResult Methods ----------------------------- */

SnmpResult SnmpResult::failure(SnmpStatus status, std::string message) {
  SnmpResult res;
  res.status = status;
  res.message = std::move(message);
  return res;
}

SnmpResult SnmpResult::success(double value) noexcept {
  SnmpResult res;
  res.value = value;
  return res;
}

SnmpResult SnmpResult::successCounter(std::uint64_t counter) noexcept {
  SnmpResult res;
  res.value = static_cast<double>(counter);
  res.isCounter = true;
  res.counter = counter;
  return res;
}

std::string SnmpResult::toString() const {
  if (ok()) {
    return isCounter ? fmt::format("OK: {}", counter) : fmt::format("OK: {}", value);
  }
  return fmt::format("{}: {}", snmp::toString(status), message);
}

} // namespace snmp

} // namespace proxwatch
