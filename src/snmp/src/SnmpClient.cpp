/**
 * @file SnmpClient.cpp
 * @brief SnmpClient implementation: encode, exchange, decode.
 */

#include "src/snmp/inc/SnmpClient.hpp"
#include "src/snmp/inc/BerCodec.hpp"

#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace proxwatch {

namespace snmp {

SnmpClient::SnmpClient(SnmpClientConfig config) : config_(std::move(config)) {}

SnmpResult SnmpClient::get(const std::string& host, const std::string& oid) const {
  const std::int32_t REQUEST_ID = nextRequestId();

  ber::Bytes request;
  const SnmpStatus ENC = ber::encodeGetRequest(REQUEST_ID, config_.community, oid, request);
  if (ENC != SnmpStatus::OK) {
    return SnmpResult::failure(ENC, fmt::format("invalid OID '{}'", oid));
  }

  DatagramBuffer response{};
  const TransportResult XFER = exchange(host, config_.port, request, config_.timeout, response);

  if (XFER.status == SnmpStatus::TIMEOUT) {
    SnmpResult res = SnmpResult::failure(
        SnmpStatus::TIMEOUT,
        fmt::format("SNMP timeout: no response from {} for OID {} (timeout: {} ms, request_id: {})",
                    host, oid, config_.timeout.count(), REQUEST_ID));
    res.requestId = REQUEST_ID;
    return res;
  }
  if (!XFER.ok()) {
    SnmpResult res = SnmpResult::failure(XFER.status, XFER.message);
    res.requestId = REQUEST_ID;
    return res;
  }

  SnmpResult res =
      ber::decodeGetResponse(ber::ByteView(response.data(), XFER.received), REQUEST_ID);
  res.requestId = REQUEST_ID;
  if (!res.ok()) {
    spdlog::debug("SNMP GET {} {} failed: {}", host, oid, res.toString());
  }
  return res;
}

} // namespace snmp

} // namespace proxwatch
