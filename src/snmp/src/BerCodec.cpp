/**
 * @file BerCodec.cpp
 * @brief Implementation of the SNMPv2c BER subset.
 */

#include "src/snmp/inc/BerCodec.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <charconv>
#include <limits>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace proxwatch {

namespace snmp {

namespace ber {

namespace {

/* ----------------------------- Constants ----------------------------- */

/// Base-128 groups needed for any 64-bit sub-identifier.
constexpr std::size_t MAX_SUBID_GROUPS = 10;

/// Groups accepted per decoded sub-identifier (keeps the accumulator within 63 bits).
constexpr std::size_t MAX_DECODE_GROUPS = 9;

constexpr std::uint8_t LONG_FORM_BIT = 0x80;
constexpr std::uint8_t CONTINUATION_BIT = 0x80;

/* ----------------------------- Encoding Helpers ----------------------------- */

/// Append a sub-identifier base-128, most significant group first.
void appendBase128(std::uint64_t value, Bytes& out) {
  std::uint8_t groups[MAX_SUBID_GROUPS];
  std::size_t n = 0;
  do {
    groups[n++] = static_cast<std::uint8_t>(value & 0x7F);
    value >>= 7;
  } while (value != 0);

  while (n > 1) {
    out.push_back(static_cast<std::uint8_t>(groups[--n] | CONTINUATION_BIT));
  }
  out.push_back(groups[0]);
}

void appendIntegerTlv(std::int64_t value, Bytes& out) {
  Bytes content;
  encodeInteger(value, content);
  appendTlv(TAG_INTEGER, content, out);
}

/* ----------------------------- Decoding Helpers ----------------------------- */

/// Read one TLV and require its tag.
bool expectTlv(ByteView data, std::size_t& offset, std::uint8_t expected, ByteView& content,
               const char* what, std::string& error) {
  std::uint8_t tag = 0;
  if (!readTlv(data, offset, tag, content)) {
    error = fmt::format("truncated {} at offset {}", what, offset);
    return false;
  }
  if (tag != expected) {
    error = fmt::format("expected {} tag 0x{:02X}, found 0x{:02X}", what, expected, tag);
    return false;
  }
  return true;
}

bool expectInteger(ByteView data, std::size_t& offset, std::int64_t& value, const char* what,
                   std::string& error) {
  ByteView content;
  if (!expectTlv(data, offset, TAG_INTEGER, content, what, error)) {
    return false;
  }
  if (!decodeInteger(content, value)) {
    error = fmt::format("invalid {} INTEGER of {} bytes", what, content.size());
    return false;
  }
  return true;
}

} // namespace

/* ----------------------------- OID ----------------------------- */

bool parseOid(std::string_view text, std::vector<std::uint32_t>& arcs) {
  arcs.clear();
  for (const std::string_view PIECE : helpers::strings::split(text, '.')) {
    std::uint32_t arc = 0;
    const auto RES = std::from_chars(PIECE.data(), PIECE.data() + PIECE.size(), arc);
    if (PIECE.empty() || RES.ec != std::errc{} || RES.ptr != PIECE.data() + PIECE.size()) {
      continue;
    }
    arcs.push_back(arc);
  }
  return !arcs.empty();
}

std::string formatOid(std::span<const std::uint32_t> arcs) {
  std::string out;
  for (std::size_t i = 0; i < arcs.size(); ++i) {
    if (i != 0) {
      out.push_back('.');
    }
    out += std::to_string(arcs[i]);
  }
  return out;
}

void encodeOid(std::span<const std::uint32_t> arcs, Bytes& out) {
  if (arcs.empty()) {
    return;
  }

  const std::uint64_t FIRST = static_cast<std::uint64_t>(arcs[0]) * 40U +
                              (arcs.size() > 1 ? static_cast<std::uint64_t>(arcs[1]) : 0U);
  appendBase128(FIRST, out);

  for (std::size_t i = 2; i < arcs.size(); ++i) {
    appendBase128(arcs[i], out);
  }
}

bool decodeOid(ByteView content, std::vector<std::uint32_t>& arcs) {
  arcs.clear();
  if (content.empty()) {
    return false;
  }

  std::uint64_t subid = 0;
  std::size_t groups = 0;
  bool first = true;

  for (const std::uint8_t B : content) {
    subid = (subid << 7) | (B & 0x7F);
    if (++groups > MAX_DECODE_GROUPS) {
      return false;
    }
    if ((B & CONTINUATION_BIT) != 0) {
      continue;
    }

    if (first) {
      // X.690: first sub-identifier packs arc0 in {0,1,2}
      const std::uint64_t ARC0 = subid < 40 ? 0 : (subid < 80 ? 1 : 2);
      const std::uint64_t ARC1 = subid - ARC0 * 40;
      if (ARC1 > std::numeric_limits<std::uint32_t>::max()) {
        return false;
      }
      arcs.push_back(static_cast<std::uint32_t>(ARC0));
      arcs.push_back(static_cast<std::uint32_t>(ARC1));
      first = false;
    } else {
      if (subid > std::numeric_limits<std::uint32_t>::max()) {
        return false;
      }
      arcs.push_back(static_cast<std::uint32_t>(subid));
    }

    subid = 0;
    groups = 0;
  }

  // Last octet still had the continuation bit set
  return groups == 0;
}

/* ----------------------------- Length ----------------------------- */

void encodeLength(std::size_t len, Bytes& out) {
  if (len < 0x80) {
    out.push_back(static_cast<std::uint8_t>(len));
    return;
  }

  std::uint8_t octets[sizeof(std::size_t)];
  std::size_t n = 0;
  while (len != 0) {
    octets[n++] = static_cast<std::uint8_t>(len & 0xFF);
    len >>= 8;
  }

  out.push_back(static_cast<std::uint8_t>(LONG_FORM_BIT | n));
  while (n > 0) {
    out.push_back(octets[--n]);
  }
}

bool decodeLength(ByteView data, std::size_t& offset, std::size_t& len) noexcept {
  if (offset >= data.size()) {
    return false;
  }

  const std::uint8_t FIRST = data[offset];
  if ((FIRST & LONG_FORM_BIT) == 0) {
    len = FIRST;
    offset += 1;
    return true;
  }

  const std::size_t N = FIRST & 0x7F;
  if (N == 0 || N > MAX_LENGTH_OCTETS || offset + 1 + N > data.size()) {
    return false;
  }

  std::size_t value = 0;
  for (std::size_t i = 0; i < N; ++i) {
    value = (value << 8) | data[offset + 1 + i];
  }

  len = value;
  offset += 1 + N;
  return true;
}

/* ----------------------------- Integer ----------------------------- */

void encodeInteger(std::int64_t value, Bytes& out) {
  std::uint8_t octets[sizeof(std::int64_t)];
  const auto RAW = static_cast<std::uint64_t>(value);
  for (std::size_t i = 0; i < sizeof(octets); ++i) {
    octets[i] = static_cast<std::uint8_t>(RAW >> (8 * (sizeof(octets) - 1 - i)));
  }

  // Drop leading 0x00/0xFF octets that only repeat the sign bit of the next one
  std::size_t start = 0;
  while (start + 1 < sizeof(octets)) {
    const std::uint8_t CUR = octets[start];
    const bool NEXT_NEG = (octets[start + 1] & 0x80) != 0;
    if ((CUR == 0x00 && !NEXT_NEG) || (CUR == 0xFF && NEXT_NEG)) {
      ++start;
    } else {
      break;
    }
  }

  out.insert(out.end(), octets + start, octets + sizeof(octets));
}

bool decodeInteger(ByteView content, std::int64_t& value) noexcept {
  if (content.empty() || content.size() > sizeof(std::int64_t)) {
    return false;
  }

  std::uint64_t acc = (content[0] & 0x80) != 0 ? ~0ULL : 0ULL;
  for (const std::uint8_t B : content) {
    acc = (acc << 8) | B;
  }

  value = static_cast<std::int64_t>(acc);
  return true;
}

bool decodeUnsigned(ByteView content, std::uint64_t& value) noexcept {
  if (content.empty()) {
    return false;
  }

  std::size_t start = 0;
  while (start + 1 < content.size() && content[start] == 0x00) {
    ++start;
  }
  if (content.size() - start > sizeof(std::uint64_t)) {
    return false;
  }

  std::uint64_t acc = 0;
  for (std::size_t i = start; i < content.size(); ++i) {
    acc = (acc << 8) | content[i];
  }

  value = acc;
  return true;
}

/* ----------------------------- TLV ----------------------------- */

void appendTlv(std::uint8_t tag, ByteView content, Bytes& out) {
  out.push_back(tag);
  encodeLength(content.size(), out);
  out.insert(out.end(), content.begin(), content.end());
}

bool readTlv(ByteView data, std::size_t& offset, std::uint8_t& tag, ByteView& content) noexcept {
  if (offset >= data.size()) {
    return false;
  }

  std::size_t pos = offset + 1;
  std::size_t len = 0;
  if (!decodeLength(data, pos, len)) {
    return false;
  }
  if (len > data.size() - pos) {
    return false;
  }

  tag = data[offset];
  content = data.subspan(pos, len);
  offset = pos + len;
  return true;
}

/* ----------------------------- Messages ----------------------------- */

SnmpStatus encodeGetRequest(std::int32_t requestId, std::string_view community,
                            std::string_view oid, Bytes& out) {
  out.clear();

  std::vector<std::uint32_t> arcs;
  if (!parseOid(oid, arcs)) {
    return SnmpStatus::INVALID_OID;
  }

  // Built bottom-up: VarBind -> VarBindList -> PDU -> Message
  Bytes oidContent;
  encodeOid(arcs, oidContent);

  Bytes varBind;
  appendTlv(TAG_OID, oidContent, varBind);
  appendTlv(TAG_NULL, {}, varBind);

  Bytes varBindList;
  appendTlv(TAG_SEQUENCE, varBind, varBindList);

  Bytes pdu;
  appendIntegerTlv(requestId, pdu);
  appendIntegerTlv(0, pdu);
  appendIntegerTlv(0, pdu);
  appendTlv(TAG_SEQUENCE, varBindList, pdu);

  Bytes message;
  appendIntegerTlv(SNMP_VERSION_2C, message);
  appendTlv(TAG_OCTET_STRING,
            ByteView(reinterpret_cast<const std::uint8_t*>(community.data()), community.size()),
            message);
  appendTlv(PDU_GET_REQUEST, pdu, message);

  appendTlv(TAG_SEQUENCE, message, out);
  return SnmpStatus::OK;
}

SnmpStatus parseGetResponse(ByteView data, GetResponsePdu& pdu, std::string& error) {
  std::size_t offset = 0;

  ByteView message;
  if (!expectTlv(data, offset, TAG_SEQUENCE, message, "message SEQUENCE", error)) {
    return SnmpStatus::MALFORMED_RESPONSE;
  }

  std::size_t mOff = 0;
  if (!expectInteger(message, mOff, pdu.version, "version", error)) {
    return SnmpStatus::MALFORMED_RESPONSE;
  }

  ByteView community;
  if (!expectTlv(message, mOff, TAG_OCTET_STRING, community, "community", error)) {
    return SnmpStatus::MALFORMED_RESPONSE;
  }
  pdu.community.assign(community.begin(), community.end());

  ByteView body;
  if (!expectTlv(message, mOff, PDU_GET_RESPONSE, body, "GetResponse PDU", error)) {
    return SnmpStatus::MALFORMED_RESPONSE;
  }

  std::size_t pOff = 0;
  if (!expectInteger(body, pOff, pdu.requestId, "request-id", error) ||
      !expectInteger(body, pOff, pdu.errorStatus, "error-status", error) ||
      !expectInteger(body, pOff, pdu.errorIndex, "error-index", error)) {
    return SnmpStatus::MALFORMED_RESPONSE;
  }

  ByteView varBindList;
  if (!expectTlv(body, pOff, TAG_SEQUENCE, varBindList, "VarBindList", error)) {
    return SnmpStatus::MALFORMED_RESPONSE;
  }
  if (varBindList.empty()) {
    error = "empty VarBindList";
    return SnmpStatus::MALFORMED_RESPONSE;
  }

  std::size_t lOff = 0;
  ByteView varBind;
  if (!expectTlv(varBindList, lOff, TAG_SEQUENCE, varBind, "VarBind", error)) {
    return SnmpStatus::MALFORMED_RESPONSE;
  }

  std::size_t vOff = 0;
  ByteView name;
  if (!expectTlv(varBind, vOff, TAG_OID, name, "VarBind name", error)) {
    return SnmpStatus::MALFORMED_RESPONSE;
  }
  if (!decodeOid(name, pdu.oid)) {
    error = "invalid VarBind OID encoding";
    return SnmpStatus::MALFORMED_RESPONSE;
  }

  ByteView value;
  if (!readTlv(varBind, vOff, pdu.valueTag, value)) {
    error = "truncated VarBind value";
    return SnmpStatus::MALFORMED_RESPONSE;
  }
  pdu.value.assign(value.begin(), value.end());

  return SnmpStatus::OK;
}

SnmpResult decodeGetResponse(ByteView data, std::int32_t expectedRequestId) {
  GetResponsePdu pdu;
  std::string error;
  if (parseGetResponse(data, pdu, error) != SnmpStatus::OK) {
    return SnmpResult::failure(SnmpStatus::MALFORMED_RESPONSE, error);
  }

  if (pdu.requestId != expectedRequestId) {
    spdlog::warn("SNMP request-id mismatch: sent {}, received {} (OID {})", expectedRequestId,
                 pdu.requestId, formatOid(pdu.oid));
  }

  if (pdu.errorStatus != 0) {
    SnmpResult res = SnmpResult::failure(
        SnmpStatus::AGENT_ERROR,
        fmt::format("SNMP error: {} (error-status: {}, error-index: {})",
                    errorStatusLabel(pdu.errorStatus), pdu.errorStatus, pdu.errorIndex));
    res.errorStatus = pdu.errorStatus;
    res.errorIndex = pdu.errorIndex;
    return res;
  }

  switch (pdu.valueTag) {
  case TAG_INTEGER: {
    std::int64_t v = 0;
    if (!decodeInteger(pdu.value, v)) {
      return SnmpResult::failure(SnmpStatus::MALFORMED_RESPONSE, "invalid INTEGER value");
    }
    return SnmpResult::success(static_cast<double>(v));
  }
  case TAG_COUNTER32:
  case TAG_GAUGE32:
  case TAG_TIMETICKS:
  case TAG_COUNTER64: {
    std::uint64_t v = 0;
    if (!decodeUnsigned(pdu.value, v)) {
      return SnmpResult::failure(SnmpStatus::MALFORMED_RESPONSE,
                                 fmt::format("invalid {} value", valueTagName(pdu.valueTag)));
    }
    return SnmpResult::successCounter(v);
  }
  default:
    return SnmpResult::failure(
        SnmpStatus::UNSUPPORTED_VALUE,
        fmt::format("{} value not supported for OID {}", valueTagName(pdu.valueTag),
                    formatOid(pdu.oid)));
  }
}

const char* valueTagName(std::uint8_t tag) noexcept {
  switch (tag) {
  case TAG_INTEGER:
    return "INTEGER";
  case TAG_OCTET_STRING:
    return "OCTET STRING";
  case TAG_NULL:
    return "NULL";
  case TAG_OID:
    return "OBJECT IDENTIFIER";
  case TAG_IP_ADDRESS:
    return "IpAddress";
  case TAG_COUNTER32:
    return "Counter32";
  case TAG_GAUGE32:
    return "Gauge32";
  case TAG_TIMETICKS:
    return "TimeTicks";
  case TAG_OPAQUE:
    return "Opaque";
  case TAG_COUNTER64:
    return "Counter64";
  case TAG_NO_SUCH_OBJECT:
    return "noSuchObject";
  case TAG_NO_SUCH_INSTANCE:
    return "noSuchInstance";
  case TAG_END_OF_MIB_VIEW:
    return "endOfMibView";
  default:
    return "unknown type";
  }
}

} // namespace ber

} // namespace snmp

} // namespace proxwatch
