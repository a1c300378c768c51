/**
 * @file BerCodec_uTest.cpp
 * @brief Unit tests for proxwatch::snmp::ber.
 *
 * Notes:
 *  - Responses are assembled with the codec's own TLV primitives so each test
 *    controls exactly one field of the message.
 */

#include "src/snmp/inc/BerCodec.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

using proxwatch::snmp::SnmpResult;
using proxwatch::snmp::SnmpStatus;
using proxwatch::snmp::ber::appendTlv;
using proxwatch::snmp::ber::Bytes;
using proxwatch::snmp::ber::ByteView;
using proxwatch::snmp::ber::decodeGetResponse;
using proxwatch::snmp::ber::decodeInteger;
using proxwatch::snmp::ber::decodeLength;
using proxwatch::snmp::ber::decodeOid;
using proxwatch::snmp::ber::decodeUnsigned;
using proxwatch::snmp::ber::encodeGetRequest;
using proxwatch::snmp::ber::encodeInteger;
using proxwatch::snmp::ber::encodeLength;
using proxwatch::snmp::ber::encodeOid;
using proxwatch::snmp::ber::formatOid;
using proxwatch::snmp::ber::GetResponsePdu;
using proxwatch::snmp::ber::parseGetResponse;
using proxwatch::snmp::ber::parseOid;
using proxwatch::snmp::ber::PDU_GET_REQUEST;
using proxwatch::snmp::ber::PDU_GET_RESPONSE;
using proxwatch::snmp::ber::TAG_COUNTER32;
using proxwatch::snmp::ber::TAG_COUNTER64;
using proxwatch::snmp::ber::TAG_GAUGE32;
using proxwatch::snmp::ber::TAG_INTEGER;
using proxwatch::snmp::ber::TAG_NO_SUCH_INSTANCE;
using proxwatch::snmp::ber::TAG_NULL;
using proxwatch::snmp::ber::TAG_OCTET_STRING;
using proxwatch::snmp::ber::TAG_OID;
using proxwatch::snmp::ber::TAG_SEQUENCE;

namespace {

constexpr std::string_view SYS_UPTIME = "1.3.6.1.2.1.1.3.0";

Bytes integerTlv(std::int64_t value) {
  Bytes content;
  encodeInteger(value, content);
  Bytes out;
  appendTlv(TAG_INTEGER, content, out);
  return out;
}

void append(Bytes& dst, const Bytes& src) { dst.insert(dst.end(), src.begin(), src.end()); }

/// Assemble a GetResponse-shaped message with one VarBind.
Bytes buildResponse(std::int64_t requestId, std::int64_t errorStatus, std::int64_t errorIndex,
                    std::uint8_t valueTag, const Bytes& valueContent,
                    std::uint8_t pduTag = PDU_GET_RESPONSE) {
  std::vector<std::uint32_t> arcs;
  EXPECT_TRUE(parseOid(SYS_UPTIME, arcs));
  Bytes oidContent;
  encodeOid(arcs, oidContent);

  Bytes varBind;
  appendTlv(TAG_OID, oidContent, varBind);
  appendTlv(valueTag, valueContent, varBind);

  Bytes varBindList;
  appendTlv(TAG_SEQUENCE, varBind, varBindList);

  Bytes pdu;
  append(pdu, integerTlv(requestId));
  append(pdu, integerTlv(errorStatus));
  append(pdu, integerTlv(errorIndex));
  appendTlv(TAG_SEQUENCE, varBindList, pdu);

  const std::string COMMUNITY = "public";
  Bytes message;
  append(message, integerTlv(1));
  appendTlv(TAG_OCTET_STRING,
            ByteView(reinterpret_cast<const std::uint8_t*>(COMMUNITY.data()), COMMUNITY.size()),
            message);
  appendTlv(pduTag, pdu, message);

  Bytes out;
  appendTlv(TAG_SEQUENCE, message, out);
  return out;
}

} // namespace

/* ----------------------------- OID Tests ----------------------------- */

/** @test Dotted text parses into arcs and formats back. */
TEST(BerOidTest, ParseAndFormat) {
  std::vector<std::uint32_t> arcs;
  ASSERT_TRUE(parseOid(SYS_UPTIME, arcs));

  EXPECT_EQ(arcs, (std::vector<std::uint32_t>{1, 3, 6, 1, 2, 1, 1, 3, 0}));
  EXPECT_EQ(formatOid(arcs), SYS_UPTIME);
}

/** @test Unparsable pieces are skipped; nothing parsable is an error. */
TEST(BerOidTest, ParseSkipsJunk) {
  std::vector<std::uint32_t> arcs;

  ASSERT_TRUE(parseOid(".1.3.x.6", arcs));
  EXPECT_EQ(arcs, (std::vector<std::uint32_t>{1, 3, 6}));

  EXPECT_FALSE(parseOid("", arcs));
  EXPECT_FALSE(parseOid("abc.def", arcs));
  EXPECT_FALSE(parseOid("99999999999", arcs));
}

/** @test Standard prefix packs into 0x2B and large arcs go base-128. */
TEST(BerOidTest, EncodeKnownBytes) {
  Bytes out;
  encodeOid(std::vector<std::uint32_t>{1, 3, 6, 1, 4, 1, 2021}, out);

  EXPECT_EQ(out, (Bytes{0x2B, 0x06, 0x01, 0x04, 0x01, 0x8F, 0x65}));
}

/** @test decode(encode(arcs)) == arcs for a range of shapes. */
TEST(BerOidTest, RoundTrip) {
  const std::vector<std::vector<std::uint32_t>> CASES = {
      {1, 3, 6, 1, 2, 1, 2, 2, 1, 10, 1},
      {0, 39},
      {1, 0},
      {2, 5, 127, 128, 16383, 16384},
      {1, 3, 6, 1, 4, 1, 4294967295U},
  };

  for (const auto& ARCS : CASES) {
    Bytes enc;
    encodeOid(ARCS, enc);

    std::vector<std::uint32_t> dec;
    ASSERT_TRUE(decodeOid(enc, dec)) << formatOid(ARCS);
    EXPECT_EQ(dec, ARCS) << formatOid(ARCS);
  }
}

/** @test First sub-identifier >= 80 decodes under arc 2. */
TEST(BerOidTest, DecodeArcTwo) {
  std::vector<std::uint32_t> arcs;
  ASSERT_TRUE(decodeOid(Bytes{0x88, 0x37}, arcs));

  EXPECT_EQ(arcs, (std::vector<std::uint32_t>{2, 999}));
}

/** @test OIDs outside the X.690 first-arc shape encode, then decode to a different OID. */
TEST(BerOidTest, FirstArcLimit) {
  Bytes enc;
  std::vector<std::uint32_t> dec;

  encodeOid(std::vector<std::uint32_t>{5, 5}, enc);
  EXPECT_EQ(enc, (Bytes{0x81, 0x4D}));
  ASSERT_TRUE(decodeOid(enc, dec));
  EXPECT_EQ(formatOid(dec), "2.125");

  enc.clear();
  encodeOid(std::vector<std::uint32_t>{1}, enc);
  EXPECT_EQ(enc, (Bytes{0x28}));
  ASSERT_TRUE(decodeOid(enc, dec));
  EXPECT_EQ(formatOid(dec), "1.0");

  // Largest two-arc prefixes that still round-trip
  for (const std::vector<std::uint32_t>& ARCS :
       {std::vector<std::uint32_t>{0, 39}, std::vector<std::uint32_t>{1, 39},
        std::vector<std::uint32_t>{2, 4000}}) {
    enc.clear();
    encodeOid(ARCS, enc);
    ASSERT_TRUE(decodeOid(enc, dec));
    EXPECT_EQ(dec, ARCS);
  }
}

/** @test Empty content and a dangling continuation byte fail. */
TEST(BerOidTest, DecodeRejectsTruncated) {
  std::vector<std::uint32_t> arcs;

  EXPECT_FALSE(decodeOid(Bytes{}, arcs));
  EXPECT_FALSE(decodeOid(Bytes{0x2B, 0x86}, arcs));
}

/* ----------------------------- Length Tests ----------------------------- */

/** @test Short and long forms encode as X.690 requires. */
TEST(BerLengthTest, EncodeForms) {
  auto enc = [](std::size_t len) {
    Bytes out;
    encodeLength(len, out);
    return out;
  };

  EXPECT_EQ(enc(0), (Bytes{0x00}));
  EXPECT_EQ(enc(127), (Bytes{0x7F}));
  EXPECT_EQ(enc(128), (Bytes{0x81, 0x80}));
  EXPECT_EQ(enc(255), (Bytes{0x81, 0xFF}));
  EXPECT_EQ(enc(256), (Bytes{0x82, 0x01, 0x00}));
  EXPECT_EQ(enc(70000), (Bytes{0x83, 0x01, 0x11, 0x70}));
}

/** @test decodeLength returns the value and advances by exactly the encoded size. */
TEST(BerLengthTest, DecodeAdvancesOffset) {
  for (const std::size_t LEN : {0UL, 1UL, 127UL, 128UL, 1500UL, 65535UL, 0xFFFFFFFFUL}) {
    Bytes buf{0xEE};
    encodeLength(LEN, buf);
    const std::size_t ENCODED = buf.size() - 1;
    buf.push_back(0xEE);

    std::size_t offset = 1;
    std::size_t len = 0;
    ASSERT_TRUE(decodeLength(buf, offset, len)) << LEN;
    EXPECT_EQ(len, LEN);
    EXPECT_EQ(offset, 1 + ENCODED);
  }
}

/** @test Truncated, indefinite and oversize length forms fail. */
TEST(BerLengthTest, DecodeRejectsBadForms) {
  std::size_t offset = 0;
  std::size_t len = 0;

  EXPECT_FALSE(decodeLength(Bytes{}, offset, len));

  offset = 0;
  EXPECT_FALSE(decodeLength(Bytes{0x82, 0x01}, offset, len));

  offset = 0;
  EXPECT_FALSE(decodeLength(Bytes{0x80}, offset, len));

  offset = 0;
  EXPECT_FALSE(decodeLength(Bytes{0x85, 0x01, 0x00, 0x00, 0x00, 0x00}, offset, len));
  EXPECT_EQ(offset, 0U);
}

/* ----------------------------- Integer Tests ----------------------------- */

/** @test Minimal two's-complement encodings. */
TEST(BerIntegerTest, EncodeMinimal) {
  auto enc = [](std::int64_t v) {
    Bytes out;
    encodeInteger(v, out);
    return out;
  };

  EXPECT_EQ(enc(0), (Bytes{0x00}));
  EXPECT_EQ(enc(127), (Bytes{0x7F}));
  EXPECT_EQ(enc(128), (Bytes{0x00, 0x80}));
  EXPECT_EQ(enc(-1), (Bytes{0xFF}));
  EXPECT_EQ(enc(-128), (Bytes{0x80}));
  EXPECT_EQ(enc(-129), (Bytes{0xFF, 0x7F}));
  EXPECT_EQ(enc(std::numeric_limits<std::int32_t>::min()), (Bytes{0x80, 0x00, 0x00, 0x00}));
  EXPECT_EQ(enc(std::numeric_limits<std::int32_t>::max()), (Bytes{0x7F, 0xFF, 0xFF, 0xFF}));
}

/** @test Signed decode inverts encode at the 32-bit and 64-bit edges. */
TEST(BerIntegerTest, RoundTripEdges) {
  for (const std::int64_t V :
       {std::int64_t{0}, std::int64_t{-1}, std::int64_t{std::numeric_limits<std::int32_t>::min()},
        std::int64_t{std::numeric_limits<std::int32_t>::max()},
        std::numeric_limits<std::int64_t>::min(), std::numeric_limits<std::int64_t>::max()}) {
    Bytes enc;
    encodeInteger(V, enc);

    std::int64_t dec = 0;
    ASSERT_TRUE(decodeInteger(enc, dec)) << V;
    EXPECT_EQ(dec, V);
  }
}

/** @test Empty and oversize INTEGER content fails. */
TEST(BerIntegerTest, DecodeRejectsBadSize) {
  std::int64_t v = 0;
  EXPECT_FALSE(decodeInteger(Bytes{}, v));
  EXPECT_FALSE(decodeInteger(Bytes(9, 0x01), v));
}

/** @test Unsigned decode ignores the sign pad and accepts the full Counter64 range. */
TEST(BerIntegerTest, DecodeUnsigned) {
  std::uint64_t v = 0;

  ASSERT_TRUE(decodeUnsigned(Bytes{0x00, 0xFF, 0xFF, 0xFF, 0xFF}, v));
  EXPECT_EQ(v, 4294967295ULL);

  ASSERT_TRUE(decodeUnsigned(Bytes{0x00, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF}, v));
  EXPECT_EQ(v, std::numeric_limits<std::uint64_t>::max());

  EXPECT_FALSE(decodeUnsigned(Bytes(9, 0x01), v));
}

/* ----------------------------- GetRequest Tests ----------------------------- */

/** @test sysUpTime request for community "public" matches the reference bytes. */
TEST(BerGetRequestTest, EncodeKnownMessage) {
  Bytes out;
  ASSERT_EQ(encodeGetRequest(1, "public", SYS_UPTIME, out), SnmpStatus::OK);

  const Bytes EXPECTED = {0x30, 0x26, 0x02, 0x01, 0x01, 0x04, 0x06, 0x70, 0x75, 0x62,
                          0x6C, 0x69, 0x63, 0xA0, 0x19, 0x02, 0x01, 0x01, 0x02, 0x01,
                          0x00, 0x02, 0x01, 0x00, 0x30, 0x0E, 0x30, 0x0C, 0x06, 0x08,
                          0x2B, 0x06, 0x01, 0x02, 0x01, 0x01, 0x03, 0x00, 0x05, 0x00};
  EXPECT_EQ(out, EXPECTED);
  EXPECT_EQ(out[0], TAG_SEQUENCE);
  EXPECT_EQ(out[13], PDU_GET_REQUEST);
}

/** @test Unparsable OID text is rejected before any bytes are produced. */
TEST(BerGetRequestTest, InvalidOid) {
  Bytes out{0x01};
  EXPECT_EQ(encodeGetRequest(1, "public", "not.an.oid", out), SnmpStatus::INVALID_OID);
  EXPECT_TRUE(out.empty());
}

/** @test A long community pushes the message into long-form length. */
TEST(BerGetRequestTest, LongCommunity) {
  Bytes out;
  ASSERT_EQ(encodeGetRequest(7, std::string(200, 'c'), SYS_UPTIME, out), SnmpStatus::OK);

  std::size_t offset = 1;
  std::size_t len = 0;
  ASSERT_TRUE(decodeLength(out, offset, len));
  EXPECT_EQ(out[1], 0x81);
  EXPECT_EQ(offset + len, out.size());
}

/* ----------------------------- GetResponse Tests ----------------------------- */

/** @test parseGetResponse extracts header fields and the first VarBind. */
TEST(BerGetResponseTest, ParseFields) {
  const Bytes MSG = buildResponse(42, 0, 0, TAG_COUNTER32, Bytes{0x01, 0x00});

  GetResponsePdu pdu;
  std::string error;
  ASSERT_EQ(parseGetResponse(MSG, pdu, error), SnmpStatus::OK) << error;

  EXPECT_EQ(pdu.version, 1);
  EXPECT_EQ(pdu.community, "public");
  EXPECT_EQ(pdu.requestId, 42);
  EXPECT_EQ(formatOid(pdu.oid), SYS_UPTIME);
  EXPECT_EQ(pdu.valueTag, TAG_COUNTER32);
  EXPECT_EQ(pdu.value, (Bytes{0x01, 0x00}));
}

/** @test Numeric value types decode to their numeric value. */
TEST(BerGetResponseTest, NumericValues) {
  SnmpResult res = decodeGetResponse(buildResponse(1, 0, 0, TAG_COUNTER32, Bytes{0x00, 0xFF}), 1);
  ASSERT_TRUE(res.ok()) << res.toString();
  EXPECT_DOUBLE_EQ(res.value, 255.0);

  res = decodeGetResponse(buildResponse(1, 0, 0, TAG_GAUGE32, Bytes{0x2A}), 1);
  ASSERT_TRUE(res.ok()) << res.toString();
  EXPECT_DOUBLE_EQ(res.value, 42.0);

  res = decodeGetResponse(buildResponse(1, 0, 0, TAG_INTEGER, Bytes{0xFF}), 1);
  ASSERT_TRUE(res.ok()) << res.toString();
  EXPECT_DOUBLE_EQ(res.value, -1.0);

  EXPECT_FALSE(res.isCounter);

  res = decodeGetResponse(
      buildResponse(1, 0, 0, TAG_COUNTER64, Bytes{0x01, 0x00, 0x00, 0x00, 0x00, 0x00}), 1);
  ASSERT_TRUE(res.ok()) << res.toString();
  EXPECT_DOUBLE_EQ(res.value, 1099511627776.0);

  res = decodeGetResponse(buildResponse(1, 0, 0, TAG_COUNTER64,
                                        Bytes{0x00, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFE}),
                          1);
  ASSERT_TRUE(res.ok()) << res.toString();
  EXPECT_TRUE(res.isCounter);
  EXPECT_EQ(res.counter, 18446744073709551614ULL);
}

/** @test noSuchInstance is reported as an unsupported value naming the type. */
TEST(BerGetResponseTest, NoSuchInstance) {
  const SnmpResult RES =
      decodeGetResponse(buildResponse(1, 0, 0, TAG_NO_SUCH_INSTANCE, Bytes{}), 1);

  EXPECT_EQ(RES.status, SnmpStatus::UNSUPPORTED_VALUE);
  EXPECT_NE(RES.message.find("noSuchInstance"), std::string::npos);
  EXPECT_NE(RES.message.find(SYS_UPTIME), std::string::npos);
}

/** @test OCTET STRING and NULL values are unsupported. */
TEST(BerGetResponseTest, NonNumericValues) {
  EXPECT_EQ(decodeGetResponse(buildResponse(1, 0, 0, TAG_OCTET_STRING, Bytes{'x'}), 1).status,
            SnmpStatus::UNSUPPORTED_VALUE);
  EXPECT_EQ(decodeGetResponse(buildResponse(1, 0, 0, TAG_NULL, Bytes{}), 1).status,
            SnmpStatus::UNSUPPORTED_VALUE);
}

/** @test Non-zero error-status maps to AGENT_ERROR with label and index. */
TEST(BerGetResponseTest, AgentError) {
  const SnmpResult RES = decodeGetResponse(buildResponse(1, 2, 1, TAG_NULL, Bytes{}), 1);

  EXPECT_EQ(RES.status, SnmpStatus::AGENT_ERROR);
  EXPECT_EQ(RES.errorStatus, 2);
  EXPECT_EQ(RES.errorIndex, 1);
  EXPECT_NE(RES.message.find("noSuchName"), std::string::npos);
}

/** @test A different request-id is tolerated. */
TEST(BerGetResponseTest, RequestIdMismatchTolerated) {
  const SnmpResult RES = decodeGetResponse(buildResponse(9, 0, 0, TAG_GAUGE32, Bytes{0x05}), 1);

  ASSERT_TRUE(RES.ok()) << RES.toString();
  EXPECT_DOUBLE_EQ(RES.value, 5.0);
}

/** @test A GetRequest PDU tag where a GetResponse is expected is malformed. */
TEST(BerGetResponseTest, WrongPduTag) {
  const SnmpResult RES =
      decodeGetResponse(buildResponse(1, 0, 0, TAG_GAUGE32, Bytes{0x05}, PDU_GET_REQUEST), 1);

  EXPECT_EQ(RES.status, SnmpStatus::MALFORMED_RESPONSE);
}

/** @test Truncated and garbage datagrams are malformed, never a crash. */
TEST(BerGetResponseTest, TruncatedAndGarbage) {
  Bytes msg = buildResponse(1, 0, 0, TAG_GAUGE32, Bytes{0x05});
  for (std::size_t cut = 0; cut < msg.size(); ++cut) {
    const SnmpResult RES = decodeGetResponse(ByteView(msg.data(), cut), 1);
    EXPECT_EQ(RES.status, SnmpStatus::MALFORMED_RESPONSE) << "cut at " << cut;
  }

  EXPECT_EQ(decodeGetResponse(Bytes{0xDE, 0xAD, 0xBE, 0xEF}, 1).status,
            SnmpStatus::MALFORMED_RESPONSE);
}

/** @test A response with no VarBind is malformed. */
TEST(BerGetResponseTest, EmptyVarBindList) {
  Bytes pdu = integerTlv(1);
  append(pdu, integerTlv(0));
  append(pdu, integerTlv(0));
  appendTlv(TAG_SEQUENCE, Bytes{}, pdu);

  Bytes message = integerTlv(1);
  appendTlv(TAG_OCTET_STRING, Bytes{'p'}, message);
  appendTlv(PDU_GET_RESPONSE, pdu, message);

  Bytes out;
  appendTlv(TAG_SEQUENCE, message, out);

  EXPECT_EQ(decodeGetResponse(out, 1).status, SnmpStatus::MALFORMED_RESPONSE);
}
