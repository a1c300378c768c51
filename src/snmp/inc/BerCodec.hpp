#ifndef PROXWATCH_SNMP_BER_CODEC_HPP
#define PROXWATCH_SNMP_BER_CODEC_HPP
/**
 * @file BerCodec.hpp
 * @brief BER encoding of SNMPv2c GetRequest and decoding of GetResponse.
 * @note Thread-safe: All functions are stateless and safe to call concurrently.
 *
 * Covers only the BER subset SNMPv2c GET needs: SEQUENCE, INTEGER, OCTET STRING,
 * NULL, OBJECT IDENTIFIER and the application types Counter32, Gauge32,
 * TimeTicks and Counter64. Encoders append to a caller-owned byte vector;
 * decoders read from a span and report failure through their return value.
 *
 * Message layout (request; the response differs only in the PDU tag 0xA2):
 * @code
 *   SEQUENCE {
 *     INTEGER      version (1 = v2c)
 *     OCTET STRING community
 *     [0xA0] {
 *       INTEGER request-id, INTEGER error-status, INTEGER error-index,
 *       SEQUENCE { SEQUENCE { OBJECT IDENTIFIER name, NULL } }
 *     }
 *   }
 * @endcode
 */

#include "src/snmp/inc/SnmpResult.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace proxwatch {

namespace snmp {

namespace ber {

/* ----------------------------- Constants ----------------------------- */

inline constexpr std::uint8_t TAG_INTEGER = 0x02;
inline constexpr std::uint8_t TAG_OCTET_STRING = 0x04;
inline constexpr std::uint8_t TAG_NULL = 0x05;
inline constexpr std::uint8_t TAG_OID = 0x06;
inline constexpr std::uint8_t TAG_SEQUENCE = 0x30;
inline constexpr std::uint8_t TAG_IP_ADDRESS = 0x40;
inline constexpr std::uint8_t TAG_COUNTER32 = 0x41;
inline constexpr std::uint8_t TAG_GAUGE32 = 0x42;
inline constexpr std::uint8_t TAG_TIMETICKS = 0x43;
inline constexpr std::uint8_t TAG_OPAQUE = 0x44;
inline constexpr std::uint8_t TAG_COUNTER64 = 0x46;
inline constexpr std::uint8_t TAG_NO_SUCH_OBJECT = 0x80;
inline constexpr std::uint8_t TAG_NO_SUCH_INSTANCE = 0x81;
inline constexpr std::uint8_t TAG_END_OF_MIB_VIEW = 0x82;

inline constexpr std::uint8_t PDU_GET_REQUEST = 0xA0;
inline constexpr std::uint8_t PDU_GET_RESPONSE = 0xA2;

/// Version field value for SNMPv2c.
inline constexpr std::int64_t SNMP_VERSION_2C = 1;

/// Longest long-form length accepted by decodeLength (covers all lengths < 2^32).
inline constexpr std::size_t MAX_LENGTH_OCTETS = 4;

/// Byte buffer type used by all encoders.
using Bytes = std::vector<std::uint8_t>;

/// Read-only view used by all decoders.
using ByteView = std::span<const std::uint8_t>;

/* ----------------------------- OID ----------------------------- */

/**
 * @brief Parse dotted decimal OID text into arcs.
 * @param text OID text, e.g. "1.3.6.1.2.1.1.3.0".
 * @param arcs Receives the parsed arcs (cleared first).
 * @return false if no piece parsed as a 32-bit decimal.
 *
 * Pieces that do not parse are skipped, so ".1.3.6" and "1.3.6" are equal.
 */
[[nodiscard]] bool parseOid(std::string_view text, std::vector<std::uint32_t>& arcs);

/// @brief Dotted decimal text for arcs.
[[nodiscard]] std::string formatOid(std::span<const std::uint32_t> arcs);

/**
 * @brief Append the content octets of an OID (no tag or length).
 *
 * The first two arcs combine into 40*arc0 + arc1; every sub-identifier is
 * written base-128 with the continuation bit on all but its last byte.
 *
 * decodeOid() inverts this only for X.690 shaped OIDs: arc0 in {0, 1, 2},
 * arc1 < 40 unless arc0 is 2, and at least two arcs. Others encode without
 * error but decode differently ("5.5" comes back as "2.125", "1" as "1.0").
 */
void encodeOid(std::span<const std::uint32_t> arcs, Bytes& out);

/**
 * @brief Decode OID content octets.
 * @return false on empty or truncated content, or an arc above 2^32-1.
 */
[[nodiscard]] bool decodeOid(ByteView content, std::vector<std::uint32_t>& arcs);

/* ----------------------------- Length ----------------------------- */

/// @brief Append a definite length: short form below 128, long form otherwise.
void encodeLength(std::size_t len, Bytes& out);

/**
 * @brief Decode a definite length starting at offset.
 * @param data Buffer holding the length octets.
 * @param offset Position of the first length octet; advanced past them on success.
 * @param len Receives the decoded length.
 * @return false on truncation, indefinite form, or more than MAX_LENGTH_OCTETS.
 */
[[nodiscard]] bool decodeLength(ByteView data, std::size_t& offset, std::size_t& len) noexcept;

/* ----------------------------- Integer ----------------------------- */

/// @brief Append minimal two's-complement big-endian content octets.
void encodeInteger(std::int64_t value, Bytes& out);

/// @brief Decode signed content octets (1..8 bytes).
[[nodiscard]] bool decodeInteger(ByteView content, std::int64_t& value) noexcept;

/**
 * @brief Decode unsigned content octets (Counter32/Gauge32/TimeTicks/Counter64).
 *
 * Leading zero octets are ignored; at most 8 significant octets are accepted.
 */
[[nodiscard]] bool decodeUnsigned(ByteView content, std::uint64_t& value) noexcept;

/* ----------------------------- TLV ----------------------------- */

/// @brief Append tag, length and content.
void appendTlv(std::uint8_t tag, ByteView content, Bytes& out);

/**
 * @brief Read one TLV at offset without checking its tag.
 * @param data Buffer.
 * @param offset Advanced past the element on success.
 * @param tag Receives the tag byte.
 * @param content Receives a view of the content octets (points into data).
 * @return false if the element is truncated.
 */
[[nodiscard]] bool readTlv(ByteView data, std::size_t& offset, std::uint8_t& tag,
                           ByteView& content) noexcept;

/* ----------------------------- Messages ----------------------------- */

/**
 * @brief Encode a complete SNMPv2c GetRequest message for one OID.
 * @param requestId Request identifier placed in the PDU.
 * @param community Community string (sent verbatim).
 * @param oid Dotted OID text.
 * @param out Receives the message bytes (cleared first).
 * @return INVALID_OID if oid yields no arcs, OK otherwise.
 */
[[nodiscard]] SnmpStatus encodeGetRequest(std::int32_t requestId, std::string_view community,
                                          std::string_view oid, Bytes& out);

/**
 * @brief Fields of a GetResponse, before value interpretation.
 */
struct GetResponsePdu {
  std::int64_t version{0};          ///< Message version field
  std::string community{};          ///< Community echoed by the agent
  std::int64_t requestId{0};        ///< PDU request-id
  std::int64_t errorStatus{0};      ///< PDU error-status
  std::int64_t errorIndex{0};       ///< PDU error-index
  std::vector<std::uint32_t> oid{}; ///< Name of the first VarBind
  std::uint8_t valueTag{0};         ///< Tag of the first VarBind value
  Bytes value{};                    ///< Content octets of the first VarBind value
};

/**
 * @brief Walk a GetResponse message verifying every structural tag.
 * @param data Datagram bytes.
 * @param pdu Receives the parsed fields.
 * @param error Receives a description on failure.
 * @return MALFORMED_RESPONSE on any tag mismatch, truncation, wrong PDU type
 *         or empty VarBindList; OK otherwise.
 */
[[nodiscard]] SnmpStatus parseGetResponse(ByteView data, GetResponsePdu& pdu, std::string& error);

/**
 * @brief Decode a GetResponse datagram into a numeric value.
 * @param data Datagram bytes.
 * @param expectedRequestId Id sent in the request; a mismatch is logged, not fatal.
 * @return OK with value for numeric types; AGENT_ERROR, MALFORMED_RESPONSE or
 *         UNSUPPORTED_VALUE otherwise.
 */
[[nodiscard]] SnmpResult decodeGetResponse(ByteView data, std::int32_t expectedRequestId);

/// @brief Name of a value tag for diagnostics ("Counter32", "noSuchInstance", ...).
[[nodiscard]] const char* valueTagName(std::uint8_t tag) noexcept;

} // namespace ber

} // namespace snmp

} // namespace proxwatch

#endif // PROXWATCH_SNMP_BER_CODEC_HPP
