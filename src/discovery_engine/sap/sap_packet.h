/**
 * @file sap_packet.h
 * @brief SAP (RFC 2974) datagram codec.
 * @details
 *  byte 0:    V V V A R T E C   (V=version=1, A=address type, R=reserved,
 *                                T=message type, E=encrypted, C=compressed)
 *  byte 1:    authentication length in 32-bit words
 *  bytes 2-3: message identifier hash (big-endian)
 *  bytes 4-7 (or 4-19 for IPv6): originating source
 *  then:      authentication data, optional NUL-terminated MIME type, SDP payload
 */
#ifndef AUDYN_DISCOVERY_SAP_PACKET_H
#define AUDYN_DISCOVERY_SAP_PACKET_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace audyn {
namespace discovery {

constexpr uint8_t kSapFlagIpv6 = 0x10;
constexpr uint8_t kSapFlagReserved = 0x08;
constexpr uint8_t kSapFlagDeletion = 0x04;
constexpr uint8_t kSapFlagEncrypted = 0x02;
constexpr uint8_t kSapFlagCompressed = 0x01;

constexpr size_t kSapMinPacketSize = 8;
constexpr size_t kSapMimeSearchWindow = 64;

enum class SapDecodeStatus {
    OK,
    TOO_SHORT,
    UNSUPPORTED_VERSION,
    UNSUPPORTED,
    TRUNCATED
};

struct SapPacket {
    int version = 0;
    bool is_ipv6 = false;
    bool is_deletion = false;
    bool is_encrypted = false;
    bool is_compressed = false;
    uint8_t auth_len_words = 0;
    uint16_t msg_id_hash = 0;
    std::string origin;
    std::string mime_type;
    std::string payload;

    /** @brief Directory key, "<origin>:<msg id as 4 lowercase hex digits>". */
    std::string stream_id() const;
};

/**
 * @brief Decodes a received SAP datagram.
 * @param sender_ip UDP source address, used as the origin when the header's
 *        origin field cannot be turned into an address.
 * @param out Populated on OK; partially populated (header fields) otherwise.
 */
SapDecodeStatus decode_sap_packet(const uint8_t* data,
                                  size_t size,
                                  const std::string& sender_ip,
                                  SapPacket& out);

const char* sap_decode_status_name(SapDecodeStatus status);

/** @brief Builds "<origin>:<hash %04x>". */
std::string make_stream_id(const std::string& origin, uint16_t msg_id_hash);

/**
 * @brief Encodes an IPv4 SAP announcement (or deletion) carrying an SDP payload.
 * @details Auth length is zero and the payload is prefixed with "application/sdp\0".
 * @throws std::invalid_argument if origin_ip is not a dotted IPv4 address.
 */
std::vector<uint8_t> encode_sap_packet(const std::string& sdp,
                                       const std::string& origin_ip,
                                       uint16_t msg_id_hash,
                                       bool deletion = false);

/**
 * @brief Replaces invalid UTF-8 sequences with U+FFFD.
 */
std::string sanitize_utf8(const char* data, size_t size);

} // namespace discovery
} // namespace audyn

#endif // AUDYN_DISCOVERY_SAP_PACKET_H
