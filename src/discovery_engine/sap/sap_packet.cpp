#include "sap_packet.h"

#include <cstdio>
#include <cstring>
#include <stdexcept>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include "sap_types.h"

namespace audyn {
namespace discovery {

namespace {

constexpr size_t kSapFixedHeaderSize = 4;
constexpr size_t kIpv4AddrSize = 4;
constexpr size_t kIpv6AddrSize = 16;

bool format_origin(const uint8_t* data, size_t size, bool is_ipv6, std::string& out) {
    const size_t addr_size = is_ipv6 ? kIpv6AddrSize : kIpv4AddrSize;
    if (size < kSapFixedHeaderSize + addr_size) {
        return false;
    }

    char text[INET6_ADDRSTRLEN] = {0};
    if (is_ipv6) {
        struct in6_addr addr;
        std::memcpy(&addr, data + kSapFixedHeaderSize, kIpv6AddrSize);
        if (inet_ntop(AF_INET6, &addr, text, sizeof(text)) == nullptr) {
            return false;
        }
    } else {
        struct in_addr addr;
        std::memcpy(&addr, data + kSapFixedHeaderSize, kIpv4AddrSize);
        if (inet_ntop(AF_INET, &addr, text, sizeof(text)) == nullptr) {
            return false;
        }
    }
    out = text;
    return true;
}

// Length of the UTF-8 sequence starting at data[0], or 0 if it is malformed.
size_t valid_utf8_sequence_length(const unsigned char* data, size_t remaining) {
    const unsigned char lead = data[0];
    size_t length = 0;
    uint32_t min_code_point = 0;
    uint32_t code_point = 0;

    if (lead < 0x80) {
        return 1;
    } else if ((lead & 0xE0) == 0xC0) {
        length = 2;
        min_code_point = 0x80;
        code_point = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        min_code_point = 0x800;
        code_point = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        min_code_point = 0x10000;
        code_point = lead & 0x07;
    } else {
        return 0;
    }

    if (remaining < length) {
        return 0;
    }
    for (size_t i = 1; i < length; ++i) {
        if ((data[i] & 0xC0) != 0x80) {
            return 0;
        }
        code_point = (code_point << 6) | (data[i] & 0x3F);
    }
    if (code_point < min_code_point || code_point > 0x10FFFF ||
        (code_point >= 0xD800 && code_point <= 0xDFFF)) {
        return 0;
    }
    return length;
}

} // namespace

std::string make_stream_id(const std::string& origin, uint16_t msg_id_hash) {
    char hash_text[8];
    std::snprintf(hash_text, sizeof(hash_text), "%04x", static_cast<unsigned int>(msg_id_hash));
    return origin + ":" + hash_text;
}

std::string SapPacket::stream_id() const {
    return make_stream_id(origin, msg_id_hash);
}

const char* sap_decode_status_name(SapDecodeStatus status) {
    switch (status) {
        case SapDecodeStatus::OK:
            return "ok";
        case SapDecodeStatus::TOO_SHORT:
            return "too short";
        case SapDecodeStatus::UNSUPPORTED_VERSION:
            return "unsupported version";
        case SapDecodeStatus::UNSUPPORTED:
            return "encrypted or compressed";
        case SapDecodeStatus::TRUNCATED:
            return "truncated";
    }
    return "unknown";
}

std::string sanitize_utf8(const char* data, size_t size) {
    static const char kReplacement[] = "\xEF\xBF\xBD";
    std::string result;
    result.reserve(size);

    const auto* bytes = reinterpret_cast<const unsigned char*>(data);
    size_t pos = 0;
    while (pos < size) {
        const size_t length = valid_utf8_sequence_length(bytes + pos, size - pos);
        if (length == 0) {
            result.append(kReplacement);
            ++pos;
            continue;
        }
        result.append(data + pos, length);
        pos += length;
    }
    return result;
}

SapDecodeStatus decode_sap_packet(const uint8_t* data,
                                  size_t size,
                                  const std::string& sender_ip,
                                  SapPacket& out) {
    out = SapPacket{};
    if (data == nullptr || size < kSapMinPacketSize) {
        return SapDecodeStatus::TOO_SHORT;
    }

    const uint8_t flags = data[0];
    out.version = (flags >> 5) & 0x07;
    out.is_ipv6 = (flags & kSapFlagIpv6) != 0;
    out.is_deletion = (flags & kSapFlagDeletion) != 0;
    out.is_encrypted = (flags & kSapFlagEncrypted) != 0;
    out.is_compressed = (flags & kSapFlagCompressed) != 0;
    out.auth_len_words = data[1];
    out.msg_id_hash = static_cast<uint16_t>((data[2] << 8) | data[3]);

    if (out.version != kSapVersion) {
        return SapDecodeStatus::UNSUPPORTED_VERSION;
    }
    if (out.is_encrypted || out.is_compressed) {
        return SapDecodeStatus::UNSUPPORTED;
    }

    if (!format_origin(data, size, out.is_ipv6, out.origin)) {
        out.origin = sender_ip;
    }

    const size_t origin_end = kSapFixedHeaderSize + (out.is_ipv6 ? kIpv6AddrSize : kIpv4AddrSize);
    const size_t payload_offset = origin_end + static_cast<size_t>(out.auth_len_words) * 4;
    if (payload_offset > size) {
        return SapDecodeStatus::TRUNCATED;
    }

    const char* payload = reinterpret_cast<const char*>(data + payload_offset);
    size_t payload_size = size - payload_offset;

    // Optional payload type, e.g. "application/sdp\0"
    const size_t window = payload_size < kSapMimeSearchWindow ? payload_size : kSapMimeSearchWindow;
    const void* nul = std::memchr(payload, '\0', window);
    if (nul != nullptr) {
        const size_t mime_len = static_cast<size_t>(static_cast<const char*>(nul) - payload);
        out.mime_type.assign(payload, mime_len);
        payload += mime_len + 1;
        payload_size -= mime_len + 1;
    }

    // Some senders NUL-terminate the SDP text
    while (payload_size > 0 && payload[payload_size - 1] == '\0') {
        --payload_size;
    }

    out.payload = sanitize_utf8(payload, payload_size);
    return SapDecodeStatus::OK;
}

std::vector<uint8_t> encode_sap_packet(const std::string& sdp,
                                       const std::string& origin_ip,
                                       uint16_t msg_id_hash,
                                       bool deletion) {
    struct in_addr src_addr;
    if (inet_pton(AF_INET, origin_ip.c_str(), &src_addr) != 1) {
        throw std::invalid_argument("Invalid SAP origin address: " + origin_ip);
    }

    const std::string content_type = kSdpMimeType;
    std::vector<uint8_t> sap_packet(kSapMinPacketSize + content_type.length() + 1 + sdp.length());

    sap_packet[0] = static_cast<uint8_t>(kSapVersion << 5); // V=1, A=0, R=0, T=0, E=0, C=0
    if (deletion) {
        sap_packet[0] |= kSapFlagDeletion;
    }
    sap_packet[1] = 0; // No authentication data
    sap_packet[2] = static_cast<uint8_t>((msg_id_hash >> 8) & 0xFF);
    sap_packet[3] = static_cast<uint8_t>(msg_id_hash & 0xFF);
    std::memcpy(&sap_packet[4], &src_addr.s_addr, kIpv4AddrSize);

    size_t offset = kSapMinPacketSize;
    std::memcpy(&sap_packet[offset], content_type.c_str(), content_type.length() + 1); // Include null terminator
    offset += content_type.length() + 1;
    if (!sdp.empty()) {
        std::memcpy(&sap_packet[offset], sdp.data(), sdp.length());
    }
    return sap_packet;
}

} // namespace discovery
} // namespace audyn
