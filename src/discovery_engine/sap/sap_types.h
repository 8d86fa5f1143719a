#ifndef AUDYN_DISCOVERY_SAP_TYPES_H
#define AUDYN_DISCOVERY_SAP_TYPES_H

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace audyn {
namespace discovery {

// SAP well-known addresses (RFC 2974)
constexpr const char* kSapAddrGlobal = "224.2.127.254";
constexpr const char* kSapAddrAdmin = "239.255.255.255";
constexpr int kSapPort = 9875;
constexpr int kSapVersion = 1;

constexpr const char* kSdpMimeType = "application/sdp";

constexpr int kDefaultSampleRate = 48000;
constexpr int kDefaultChannels = 2;
constexpr int kMaxChannels = 64; // Upper bound for rtpmap channel counts and channel-order labels
constexpr int kDefaultSamplesPerPacket = 48;
constexpr int kDefaultPayloadType = 96;
constexpr double kDefaultPtimeMs = 1.0;

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * @brief Audio stream parameters parsed from a single SDP document.
 */
struct StreamDescriptor {
    std::string session_name;
    std::string session_id;
    std::string session_version;
    std::string origin_addr;
    std::string session_info;
    std::string multicast_addr;
    int ttl = 0;
    int port = 0;
    int payload_type = kDefaultPayloadType;
    std::string encoding = "L24";
    int sample_rate = kDefaultSampleRate;
    int channels = kDefaultChannels;
    double ptime_ms = kDefaultPtimeMs;
    int samples_per_packet = kDefaultSamplesPerPacket;
    std::string source_addr;
    bool is_ssm = false;
    std::vector<std::string> channel_labels;
    std::string channel_order_raw;
    std::string mediaclk;
    int mediaclk_offset = -1;
    bool is_st2110_compliant = false;
    std::string ts_refclk;
    std::string ptp_grandmaster;
    int ptp_domain = 0;
    std::string conformance_level;
    std::string raw_sdp;

    bool is_valid() const { return !multicast_addr.empty() && port > 0; }
};

/**
 * @brief A stream known to the directory, keyed by SAP origin and message id hash.
 */
struct DiscoveredStream {
    std::string id;
    StreamDescriptor sdp;
    std::string origin_ip;
    TimePoint first_seen{};
    TimePoint last_seen{};
    bool active = true;
};

struct DiscoveryStatistics {
    uint64_t packets_received = 0;
    uint64_t packets_invalid = 0;
    uint64_t announcements = 0;
    uint64_t deletions = 0;
    uint64_t sdp_parse_errors = 0;
    int active_streams = 0;
};

enum class DiscoveryEvent {
    NEW,
    UPDATE,
    DELETE,
    EXPIRE
};

const char* discovery_event_name(DiscoveryEvent event);

} // namespace discovery
} // namespace audyn

#endif // AUDYN_DISCOVERY_SAP_TYPES_H
