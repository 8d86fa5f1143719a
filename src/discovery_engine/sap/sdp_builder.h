#ifndef AUDYN_DISCOVERY_SDP_BUILDER_H
#define AUDYN_DISCOVERY_SDP_BUILDER_H

#include <cstdint>
#include <string>

namespace audyn {
namespace discovery {

struct SdpBuildOptions {
    std::string session_name = "Test Stream";
    std::string session_info;
    std::string multicast_addr = "239.69.1.100";
    int port = 5004;
    int sample_rate = 48000;
    int channels = 2;
    std::string encoding = "L24";
    double ptime_ms = 1.0;
    std::string origin_ip = "192.168.1.100";
    uint64_t session_id = 0;
    int payload_type = 96;
    std::string ptp_grandmaster = "00-00-00-00-00-00-00-00";
    int ptp_domain = 0;
    std::string channel_config;
};

/**
 * @brief Channel grouping for the fmtp channel-order attribute.
 * @details An explicit configuration wins; 1/2/6/8 channels map to M/ST/51/71,
 *          any other count is expressed as repeated mono groups.
 */
std::string channel_order_for(int channels, const std::string& channel_config = "");

/**
 * @brief Builds an ST 2110-30 SDP document (v, o, s, [i], c, t, m, a lines, CRLF terminated).
 * @details A zero session_id is replaced by a random six digit value.
 */
std::string build_sdp(const SdpBuildOptions& options);

} // namespace discovery
} // namespace audyn

#endif // AUDYN_DISCOVERY_SDP_BUILDER_H
