#include "sdp_builder.h"

#include <random>
#include <sstream>

namespace audyn {
namespace discovery {

namespace {

uint64_t random_session_id() {
    static thread_local std::mt19937_64 generator{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> distribution(100000, 999999);
    return distribution(generator);
}

} // namespace

std::string channel_order_for(int channels, const std::string& channel_config) {
    if (!channel_config.empty()) {
        return channel_config;
    }
    switch (channels) {
        case 1:
            return "M";
        case 2:
            return "ST";
        case 6:
            return "51";
        case 8:
            return "71";
        default:
            break;
    }

    std::string order;
    for (int i = 0; i < channels; ++i) {
        if (i > 0) {
            order += ",";
        }
        order += "M";
    }
    return order;
}

std::string build_sdp(const SdpBuildOptions& options) {
    const uint64_t session_id = options.session_id != 0 ? options.session_id : random_session_id();
    const std::string channel_order = channel_order_for(options.channels, options.channel_config);

    std::ostringstream sdp;
    sdp << "v=0\r\n";
    sdp << "o=- " << session_id << " " << session_id << " IN IP4 " << options.origin_ip << "\r\n";
    sdp << "s=" << options.session_name << "\r\n";
    if (!options.session_info.empty()) {
        sdp << "i=" << options.session_info << "\r\n";
    }
    sdp << "c=IN IP4 " << options.multicast_addr << "/32\r\n";
    sdp << "t=0 0\r\n";
    sdp << "m=audio " << options.port << " RTP/AVP " << options.payload_type << "\r\n";
    sdp << "a=rtpmap:" << options.payload_type << " " << options.encoding << "/" << options.sample_rate
        << "/" << options.channels << "\r\n";
    sdp << "a=ptime:" << options.ptime_ms << "\r\n";
    sdp << "a=fmtp:" << options.payload_type << " channel-order=SMPTE2110.(" << channel_order << ")\r\n";
    // Media clock directly referenced to PTP with zero offset
    sdp << "a=mediaclk:direct=0\r\n";
    sdp << "a=ts-refclk:ptp=IEEE1588-2008:" << options.ptp_grandmaster << ":" << options.ptp_domain << "\r\n";
    return sdp.str();
}

} // namespace discovery
} // namespace audyn
