#include "sdp_parser.h"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <vector>

#include "st2110_attributes.h"
#include "../utils/cpp_logger.h"

namespace audyn {
namespace discovery {

namespace {

std::string trim_copy(const std::string& input) {
    const auto first = input.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = input.find_last_not_of(" \t\r\n");
    return input.substr(first, last - first + 1);
}

int safe_atoi(const std::string& value, int fallback = 0) {
    errno = 0;
    char* end_ptr = nullptr;
    const long parsed = std::strtol(value.c_str(), &end_ptr, 10);
    if (end_ptr == value.c_str() || *end_ptr != '\0' || errno == ERANGE ||
        parsed < INT_MIN || parsed > INT_MAX) {
        return fallback;
    }
    return static_cast<int>(parsed);
}

bool safe_atof(const std::string& value, double& out) {
    char* end_ptr = nullptr;
    const double parsed = std::strtod(value.c_str(), &end_ptr);
    if (end_ptr == value.c_str() || *end_ptr != '\0' || !std::isfinite(parsed)) {
        return false;
    }
    out = parsed;
    return true;
}

bool starts_with(const std::string& text, const char* prefix) {
    return text.compare(0, std::strlen(prefix), prefix) == 0;
}

std::vector<std::string> split_whitespace(const std::string& text) {
    std::vector<std::string> tokens;
    std::istringstream stream(text);
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::vector<std::string> split_sdp_lines(const std::string& payload) {
    std::vector<std::string> lines;
    std::istringstream stream(payload);
    std::string raw_line;
    while (std::getline(stream, raw_line)) {
        if (!raw_line.empty() && raw_line.back() == '\r') {
            raw_line.pop_back();
        }
        lines.push_back(trim_copy(raw_line));
    }
    return lines;
}

// 0 when the product does not fit, so the default applies.
int compute_samples_per_packet(int sample_rate, double ptime_ms) {
    const double samples = static_cast<double>(sample_rate) * ptime_ms / 1000.0;
    if (!std::isfinite(samples) || samples < 0.0 || samples > static_cast<double>(INT_MAX)) {
        return 0;
    }
    return static_cast<int>(std::lround(samples));
}

// Channel count is authoritative: extra labels are dropped, missing ones numbered.
void reconcile_channel_labels(StreamDescriptor& sdp) {
    const size_t channels = static_cast<size_t>(sdp.channels);
    if (sdp.channel_labels.size() == channels) {
        return;
    }
    LOG_CPP_DEBUG("SDP channel-order '%s' gives %zu labels for %d channels",
                  sdp.channel_order_raw.c_str(), sdp.channel_labels.size(), sdp.channels);
    if (sdp.channel_labels.size() > channels) {
        sdp.channel_labels.resize(channels);
        return;
    }
    while (sdp.channel_labels.size() < channels) {
        sdp.channel_labels.push_back("Ch " + std::to_string(sdp.channel_labels.size() + 1));
    }
}

struct AudioSectionState {
    bool in_audio = false;
    bool audio_seen = false;
    bool ptime_explicit = false;
};

// a=rtpmap:<pt> <encoding>/<clock>[/<channels>]
void parse_rtpmap(const std::string& value, StreamDescriptor& sdp, const AudioSectionState& state) {
    const std::string remainder = trim_copy(value.substr(std::strlen("rtpmap:")));
    const auto space_pos = remainder.find_first_of(" \t");
    if (space_pos == std::string::npos) {
        return;
    }

    const int payload_type = safe_atoi(remainder.substr(0, space_pos), -1);
    if (payload_type < 0) {
        return;
    }

    const std::vector<std::string> fields = [&]() {
        std::vector<std::string> parts;
        std::stringstream ss(trim_copy(remainder.substr(space_pos + 1)));
        std::string part;
        while (std::getline(ss, part, '/')) {
            parts.push_back(trim_copy(part));
        }
        return parts;
    }();
    if (fields.size() < 2 || fields[0].empty()) {
        return;
    }

    const int sample_rate = safe_atoi(fields[1], -1);
    if (sample_rate < 0) {
        return;
    }
    int channels = kDefaultChannels;
    if (fields.size() >= 3) {
        channels = safe_atoi(fields[2], -1);
        if (channels < 0 || channels > kMaxChannels) {
            return;
        }
    }

    sdp.payload_type = payload_type;
    sdp.encoding = fields[0];
    sdp.sample_rate = sample_rate;
    sdp.channels = channels;
    if (state.ptime_explicit && sdp.sample_rate > 0) {
        sdp.samples_per_packet = compute_samples_per_packet(sdp.sample_rate, sdp.ptime_ms);
    }
}

// a=source-filter: incl IN IP4 <dest> <source>
void parse_source_filter(const std::string& value, StreamDescriptor& sdp) {
    const auto tokens = split_whitespace(value.substr(std::strlen("source-filter:")));
    for (size_t i = 0; i + 4 < tokens.size(); ++i) {
        if (tokens[i] != "incl" || tokens[i + 1] != "IN") {
            continue;
        }
        const std::string& addrtype = tokens[i + 2];
        if (addrtype.size() < 3 || addrtype.compare(0, 2, "IP") != 0 ||
            !std::isdigit(static_cast<unsigned char>(addrtype[2]))) {
            continue;
        }
        sdp.source_addr = tokens[i + 4];
        sdp.is_ssm = true;
        return;
    }
}

// a=fmtp:<pt> ...;channel-order=SMPTE2110.(<symbols>)
void parse_fmtp_channel_order(const std::string& value, StreamDescriptor& sdp) {
    static const char* kKey = "channel-order=";
    const auto key_pos = value.find(kKey);
    if (key_pos == std::string::npos) {
        return;
    }
    const size_t start = key_pos + std::strlen(kKey);
    const auto open = value.find('(', start);
    if (open == std::string::npos || open <= start + 1 || value[open - 1] != '.') {
        return;
    }
    const auto close = value.find(')', open + 1);
    if (close == std::string::npos || close == open + 1) {
        return;
    }
    const std::string raw = value.substr(start, close - start + 1);
    if (raw.find_first_of(" \t") < open - start) {
        return;
    }

    sdp.channel_order_raw = raw;
    sdp.channel_labels = expand_channel_order(raw);
}

void parse_audio_attribute(const std::string& value, StreamDescriptor& sdp, AudioSectionState& state) {
    if (starts_with(value, "rtpmap:")) {
        parse_rtpmap(value, sdp, state);
    } else if (starts_with(value, "ptime:")) {
        double ptime = 0.0;
        if (safe_atof(trim_copy(value.substr(std::strlen("ptime:"))), ptime)) {
            sdp.ptime_ms = ptime;
            state.ptime_explicit = true;
            if (sdp.sample_rate > 0) {
                sdp.samples_per_packet = compute_samples_per_packet(sdp.sample_rate, ptime);
            }
        }
    } else if (starts_with(value, "source-filter:")) {
        parse_source_filter(value, sdp);
    } else if (starts_with(value, "mediaclk:")) {
        sdp.mediaclk = value.substr(std::strlen("mediaclk:"));
        sdp.is_st2110_compliant = parse_mediaclk(sdp.mediaclk, sdp.mediaclk_offset);
    } else if (starts_with(value, "ts-refclk:")) {
        sdp.ts_refclk = value.substr(std::strlen("ts-refclk:"));
        parse_ts_refclk(sdp.ts_refclk, sdp.ptp_grandmaster, sdp.ptp_domain);
    } else if (starts_with(value, "fmtp:")) {
        parse_fmtp_channel_order(value, sdp);
    }
}

} // namespace

std::optional<StreamDescriptor> parse_sdp(const std::string& sdp_text) {
    StreamDescriptor sdp;
    sdp.raw_sdp = sdp_text;
    AudioSectionState state;

    for (const auto& line : split_sdp_lines(sdp_text)) {
        if (line.size() < 3 || line[1] != '=') {
            continue;
        }

        const char type_char = line[0];
        const std::string value = line.substr(2);

        switch (type_char) {
            case 'o': {
                // o=<username> <sess-id> <sess-version> <nettype> <addrtype> <addr>
                const auto parts = split_whitespace(value);
                if (parts.size() >= 6) {
                    sdp.session_id = parts[1];
                    sdp.session_version = parts[2];
                    sdp.origin_addr = parts[5];
                }
                break;
            }
            case 's':
                sdp.session_name = value;
                break;
            case 'i':
                sdp.session_info = value;
                break;
            case 'c': {
                // c=<nettype> <addrtype> <connection-address>[/<ttl>][/<num>]
                const auto parts = split_whitespace(value);
                if (parts.size() >= 3) {
                    const std::string& address = parts[2];
                    const auto slash = address.find('/');
                    sdp.multicast_addr = address.substr(0, slash);
                    if (slash != std::string::npos) {
                        const auto next = address.find('/', slash + 1);
                        sdp.ttl = safe_atoi(address.substr(slash + 1, next == std::string::npos ? std::string::npos : next - slash - 1), 0);
                    }
                }
                break;
            }
            case 'm': {
                // m=audio <port>[/<count>] RTP/AVP <fmt>
                const auto parts = split_whitespace(value);
                state.in_audio = false;
                if (parts.size() >= 4 && parts[0] == "audio" && !state.audio_seen) {
                    const std::string port_str = parts[1].substr(0, parts[1].find('/'));
                    const int port = safe_atoi(port_str, -1);
                    if (port < 0 || port > 65535) {
                        break;
                    }
                    state.in_audio = true;
                    state.audio_seen = true;
                    sdp.port = port;
                    sdp.payload_type = safe_atoi(parts[3], sdp.payload_type);
                }
                break;
            }
            case 'a':
                if (state.in_audio) {
                    parse_audio_attribute(value, sdp, state);
                }
                break;
            default:
                break;
        }
    }

    if (!sdp.is_valid()) {
        return std::nullopt;
    }

    if (sdp.sample_rate == 0) {
        sdp.sample_rate = kDefaultSampleRate;
    }
    if (sdp.channels == 0) {
        sdp.channels = kDefaultChannels;
    }
    if (sdp.samples_per_packet == 0) {
        sdp.samples_per_packet = kDefaultSamplesPerPacket;
    }
    if (sdp.channel_labels.empty()) {
        sdp.channel_labels = default_channel_labels(sdp.channels);
    } else {
        reconcile_channel_labels(sdp);
    }
    sdp.conformance_level = conformance_level(sdp.channels, sdp.ptime_ms, sdp.sample_rate);

    return sdp;
}

std::string describe_stream(const StreamDescriptor& sdp) {
    char buffer[512];
    std::snprintf(buffer, sizeof(buffer),
                  "'%s' %s:%d pt=%d %s/%d/%d ptime=%.3gms spp=%d level=%s ptp=%s:%d%s",
                  sdp.session_name.c_str(),
                  sdp.multicast_addr.c_str(),
                  sdp.port,
                  sdp.payload_type,
                  sdp.encoding.c_str(),
                  sdp.sample_rate,
                  sdp.channels,
                  sdp.ptime_ms,
                  sdp.samples_per_packet,
                  sdp.conformance_level.empty() ? "-" : sdp.conformance_level.c_str(),
                  sdp.ptp_grandmaster.empty() ? "-" : sdp.ptp_grandmaster.c_str(),
                  sdp.ptp_domain,
                  sdp.is_ssm ? (" ssm=" + sdp.source_addr).c_str() : "");
    return buffer;
}

} // namespace discovery
} // namespace audyn
