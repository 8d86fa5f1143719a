// Sends SMPTE ST 2110-30 SAP/SDP announcements, for exercising discovery without real hardware.

#include <getopt.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>

#include "sap/sap_announcer.h"
#include "sap/sdp_builder.h"
#include "sap/st2110_attributes.h"
#include "utils/cpp_logger.h"

using namespace audyn::discovery;

namespace {

std::atomic<bool> g_stop{false};

void handle_signal(int) {
    g_stop = true;
}

struct AnnounceOptions {
    SdpBuildOptions sdp;
    double interval_sec = 0.0;
    int count = 0;
    bool deletion = false;
    std::string dest = kSapAddrAdmin;
    int sap_port = kSapPort;
    int ttl = kDefaultAnnounceTtl;
    bool verbose = false;
};

void usage(const char* argv0) {
    fprintf(stderr,
            "%s [options]\n"
            "\t --name NAME             session name (default: Test Stream)\n"
            "\t --info TEXT             session info/description\n"
            "\t --addr ADDR             stream multicast address (default: 239.69.1.100)\n"
            "\t --port PORT             RTP port (default: 5004)\n"
            "\t --rate HZ               sample rate 44100, 48000 or 96000 (default: 48000)\n"
            "\t --channels N            channel count (default: 2)\n"
            "\t --encoding ENC          L16 or L24 (default: L24)\n"
            "\t --ptime MS              packet time in ms, 1.0 or 0.125 (default: 1.0)\n"
            "\t --origin IP             origin address (default: 192.168.1.100)\n"
            "\t --channel-config CFG    SMPTE 2110 channel groups, e.g. ST, 51, 71, 51,ST\n"
            "\t --ptp-gm ID             PTP grandmaster id (default: 00-00-00-00-00-00-00-00)\n"
            "\t --ptp-domain N          PTP domain (default: 0)\n"
            "\t --interval SEC          send interval in seconds, 0 sends once (default: 0)\n"
            "\t --count N               number of announcements, 0 is unlimited (default: 0)\n"
            "\t --delete                send a deletion instead of an announcement\n"
            "\t --dest ADDR             SAP destination group (default: %s)\n"
            "\t --sap-port PORT         SAP destination port (default: %d)\n"
            "\t --ttl N                 multicast TTL (default: %d)\n"
            "\t -v                      verbose logging\n"
            "\t -h                      print this help\n",
            argv0, kSapAddrAdmin, kSapPort, kDefaultAnnounceTtl);
}

bool parse_int(const char* text, int& out) {
    char* end = nullptr;
    long value = strtol(text, &end, 10);
    if (end == text || *end != '\0') {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

bool parse_double(const char* text, double& out) {
    char* end = nullptr;
    double value = strtod(text, &end);
    if (end == text || *end != '\0') {
        return false;
    }
    out = value;
    return true;
}

void drain_logs() {
    for (;;) {
        auto entries = logging::retrieve_log_entries(0);
        if (entries.empty()) {
            return;
        }
        for (const auto& entry : entries) {
            fprintf(stderr, "[%s] %s:%d %s\n", logging::log_level_name(entry.level),
                    entry.filename.c_str(), entry.line_number, entry.message.c_str());
        }
    }
}

} // namespace

int main(int argc, char** argv) {
    enum {
        OPT_NAME = 1000,
        OPT_INFO,
        OPT_ADDR,
        OPT_PORT,
        OPT_RATE,
        OPT_CHANNELS,
        OPT_ENCODING,
        OPT_PTIME,
        OPT_ORIGIN,
        OPT_CHANNEL_CONFIG,
        OPT_PTP_GM,
        OPT_PTP_DOMAIN,
        OPT_INTERVAL,
        OPT_COUNT,
        OPT_DELETE,
        OPT_DEST,
        OPT_SAP_PORT,
        OPT_TTL
    };

    static const struct option longOptions[] = {
        {"name", required_argument, NULL, OPT_NAME},
        {"info", required_argument, NULL, OPT_INFO},
        {"addr", required_argument, NULL, OPT_ADDR},
        {"port", required_argument, NULL, OPT_PORT},
        {"rate", required_argument, NULL, OPT_RATE},
        {"channels", required_argument, NULL, OPT_CHANNELS},
        {"encoding", required_argument, NULL, OPT_ENCODING},
        {"ptime", required_argument, NULL, OPT_PTIME},
        {"origin", required_argument, NULL, OPT_ORIGIN},
        {"channel-config", required_argument, NULL, OPT_CHANNEL_CONFIG},
        {"ptp-gm", required_argument, NULL, OPT_PTP_GM},
        {"ptp-domain", required_argument, NULL, OPT_PTP_DOMAIN},
        {"interval", required_argument, NULL, OPT_INTERVAL},
        {"count", required_argument, NULL, OPT_COUNT},
        {"delete", no_argument, NULL, OPT_DELETE},
        {"dest", required_argument, NULL, OPT_DEST},
        {"sap-port", required_argument, NULL, OPT_SAP_PORT},
        {"ttl", required_argument, NULL, OPT_TTL},
        {"help", no_argument, NULL, 'h'},
        {NULL, 0, NULL, 0}};

    AnnounceOptions options;
    bool ok = true;

    int c = 0;
    while ((c = getopt_long(argc, argv, "vh", longOptions, NULL)) != -1) {
        switch (c) {
            case OPT_NAME:
                options.sdp.session_name = optarg;
                break;
            case OPT_INFO:
                options.sdp.session_info = optarg;
                break;
            case OPT_ADDR:
                options.sdp.multicast_addr = optarg;
                break;
            case OPT_PORT:
                ok = parse_int(optarg, options.sdp.port) && options.sdp.port > 0 && options.sdp.port <= 65535;
                break;
            case OPT_RATE:
                ok = parse_int(optarg, options.sdp.sample_rate) &&
                     (options.sdp.sample_rate == 44100 || options.sdp.sample_rate == 48000 ||
                      options.sdp.sample_rate == 96000);
                break;
            case OPT_CHANNELS:
                ok = parse_int(optarg, options.sdp.channels) && options.sdp.channels > 0;
                break;
            case OPT_ENCODING:
                options.sdp.encoding = optarg;
                ok = options.sdp.encoding == "L16" || options.sdp.encoding == "L24";
                break;
            case OPT_PTIME:
                ok = parse_double(optarg, options.sdp.ptime_ms) && options.sdp.ptime_ms > 0.0;
                break;
            case OPT_ORIGIN:
                options.sdp.origin_ip = optarg;
                break;
            case OPT_CHANNEL_CONFIG:
                options.sdp.channel_config = optarg;
                break;
            case OPT_PTP_GM:
                options.sdp.ptp_grandmaster = optarg;
                break;
            case OPT_PTP_DOMAIN:
                ok = parse_int(optarg, options.sdp.ptp_domain) && options.sdp.ptp_domain >= 0;
                break;
            case OPT_INTERVAL:
                ok = parse_double(optarg, options.interval_sec);
                break;
            case OPT_COUNT:
                ok = parse_int(optarg, options.count) && options.count >= 0;
                break;
            case OPT_DELETE:
                options.deletion = true;
                break;
            case OPT_DEST:
                options.dest = optarg;
                break;
            case OPT_SAP_PORT:
                ok = parse_int(optarg, options.sap_port) && options.sap_port > 0 && options.sap_port <= 65535;
                break;
            case OPT_TTL:
                ok = parse_int(optarg, options.ttl) && options.ttl >= 0 && options.ttl <= 255;
                break;
            case 'v':
                options.verbose = true;
                break;
            case 'h':
                usage(argv[0]);
                return 0;
            default:
                usage(argv[0]);
                return 1;
        }
        if (!ok) {
            fprintf(stderr, "Invalid value for option %s: %s\n", argv[optind - 1], optarg ? optarg : "");
            return 1;
        }
    }

    logging::set_cpp_log_level(options.verbose ? logging::LogLevel::DEBUG : logging::LogLevel::WARNING);
    signal(SIGINT, handle_signal);
    signal(SIGTERM, handle_signal);

    std::random_device rd;
    const uint16_t msg_id = static_cast<uint16_t>(std::uniform_int_distribution<int>(0, 65535)(rd));
    // One session id for the whole run so repeated announcements are refreshes
    if (options.sdp.session_id == 0) {
        options.sdp.session_id = std::uniform_int_distribution<uint64_t>(100000, 999999)(rd);
    }

    const std::string channel_order = channel_order_for(options.sdp.channels, options.sdp.channel_config);
    const std::string level = conformance_level(options.sdp.channels, options.sdp.ptime_ms, options.sdp.sample_rate);

    printf("SMPTE ST 2110-30 SAP Announcer\n");
    printf("  Session:      %s\n", options.sdp.session_name.c_str());
    printf("  Address:      %s:%d\n", options.sdp.multicast_addr.c_str(), options.sdp.port);
    printf("  Format:       %s @ %d Hz, %d ch, %gms\n", options.sdp.encoding.c_str(), options.sdp.sample_rate,
           options.sdp.channels, options.sdp.ptime_ms);
    printf("  Channel Cfg:  SMPTE2110.(%s)\n", channel_order.c_str());
    printf("  Conformance:  %s\n", level.empty() ? "none" : ("Level " + level).c_str());
    printf("  PTP GM:       %s:%d\n", options.sdp.ptp_grandmaster.c_str(), options.sdp.ptp_domain);
    printf("  Sending to:   %s:%d\n\n", options.dest.c_str(), options.sap_port);
    fflush(stdout);

    int exit_code = 0;
    try {
        SapAnnouncer announcer(options.dest, options.sap_port, options.ttl);
        const std::string sdp = build_sdp(options.sdp);

        int sent = 0;
        while (!g_stop) {
            const size_t size = announcer.announce(sdp, options.sdp.origin_ip, msg_id, options.deletion);
            ++sent;
            printf("[%d] Sent %zu bytes%s\n", sent, size, options.deletion ? " (deletion)" : "");
            fflush(stdout);
            drain_logs();

            if (options.interval_sec <= 0.0) {
                break;
            }
            if (options.count > 0 && sent >= options.count) {
                break;
            }

            const auto deadline = std::chrono::steady_clock::now() +
                                  std::chrono::milliseconds(static_cast<long>(options.interval_sec * 1000.0));
            while (!g_stop && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
        }
        if (g_stop) {
            printf("\nStopped\n");
        }
    } catch (const std::exception& ex) {
        fprintf(stderr, "sap_announce: %s\n", ex.what());
        exit_code = 1;
    }

    drain_logs();
    logging::shutdown_cpp_logger();
    return exit_code;
}
