#include "st2110_attributes.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <map>
#include <sstream>

#include "sap_types.h"

namespace audyn {
namespace discovery {

namespace {

// SMPTE ST 2110-30 channel grouping symbols (Table 1)
const std::map<std::string, std::vector<std::string>>& channel_groups() {
    static const std::map<std::string, std::vector<std::string>> groups = {
        {"M", {"M"}},
        {"DM", {"M1", "M2"}},
        {"ST", {"L", "R"}},
        {"LtRt", {"Lt", "Rt"}},
        {"51", {"L", "R", "C", "LFE", "Ls", "Rs"}},
        {"71", {"L", "R", "C", "LFE", "Lss", "Rss", "Lrs", "Rrs"}},
        {"222", {"L", "R", "C", "LFE", "Lss", "Rss", "Lrs", "Rrs",
                 "Tfl", "Tfr", "Tfc", "Tsl", "Tsr", "Tbl", "Tbr",
                 "Tbc", "Ltf", "Rtf", "Ltr", "Rtr", "Lw", "Rw", "LFE2", "Cb"}},
        {"SGRP", {"St1L", "St1R", "St2L", "St2R"}},
    };
    return groups;
}

constexpr double kPtimeTolerance = 0.01;

std::string trim_copy(const std::string& input) {
    const auto first = input.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = input.find_last_not_of(" \t\r\n");
    return input.substr(first, last - first + 1);
}

bool all_digits(const std::string& text) {
    return !text.empty() &&
           std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

// Decimal digits only, rejected when outside [min_value, max_value].
bool parse_bounded_int(const std::string& text, long min_value, long max_value, int& out) {
    if (!all_digits(text)) {
        return false;
    }
    errno = 0;
    char* end_ptr = nullptr;
    const long parsed = std::strtol(text.c_str(), &end_ptr, 10);
    if (errno == ERANGE || *end_ptr != '\0' || parsed < min_value || parsed > max_value) {
        return false;
    }
    out = static_cast<int>(parsed);
    return true;
}

bool is_hex_or_dash(unsigned char c) {
    return std::isxdigit(c) != 0 || c == '-';
}

} // namespace

bool lookup_channel_group(const std::string& symbol, std::vector<std::string>& labels) {
    const auto& groups = channel_groups();
    auto it = groups.find(symbol);
    if (it == groups.end()) {
        return false;
    }
    labels = it->second;
    return true;
}

std::vector<std::string> expand_channel_order(const std::string& channel_order) {
    std::vector<std::string> labels;

    const auto open = channel_order.find('(');
    if (open == std::string::npos) {
        return labels;
    }
    const auto close = channel_order.find(')', open + 1);
    if (close == std::string::npos || close == open + 1) {
        return labels;
    }

    std::stringstream ss(channel_order.substr(open + 1, close - open - 1));
    std::string symbol;
    while (std::getline(ss, symbol, ',')) {
        symbol = trim_copy(symbol);
        if (symbol.empty()) {
            continue;
        }

        // Undefined group: U<n> reserves n channels
        if (symbol.size() > 1 && symbol[0] == 'U' && all_digits(symbol.substr(1))) {
            int count = 0;
            if (!parse_bounded_int(symbol.substr(1), 1, kMaxChannels, count)) {
                continue;
            }
            for (int i = 0; i < count && labels.size() < static_cast<size_t>(kMaxChannels); ++i) {
                labels.push_back("U" + std::to_string(labels.size() + 1));
            }
        } else {
            std::vector<std::string> group;
            if (lookup_channel_group(symbol, group)) {
                labels.insert(labels.end(), group.begin(), group.end());
            } else {
                labels.push_back(symbol);
            }
        }

        if (labels.size() >= static_cast<size_t>(kMaxChannels)) {
            labels.resize(kMaxChannels);
            break;
        }
    }
    return labels;
}

bool parse_ts_refclk(const std::string& ts_refclk, std::string& grandmaster, int& domain) {
    static const std::string kPrefix = "ptp=IEEE1588-";
    const auto start = ts_refclk.find(kPrefix);
    if (start == std::string::npos) {
        return false;
    }

    size_t pos = start + kPrefix.size();
    // IEEE 1588 edition, e.g. 2008 or 2019
    const size_t version_begin = pos;
    while (pos < ts_refclk.size() && std::isdigit(static_cast<unsigned char>(ts_refclk[pos]))) {
        ++pos;
    }
    if (pos == version_begin || pos >= ts_refclk.size() || ts_refclk[pos] != ':') {
        return false;
    }
    ++pos;

    const size_t gm_begin = pos;
    while (pos < ts_refclk.size() && is_hex_or_dash(static_cast<unsigned char>(ts_refclk[pos]))) {
        ++pos;
    }
    if (pos == gm_begin || pos >= ts_refclk.size() || ts_refclk[pos] != ':') {
        return false;
    }
    std::string gm = ts_refclk.substr(gm_begin, pos - gm_begin);
    ++pos;

    const size_t domain_begin = pos;
    while (pos < ts_refclk.size() && std::isdigit(static_cast<unsigned char>(ts_refclk[pos]))) {
        ++pos;
    }
    if (pos == domain_begin) {
        return false;
    }

    std::transform(gm.begin(), gm.end(), gm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    int parsed_domain = 0;
    if (!parse_bounded_int(ts_refclk.substr(domain_begin, pos - domain_begin), 0, INT_MAX, parsed_domain)) {
        return false;
    }
    grandmaster = gm;
    domain = parsed_domain;
    return true;
}

bool parse_mediaclk(const std::string& mediaclk, int& offset) {
    offset = -1;
    static const std::string kDirect = "direct=";
    if (mediaclk.compare(0, kDirect.size(), kDirect) != 0) {
        return false;
    }

    size_t end = kDirect.size();
    while (end < mediaclk.size() && std::isdigit(static_cast<unsigned char>(mediaclk[end]))) {
        ++end;
    }
    if (end == kDirect.size()) {
        return false;
    }

    int parsed_offset = 0;
    if (!parse_bounded_int(mediaclk.substr(kDirect.size(), end - kDirect.size()), 0, INT_MAX, parsed_offset)) {
        return false;
    }
    offset = parsed_offset;
    return offset == 0;
}

std::string conformance_level(int channels, double ptime_ms, int sample_rate) {
    const bool is_96k = sample_rate == 96000;
    const bool is_1ms = std::fabs(ptime_ms - 1.0) < kPtimeTolerance;
    const bool is_125us = std::fabs(ptime_ms - 0.125) < kPtimeTolerance;

    if (is_96k) {
        if (is_1ms && channels <= 4) {
            return "AX";
        }
        if (is_125us) {
            if (channels <= 4) {
                return "BX";
            }
            if (channels <= 32) {
                return "CX";
            }
        }
    } else {
        if (is_1ms && channels <= 8) {
            return "A";
        }
        if (is_125us) {
            if (channels <= 8) {
                return "B";
            }
            if (channels <= 64) {
                return "C";
            }
        }
    }
    return "";
}

int encoding_bit_depth(const std::string& encoding) {
    std::string upper = encoding;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "L16") {
        return 16;
    }
    if (upper == "L24" || upper == "AM824") {
        return 24;
    }
    if (upper == "L32") {
        return 32;
    }
    return 0;
}

std::vector<std::string> default_channel_labels(int channels) {
    if (channels == 1) {
        return {"M"};
    }
    if (channels == 2) {
        return {"L", "R"};
    }
    const int count = std::min(std::max(channels, 0), kMaxChannels);
    std::vector<std::string> labels;
    labels.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        labels.push_back("Ch " + std::to_string(i + 1));
    }
    return labels;
}

} // namespace discovery
} // namespace audyn
