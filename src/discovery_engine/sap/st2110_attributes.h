/**
 * @file st2110_attributes.h
 * @brief Helpers for SMPTE ST 2110-30 / ST 2110-10 SDP attributes.
 * @details Channel-order expansion, PTP reference clock and media clock decoding,
 *          and conformance level classification. All functions are pure.
 */
#ifndef AUDYN_DISCOVERY_ST2110_ATTRIBUTES_H
#define AUDYN_DISCOVERY_ST2110_ATTRIBUTES_H

#include <string>
#include <vector>

namespace audyn {
namespace discovery {

/**
 * @brief Expands a `channel-order` value into per-channel labels.
 * @param channel_order e.g. "SMPTE2110.(51,ST)".
 * @return Labels in symbol order, e.g. {L,R,C,LFE,Ls,Rs,L,R}. Empty when no
 *         parenthesised symbol list is present. At most kMaxChannels labels;
 *         `U<n>` outside 1..kMaxChannels contributes nothing.
 */
std::vector<std::string> expand_channel_order(const std::string& channel_order);

/**
 * @brief Labels for a single SMPTE 2110 channel grouping symbol.
 * @return true if the symbol is one of the defined groups (M, DM, ST, LtRt, 51, 71, 222, SGRP).
 */
bool lookup_channel_group(const std::string& symbol, std::vector<std::string>& labels);

/**
 * @brief Extracts the grandmaster id and domain from a `ts-refclk` value.
 * @details Recognises `ptp=IEEE1588-<ver>:<GM-ID>:<domain>`. The grandmaster is
 *          returned upper-cased.
 * @return true when the value matched; outputs are untouched otherwise.
 */
bool parse_ts_refclk(const std::string& ts_refclk, std::string& grandmaster, int& domain);

/**
 * @brief Decodes a `mediaclk` value.
 * @param offset Set to N for `direct=N`, -1 otherwise.
 * @return true when the media clock is `direct=0` (ST 2110 compliant).
 */
bool parse_mediaclk(const std::string& mediaclk, int& offset);

/**
 * @brief ST 2110-30 conformance level for a channel count, packet time and sample rate.
 * @return "A", "B", "C", "AX", "BX", "CX" or an empty string when non-conformant.
 */
std::string conformance_level(int channels, double ptime_ms, int sample_rate);

/** @brief Bits per sample for an RTP encoding name (L16, L24, L32, AM824), 0 if unknown. */
int encoding_bit_depth(const std::string& encoding);

/** @brief Default labels when no channel-order is given: M / L,R / "Ch 1".."Ch N", N capped at kMaxChannels. */
std::vector<std::string> default_channel_labels(int channels);

} // namespace discovery
} // namespace audyn

#endif // AUDYN_DISCOVERY_ST2110_ATTRIBUTES_H
