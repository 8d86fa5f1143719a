#ifndef AUDYN_DISCOVERY_SDP_PARSER_H
#define AUDYN_DISCOVERY_SDP_PARSER_H

#include <optional>
#include <string>

#include "sap_types.h"

namespace audyn {
namespace discovery {

/**
 * @brief Parses an RFC 8866 SDP document carrying an ST 2110-30 / AES67 audio stream.
 * @details Accepts CRLF and LF line endings. Only the first audio media section
 *          contributes attributes. Never throws on malformed input.
 * @return The descriptor, or std::nullopt when the connection address or the
 *         media port is missing.
 */
std::optional<StreamDescriptor> parse_sdp(const std::string& sdp_text);

/** @brief One-line summary of a descriptor for logs and tools. */
std::string describe_stream(const StreamDescriptor& sdp);

} // namespace discovery
} // namespace audyn

#endif // AUDYN_DISCOVERY_SDP_PARSER_H
