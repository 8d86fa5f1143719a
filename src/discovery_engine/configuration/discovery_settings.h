#ifndef AUDYN_DISCOVERY_SETTINGS_H
#define AUDYN_DISCOVERY_SETTINGS_H

#include <cstddef>
#include <optional>
#include <string>

#include "../sap/sap_types.h"

namespace audyn {
namespace discovery {

inline constexpr int kDefaultStreamTimeoutSec = 300;
inline constexpr int kDefaultSweepIntervalSec = 60;
inline constexpr long kDefaultPollIntervalMs = 1000;
inline constexpr std::size_t kDefaultReceiveBufferBytes = 65536;

struct SapDiscoverySettings {
    std::string bind_interface;                    // Empty joins on the default interface
    std::string multicast_addr = kSapAddrAdmin;
    int port = kSapPort;
    int stream_timeout_sec = kDefaultStreamTimeoutSec;
    int sweep_interval_sec = kDefaultSweepIntervalSec;
    long poll_interval_ms = kDefaultPollIntervalMs; // Upper bound on stop latency
    std::size_t receive_buffer_bytes = kDefaultReceiveBufferBytes;
    bool join_admin_scope_with_global = true;      // Also listen on 239.255.255.255 when configured for global scope
};

/**
 * Partial update coming from the control panel. Unset fields keep their current value.
 */
struct SapDiscoverySettingsUpdate {
    std::optional<std::string> bind_interface;
    std::optional<std::string> multicast_addr;
    std::optional<int> port;
    std::optional<int> stream_timeout_sec;
    std::optional<int> sweep_interval_sec;
    std::optional<long> poll_interval_ms;
    std::optional<std::size_t> receive_buffer_bytes;
    std::optional<bool> join_admin_scope_with_global;
};

inline SapDiscoverySettings sanitize_settings(SapDiscoverySettings settings) {
    if (settings.multicast_addr.empty()) {
        settings.multicast_addr = kSapAddrAdmin;
    }
    if (settings.port <= 0 || settings.port > 65535) {
        settings.port = kSapPort;
    }
    if (settings.stream_timeout_sec <= 0) {
        settings.stream_timeout_sec = kDefaultStreamTimeoutSec;
    }
    if (settings.sweep_interval_sec <= 0) {
        settings.sweep_interval_sec = kDefaultSweepIntervalSec;
    }
    if (settings.poll_interval_ms <= 0) {
        settings.poll_interval_ms = kDefaultPollIntervalMs;
    }
    if (settings.receive_buffer_bytes < 2048) {
        settings.receive_buffer_bytes = kDefaultReceiveBufferBytes;
    }
    return settings;
}

inline SapDiscoverySettings apply_settings_update(const SapDiscoverySettings& current,
                                                  const SapDiscoverySettingsUpdate& update) {
    SapDiscoverySettings merged = current;
    if (update.bind_interface) {
        merged.bind_interface = *update.bind_interface;
    }
    if (update.multicast_addr) {
        merged.multicast_addr = *update.multicast_addr;
    }
    if (update.port) {
        merged.port = *update.port;
    }
    if (update.stream_timeout_sec) {
        merged.stream_timeout_sec = *update.stream_timeout_sec;
    }
    if (update.sweep_interval_sec) {
        merged.sweep_interval_sec = *update.sweep_interval_sec;
    }
    if (update.poll_interval_ms) {
        merged.poll_interval_ms = *update.poll_interval_ms;
    }
    if (update.receive_buffer_bytes) {
        merged.receive_buffer_bytes = *update.receive_buffer_bytes;
    }
    if (update.join_admin_scope_with_global) {
        merged.join_admin_scope_with_global = *update.join_admin_scope_with_global;
    }
    return sanitize_settings(merged);
}

} // namespace discovery
} // namespace audyn

#endif // AUDYN_DISCOVERY_SETTINGS_H
