#ifndef AUDYN_DISCOVERY_SAP_DIRECTORY_H
#define AUDYN_DISCOVERY_SAP_DIRECTORY_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "sap_types.h"

namespace audyn {
namespace discovery {

/**
 * Registry of streams discovered through SAP.
 *
 * Records are kept in first-seen order and are never removed; deletion and expiry
 * only clear the active flag so a later announcement reuses the same record.
 * Every access to the records happens under mutex_. Subscriber callbacks run after
 * the lock is released.
 */
class SapDirectory {
public:
    using StreamCallback = std::function<void(DiscoveryEvent event, const DiscoveredStream& stream)>;
    using ListenerId = uint64_t;

    static constexpr size_t kMaxListeners = 32;

    SapDirectory() = default;

    SapDirectory(const SapDirectory&) = delete;
    SapDirectory& operator=(const SapDirectory&) = delete;

    /**
     * @brief Registers a subscriber.
     * @throws std::runtime_error when kMaxListeners are already registered.
     */
    ListenerId add_callback(StreamCallback callback);
    bool remove_callback(ListenerId id);
    size_t callback_count() const;

    /** @return true if the stream was not known before (a NEW event was emitted). */
    bool upsert(const std::string& id,
                const StreamDescriptor& sdp,
                const std::string& origin_ip,
                TimePoint now);

    /** @return true if the id was known. Unknown ids are ignored. */
    bool mark_deleted(const std::string& id, TimePoint now);

    /** @return number of streams that went inactive. */
    size_t sweep_expired(TimePoint now, std::chrono::seconds timeout);

    std::vector<DiscoveredStream> list(bool active_only) const;
    bool find_by_address(const std::string& multicast_addr, int port, DiscoveredStream& out) const;
    bool find_by_name(const std::string& session_name, DiscoveredStream& out) const;
    bool get(const std::string& id, DiscoveredStream& out) const;

    size_t size() const;
    int active_count() const;

private:
    using PendingEvent = std::pair<DiscoveryEvent, DiscoveredStream>;

    void dispatch(const std::vector<PendingEvent>& events) const;

    mutable std::mutex mutex_;
    std::vector<DiscoveredStream> streams_;
    std::unordered_map<std::string, size_t> index_by_id_;

    mutable std::mutex listeners_mutex_;
    std::vector<std::pair<ListenerId, StreamCallback>> listeners_;
    ListenerId next_listener_id_ = 1;
};

} // namespace discovery
} // namespace audyn

#endif // AUDYN_DISCOVERY_SAP_DIRECTORY_H
