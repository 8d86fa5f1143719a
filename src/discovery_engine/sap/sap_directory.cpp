#include "sap_directory.h"

#include <stdexcept>

#include "../utils/cpp_logger.h"

namespace audyn {
namespace discovery {

const char* discovery_event_name(DiscoveryEvent event) {
    switch (event) {
        case DiscoveryEvent::NEW:
            return "new";
        case DiscoveryEvent::UPDATE:
            return "update";
        case DiscoveryEvent::DELETE:
            return "delete";
        case DiscoveryEvent::EXPIRE:
            return "expire";
    }
    return "unknown";
}

SapDirectory::ListenerId SapDirectory::add_callback(StreamCallback callback) {
    if (!callback) {
        throw std::invalid_argument("SapDirectory callback must be callable");
    }
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    if (listeners_.size() >= kMaxListeners) {
        throw std::runtime_error("SapDirectory listener limit reached (" + std::to_string(kMaxListeners) + ")");
    }
    const ListenerId id = next_listener_id_++;
    listeners_.emplace_back(id, std::move(callback));
    return id;
}

bool SapDirectory::remove_callback(ListenerId id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
        if (it->first == id) {
            listeners_.erase(it);
            return true;
        }
    }
    return false;
}

size_t SapDirectory::callback_count() const {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    return listeners_.size();
}

bool SapDirectory::upsert(const std::string& id,
                          const StreamDescriptor& sdp,
                          const std::string& origin_ip,
                          TimePoint now) {
    std::vector<PendingEvent> events;
    bool is_new = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_by_id_.find(id);
        if (it == index_by_id_.end()) {
            DiscoveredStream stream;
            stream.id = id;
            stream.sdp = sdp;
            stream.origin_ip = origin_ip;
            stream.first_seen = now;
            stream.last_seen = now;
            stream.active = true;
            index_by_id_.emplace(id, streams_.size());
            streams_.push_back(stream);
            events.emplace_back(DiscoveryEvent::NEW, std::move(stream));
            is_new = true;
        } else {
            DiscoveredStream& stream = streams_[it->second];
            stream.sdp = sdp;
            stream.last_seen = now;
            stream.active = true;
            events.emplace_back(DiscoveryEvent::UPDATE, stream);
        }
    }
    dispatch(events);
    return is_new;
}

bool SapDirectory::mark_deleted(const std::string& id, TimePoint now) {
    std::vector<PendingEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_by_id_.find(id);
        if (it == index_by_id_.end()) {
            return false;
        }
        DiscoveredStream& stream = streams_[it->second];
        stream.active = false;
        LOG_CPP_DEBUG("SapDirectory: %s deleted at %lld", id.c_str(),
                      static_cast<long long>(std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count()));
        events.emplace_back(DiscoveryEvent::DELETE, stream);
    }
    dispatch(events);
    return true;
}

size_t SapDirectory::sweep_expired(TimePoint now, std::chrono::seconds timeout) {
    std::vector<PendingEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& stream : streams_) {
            if (stream.active && (now - stream.last_seen) > timeout) {
                stream.active = false;
                events.emplace_back(DiscoveryEvent::EXPIRE, stream);
            }
        }
    }
    for (const auto& event : events) {
        LOG_CPP_INFO("SapDirectory: stream expired: %s (%s)", event.second.sdp.session_name.c_str(), event.second.id.c_str());
    }
    dispatch(events);
    return events.size();
}

std::vector<DiscoveredStream> SapDirectory::list(bool active_only) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DiscoveredStream> result;
    result.reserve(streams_.size());
    for (const auto& stream : streams_) {
        if (!active_only || stream.active) {
            result.push_back(stream);
        }
    }
    return result;
}

bool SapDirectory::find_by_address(const std::string& multicast_addr, int port, DiscoveredStream& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& stream : streams_) {
        if (stream.sdp.multicast_addr == multicast_addr && (port == 0 || stream.sdp.port == port)) {
            out = stream;
            return true;
        }
    }
    return false;
}

bool SapDirectory::find_by_name(const std::string& session_name, DiscoveredStream& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& stream : streams_) {
        if (stream.sdp.session_name == session_name) {
            out = stream;
            return true;
        }
    }
    return false;
}

bool SapDirectory::get(const std::string& id, DiscoveredStream& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_by_id_.find(id);
    if (it == index_by_id_.end()) {
        return false;
    }
    out = streams_[it->second];
    return true;
}

size_t SapDirectory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return streams_.size();
}

int SapDirectory::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    int count = 0;
    for (const auto& stream : streams_) {
        if (stream.active) {
            ++count;
        }
    }
    return count;
}

void SapDirectory::dispatch(const std::vector<PendingEvent>& events) const {
    if (events.empty()) {
        return;
    }

    std::vector<std::pair<ListenerId, StreamCallback>> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners = listeners_;
    }

    for (const auto& event : events) {
        for (const auto& listener : listeners) {
            try {
                listener.second(event.first, event.second);
            } catch (const std::exception& ex) {
                LOG_CPP_ERROR("SapDirectory: listener %llu failed on %s event for %s: %s",
                              static_cast<unsigned long long>(listener.first),
                              discovery_event_name(event.first),
                              event.second.id.c_str(),
                              ex.what());
            }
        }
    }
}

} // namespace discovery
} // namespace audyn
