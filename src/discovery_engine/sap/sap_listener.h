#ifndef AUDYN_DISCOVERY_SAP_LISTENER_H
#define AUDYN_DISCOVERY_SAP_LISTENER_H

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <netinet/in.h>

#include "../configuration/discovery_settings.h"
#include "sap_directory.h"
#include "sap_types.h"

namespace audyn {
namespace discovery {

using socket_t = int;
constexpr socket_t kInvalidSocket = -1;

/**
 * @brief Listens for SAP announcements on one multicast group and keeps the
 *        discovered streams in a SapDirectory.
 *
 * A receive thread waits on epoll with the configured poll interval, so stop()
 * returns within one interval. A second thread sweeps expired streams.
 */
class SapListener {
public:
    enum class State {
        Stopped,
        Starting,
        Running,
        Stopping
    };

    explicit SapListener(SapDiscoverySettings settings = SapDiscoverySettings());
    virtual ~SapListener();

    SapListener(const SapListener&) = delete;
    SapListener& operator=(const SapListener&) = delete;

    /**
     * @brief Opens the socket, joins the group and spawns the worker threads.
     * @throws std::runtime_error on socket, bind, interface, join or epoll failure.
     *         The listener is left stopped with every descriptor closed.
     */
    void start();
    /** @brief Replaces the interface and group in the settings, then starts. No effect while running. */
    void start(const std::string& bind_interface, const std::string& multicast_addr);
    /**
     * @brief Stops the worker threads and closes the socket. Safe when stopped.
     * @details From a discovery callback this only requests the stop: the state
     *          becomes Stopping and the next stop(), start() or the destructor
     *          joins the threads and releases the socket.
     */
    void stop();

    bool is_running() const;
    State state() const;

    std::vector<DiscoveredStream> get_streams(bool active_only = true) const;
    DiscoveryStatistics get_stats() const;
    std::optional<DiscoveredStream> find_stream(const std::string& multicast_addr, int port = 0) const;
    std::optional<DiscoveredStream> find_by_name(const std::string& session_name) const;

    SapDirectory::ListenerId add_callback(SapDirectory::StreamCallback callback);
    bool remove_callback(SapDirectory::ListenerId id);

    /** @brief Runs an expiry sweep immediately. @return streams marked inactive. */
    size_t cleanup_now();

    /**
     * @brief Processes one received datagram.
     * @details Entry point of the receive loop. Never throws on bad input.
     */
    void handle_datagram(const uint8_t* data, size_t size, const std::string& sender_ip, TimePoint now);

    std::string last_error() const;
    const SapDiscoverySettings& settings() const { return settings_; }

protected:
    /** @brief Spawns one worker thread running body. @throws std::system_error when the thread cannot be created. */
    virtual std::thread launch_worker(std::function<void()> body);

private:
    void receive_loop();
    void expiry_loop();
    void setup_socket();
    void close_socket();
    bool join_group(const std::string& group, bool required);
    [[noreturn]] void fail_start(const std::string& message);
    void request_stop();
    void shutdown_workers();
    bool on_worker_thread() const;
    void set_last_error(const std::string& message);

    SapDiscoverySettings settings_;
    std::string logger_prefix_;
    std::unique_ptr<SapDirectory> directory_;

    std::atomic<State> state_{State::Stopped};
    std::atomic<bool> stop_requested_{false};
    std::mutex lifecycle_mutex_;

    socket_t socket_fd_ = kInvalidSocket;
    int epoll_fd_ = -1;
    unsigned int interface_index_ = 0;
    std::vector<struct ip_mreqn> joined_groups_;

    std::thread receive_thread_;
    std::thread expiry_thread_;
    std::mutex expiry_mutex_;
    std::condition_variable expiry_cv_;

    std::atomic<uint64_t> packets_received_{0};
    std::atomic<uint64_t> packets_invalid_{0};
    std::atomic<uint64_t> announcements_{0};
    std::atomic<uint64_t> deletions_{0};
    std::atomic<uint64_t> sdp_parse_errors_{0};

    mutable std::mutex error_mutex_;
    std::string last_error_;
};

} // namespace discovery
} // namespace audyn

#endif // AUDYN_DISCOVERY_SAP_LISTENER_H
