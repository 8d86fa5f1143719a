#include "sap_listener.h"

#include "../utils/cpp_logger.h"
#include "sap_packet.h"
#include "sdp_parser.h"

#include <arpa/inet.h>
#include <net/if.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>

namespace audyn {
namespace discovery {

namespace {

constexpr int kMaxEvents = 16;

// Listener whose receive or expiry loop runs on the current thread, if any.
thread_local const SapListener* t_worker_owner = nullptr;

std::string errno_text(int err) {
    return std::string(strerror(err));
}

} // namespace

SapListener::SapListener(SapDiscoverySettings settings)
    : settings_(sanitize_settings(std::move(settings))),
      logger_prefix_("[SapListener:" + settings_.multicast_addr + ":" + std::to_string(settings_.port) + "]"),
      directory_(std::make_unique<SapDirectory>()) {}

SapListener::~SapListener() {
    stop();
}

void SapListener::start() {
    if (on_worker_thread()) {
        throw std::runtime_error("SapListener::start() cannot be called from a discovery callback");
    }
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (state_ == State::Stopping) {
        // Stop was requested from a callback; finish it before starting again.
        shutdown_workers();
    }
    if (state_ != State::Stopped) {
        return;
    }
    LOG_CPP_INFO("%s Starting SAP listener.", logger_prefix_.c_str());
    state_ = State::Starting;
    stop_requested_ = false;

    setup_socket();

    try {
        receive_thread_ = launch_worker([this] { receive_loop(); });
        expiry_thread_ = launch_worker([this] { expiry_loop(); });
    } catch (const std::system_error& ex) {
        request_stop();
        if (receive_thread_.joinable()) {
            receive_thread_.join();
        }
        if (expiry_thread_.joinable()) {
            expiry_thread_.join();
        }
        fail_start(std::string("Failed to start worker thread: ") + ex.what());
    }

    State expected = State::Starting;
    if (!state_.compare_exchange_strong(expected, State::Running)) {
        LOG_CPP_INFO("%s Stop requested while starting.", logger_prefix_.c_str());
        return;
    }
    LOG_CPP_INFO("%s SAP discovery started on %s:%d",
                 logger_prefix_.c_str(), settings_.multicast_addr.c_str(), settings_.port);
}

void SapListener::start(const std::string& bind_interface, const std::string& multicast_addr) {
    if (on_worker_thread()) {
        throw std::runtime_error("SapListener::start() cannot be called from a discovery callback");
    }
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (state_ == State::Running || state_ == State::Starting) {
            return;
        }
        settings_.bind_interface = bind_interface;
        settings_.multicast_addr = multicast_addr.empty() ? std::string(kSapAddrAdmin) : multicast_addr;
        logger_prefix_ = "[SapListener:" + settings_.multicast_addr + ":" + std::to_string(settings_.port) + "]";
    }
    start();
}

void SapListener::stop() {
    if (on_worker_thread()) {
        // A worker cannot join itself. Flag the stop; the next stop(), start()
        // or the destructor joins the threads and closes the socket.
        State expected = State::Running;
        if (!state_.compare_exchange_strong(expected, State::Stopping)) {
            expected = State::Starting;
            state_.compare_exchange_strong(expected, State::Stopping);
        }
        request_stop();
        LOG_CPP_INFO("%s Stop requested from a worker thread.", logger_prefix_.c_str());
        return;
    }

    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (state_ == State::Stopped) {
        return;
    }
    LOG_CPP_INFO("%s Stopping SAP listener.", logger_prefix_.c_str());
    shutdown_workers();
    LOG_CPP_INFO("%s SAP discovery stopped.", logger_prefix_.c_str());
}

void SapListener::request_stop() {
    {
        std::lock_guard<std::mutex> expiry_lock(expiry_mutex_);
        stop_requested_ = true;
    }
    expiry_cv_.notify_all();
}

// Caller holds lifecycle_mutex_ and is not a worker thread.
void SapListener::shutdown_workers() {
    state_ = State::Stopping;
    request_stop();

    if (receive_thread_.joinable()) {
        receive_thread_.join();
    }
    if (expiry_thread_.joinable()) {
        expiry_thread_.join();
    }
    close_socket();
    state_ = State::Stopped;
}

std::thread SapListener::launch_worker(std::function<void()> body) {
    return std::thread([this, body = std::move(body)] {
        t_worker_owner = this;
        body();
        t_worker_owner = nullptr;
    });
}

bool SapListener::on_worker_thread() const {
    return t_worker_owner == this;
}

bool SapListener::is_running() const {
    return state_ == State::Running;
}

SapListener::State SapListener::state() const {
    return state_;
}

std::vector<DiscoveredStream> SapListener::get_streams(bool active_only) const {
    return directory_->list(active_only);
}

DiscoveryStatistics SapListener::get_stats() const {
    DiscoveryStatistics stats;
    stats.packets_received = packets_received_.load();
    stats.packets_invalid = packets_invalid_.load();
    stats.announcements = announcements_.load();
    stats.deletions = deletions_.load();
    stats.sdp_parse_errors = sdp_parse_errors_.load();
    stats.active_streams = directory_->active_count();
    return stats;
}

std::optional<DiscoveredStream> SapListener::find_stream(const std::string& multicast_addr, int port) const {
    DiscoveredStream stream;
    if (!directory_->find_by_address(multicast_addr, port, stream)) {
        return std::nullopt;
    }
    return stream;
}

std::optional<DiscoveredStream> SapListener::find_by_name(const std::string& session_name) const {
    DiscoveredStream stream;
    if (!directory_->find_by_name(session_name, stream)) {
        return std::nullopt;
    }
    return stream;
}

SapDirectory::ListenerId SapListener::add_callback(SapDirectory::StreamCallback callback) {
    return directory_->add_callback(std::move(callback));
}

bool SapListener::remove_callback(SapDirectory::ListenerId id) {
    return directory_->remove_callback(id);
}

size_t SapListener::cleanup_now() {
    return directory_->sweep_expired(Clock::now(), std::chrono::seconds(settings_.stream_timeout_sec));
}

std::string SapListener::last_error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
}

void SapListener::set_last_error(const std::string& message) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_ = message;
}

void SapListener::handle_datagram(const uint8_t* data, size_t size, const std::string& sender_ip, TimePoint now) {
    packets_received_++;

    SapPacket packet;
    const SapDecodeStatus status = decode_sap_packet(data, size, sender_ip, packet);
    if (status != SapDecodeStatus::OK) {
        packets_invalid_++;
        LOG_CPP_DEBUG("%s Dropping SAP packet from %s (%zu bytes): %s",
                      logger_prefix_.c_str(), sender_ip.c_str(), size, sap_decode_status_name(status));
        return;
    }

    const std::string stream_id = packet.stream_id();

    if (packet.is_deletion) {
        DiscoveredStream existing;
        if (directory_->get(stream_id, existing) && directory_->mark_deleted(stream_id, now)) {
            deletions_++;
            LOG_CPP_INFO("%s Stream deleted: %s (%s)",
                         logger_prefix_.c_str(), existing.sdp.session_name.c_str(), stream_id.c_str());
        } else {
            LOG_CPP_DEBUG("%s Ignoring deletion for unknown stream %s", logger_prefix_.c_str(), stream_id.c_str());
        }
        return;
    }

    std::optional<StreamDescriptor> sdp = parse_sdp(packet.payload);
    if (!sdp) {
        sdp_parse_errors_++;
        LOG_CPP_DEBUG("%s SDP parse failed for %s from %s", logger_prefix_.c_str(), stream_id.c_str(), sender_ip.c_str());
        return;
    }

    if (directory_->upsert(stream_id, *sdp, packet.origin, now)) {
        announcements_++;
        LOG_CPP_INFO("%s Discovered stream: %s", logger_prefix_.c_str(), describe_stream(*sdp).c_str());
    } else {
        LOG_CPP_DEBUG("%s Refreshed stream %s", logger_prefix_.c_str(), stream_id.c_str());
    }
}

void SapListener::receive_loop() {
    LOG_CPP_INFO("%s SAP listener thread started.", logger_prefix_.c_str());
    std::vector<uint8_t> buffer(settings_.receive_buffer_bytes);
    struct epoll_event events[kMaxEvents];
    const int timeout_ms = static_cast<int>(settings_.poll_interval_ms);

    while (!stop_requested_) {
        int n_events = epoll_wait(epoll_fd_, events, kMaxEvents, timeout_ms);

        if (stop_requested_) {
            break;
        }

        if (n_events < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_CPP_ERROR("%s epoll_wait() error: %s", logger_prefix_.c_str(), strerror(errno));
            continue;
        }

        for (int i = 0; i < n_events; ++i) {
            if (!(events[i].events & EPOLLIN)) {
                continue;
            }
            struct sockaddr_in cliaddr;
            socklen_t len = sizeof(cliaddr);
            // MSG_TRUNC makes recvfrom report the full datagram length.
            ssize_t n_received = recvfrom(events[i].data.fd, buffer.data(), buffer.size(), MSG_TRUNC,
                                          reinterpret_cast<struct sockaddr*>(&cliaddr), &len);
            if (n_received < 0) {
                if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                    LOG_CPP_ERROR("%s recvfrom() error: %s", logger_prefix_.c_str(), strerror(errno));
                }
                continue;
            }
            char client_ip_str[INET_ADDRSTRLEN] = {0};
            inet_ntop(AF_INET, &(cliaddr.sin_addr), client_ip_str, INET_ADDRSTRLEN);
            if (static_cast<size_t>(n_received) > buffer.size()) {
                packets_received_++;
                packets_invalid_++;
                LOG_CPP_DEBUG("%s Dropping truncated SAP packet from %s (%zd bytes, buffer %zu)",
                              logger_prefix_.c_str(), client_ip_str, n_received, buffer.size());
                continue;
            }
            try {
                handle_datagram(buffer.data(), static_cast<size_t>(n_received), client_ip_str, Clock::now());
            } catch (const std::exception& ex) {
                LOG_CPP_ERROR("%s Error while handling SAP packet from %s: %s",
                              logger_prefix_.c_str(), client_ip_str, ex.what());
            }
        }
    }
    LOG_CPP_INFO("%s SAP listener thread finished.", logger_prefix_.c_str());
}

void SapListener::expiry_loop() {
    const auto interval = std::chrono::seconds(settings_.sweep_interval_sec);
    std::unique_lock<std::mutex> lock(expiry_mutex_);
    while (!stop_requested_) {
        if (expiry_cv_.wait_for(lock, interval, [this] { return stop_requested_.load(); })) {
            break;
        }
        lock.unlock();
        const size_t expired = cleanup_now();
        if (expired > 0) {
            LOG_CPP_DEBUG("%s Expiry sweep marked %zu stream(s) inactive", logger_prefix_.c_str(), expired);
        }
        lock.lock();
    }
}

void SapListener::fail_start(const std::string& message) {
    set_last_error(message);
    LOG_CPP_ERROR("%s %s", logger_prefix_.c_str(), message.c_str());
    close_socket();
    state_ = State::Stopped;
    throw std::runtime_error(message);
}

bool SapListener::join_group(const std::string& group, bool required) {
    struct ip_mreqn mreq;
    memset(&mreq, 0, sizeof(mreq));
    if (inet_pton(AF_INET, group.c_str(), &mreq.imr_multiaddr) != 1) {
        if (required) {
            fail_start("Failed to parse multicast group address " + group);
        }
        LOG_CPP_WARNING("%s Failed to parse multicast group address %s", logger_prefix_.c_str(), group.c_str());
        return false;
    }
    mreq.imr_address.s_addr = htonl(INADDR_ANY);
    mreq.imr_ifindex = static_cast<int>(interface_index_);

    if (setsockopt(socket_fd_, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) < 0) {
        const std::string reason = errno_text(errno);
        if (required) {
            fail_start("Failed to join multicast group " + group + ": " + reason);
        }
        LOG_CPP_WARNING("%s Failed to join multicast group %s: %s",
                        logger_prefix_.c_str(), group.c_str(), reason.c_str());
        return false;
    }
    joined_groups_.push_back(mreq);
    LOG_CPP_INFO("%s Successfully joined multicast group %s", logger_prefix_.c_str(), group.c_str());
    return true;
}

void SapListener::setup_socket() {
    struct in_addr group_addr;
    if (inet_pton(AF_INET, settings_.multicast_addr.c_str(), &group_addr) != 1 ||
        !IN_MULTICAST(ntohl(group_addr.s_addr))) {
        fail_start("Invalid multicast address: " + settings_.multicast_addr);
    }

    interface_index_ = 0;
    if (!settings_.bind_interface.empty()) {
        interface_index_ = if_nametoindex(settings_.bind_interface.c_str());
        if (interface_index_ == 0) {
            fail_start("Unknown network interface '" + settings_.bind_interface + "': " + errno_text(errno));
        }
    }

    socket_fd_ = socket(AF_INET, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (socket_fd_ < 0) {
        fail_start("Failed to create socket: " + errno_text(errno));
    }

    int reuse = 1;
    if (setsockopt(socket_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
        LOG_CPP_WARNING("%s Failed to set SO_REUSEADDR", logger_prefix_.c_str());
    }
#ifdef SO_REUSEPORT
    if (setsockopt(socket_fd_, SOL_SOCKET, SO_REUSEPORT, &reuse, sizeof(reuse)) < 0) {
        LOG_CPP_WARNING("%s Failed to set SO_REUSEPORT", logger_prefix_.c_str());
    }
#endif

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(static_cast<uint16_t>(settings_.port));

    if (bind(socket_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        fail_start("Failed to bind to port " + std::to_string(settings_.port) + ": " + errno_text(errno));
    }
    LOG_CPP_INFO("%s Successfully set up listener on 0.0.0.0:%d", logger_prefix_.c_str(), settings_.port);

    join_group(settings_.multicast_addr, true);
    if (settings_.join_admin_scope_with_global && settings_.multicast_addr == kSapAddrGlobal) {
        join_group(kSapAddrAdmin, false);
    }

    unsigned char loopch = 1;
    if (setsockopt(socket_fd_, IPPROTO_IP, IP_MULTICAST_LOOP, &loopch, sizeof(loopch)) < 0) {
        LOG_CPP_WARNING("%s Failed to set IP_MULTICAST_LOOP", logger_prefix_.c_str());
    }

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ == -1) {
        fail_start("Failed to create epoll instance: " + errno_text(errno));
    }

    struct epoll_event event;
    memset(&event, 0, sizeof(event));
    event.events = EPOLLIN;
    event.data.fd = socket_fd_;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, socket_fd_, &event) == -1) {
        fail_start("Failed to add socket to epoll: " + errno_text(errno));
    }
}

void SapListener::close_socket() {
    if (epoll_fd_ != -1) {
        close(epoll_fd_);
        epoll_fd_ = -1;
    }
    if (socket_fd_ != kInvalidSocket) {
        for (const auto& mreq : joined_groups_) {
            if (setsockopt(socket_fd_, IPPROTO_IP, IP_DROP_MEMBERSHIP, &mreq, sizeof(mreq)) < 0) {
                LOG_CPP_WARNING("%s Failed to drop multicast membership: %s", logger_prefix_.c_str(), strerror(errno));
            }
        }
        close(socket_fd_);
        socket_fd_ = kInvalidSocket;
    }
    joined_groups_.clear();
    LOG_CPP_INFO("%s All SAP sockets closed.", logger_prefix_.c_str());
}

} // namespace discovery
} // namespace audyn
