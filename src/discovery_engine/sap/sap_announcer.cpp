#include "sap_announcer.h"

#include "../utils/cpp_logger.h"
#include "sap_packet.h"

#include <arpa/inet.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace audyn {
namespace discovery {

SapAnnouncer::SapAnnouncer(const std::string& dest_addr, int dest_port, int ttl)
    : dest_addr_(dest_addr), dest_port_(dest_port) {
    if (dest_port <= 0 || dest_port > 65535) {
        throw std::invalid_argument("Invalid SAP destination port: " + std::to_string(dest_port));
    }
    memset(&dest_, 0, sizeof(dest_));
    dest_.sin_family = AF_INET;
    dest_.sin_port = htons(static_cast<uint16_t>(dest_port));
    if (inet_pton(AF_INET, dest_addr.c_str(), &dest_.sin_addr) != 1) {
        throw std::invalid_argument("Invalid SAP destination address: " + dest_addr);
    }

    socket_fd_ = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_UDP);
    if (socket_fd_ < 0) {
        throw std::runtime_error(std::string("Failed to create SAP socket: ") + strerror(errno));
    }

    if (setsockopt(socket_fd_, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl)) < 0) {
        LOG_CPP_WARNING("[SapAnnouncer:%s] Failed to set multicast TTL on SAP socket. Announcements may not work.",
                        dest_addr_.c_str());
    }
    unsigned char loopch = 1;
    if (setsockopt(socket_fd_, IPPROTO_IP, IP_MULTICAST_LOOP, &loopch, sizeof(loopch)) < 0) {
        LOG_CPP_WARNING("[SapAnnouncer:%s] Failed to set IP_MULTICAST_LOOP", dest_addr_.c_str());
    }
    LOG_CPP_INFO("[SapAnnouncer:%s] Added SAP destination: %s:%d (ttl %d)",
                 dest_addr_.c_str(), dest_addr_.c_str(), dest_port_, ttl);
}

SapAnnouncer::~SapAnnouncer() {
    if (socket_fd_ >= 0) {
        close(socket_fd_);
        socket_fd_ = -1;
    }
}

size_t SapAnnouncer::send(const std::vector<uint8_t>& packet) {
    ssize_t sent_bytes = sendto(socket_fd_,
                                packet.data(),
                                packet.size(),
                                0,
                                reinterpret_cast<const struct sockaddr*>(&dest_),
                                sizeof(dest_));
    if (sent_bytes < 0) {
        const std::string reason = strerror(errno);
        LOG_CPP_ERROR("[SapAnnouncer:%s] SAP sendto failed: %s", dest_addr_.c_str(), reason.c_str());
        throw std::runtime_error("SAP sendto " + dest_addr_ + " failed: " + reason);
    }
    if (static_cast<size_t>(sent_bytes) != packet.size()) {
        LOG_CPP_ERROR("[SapAnnouncer:%s] SAP sendto sent partial data: %zd/%zu",
                      dest_addr_.c_str(), sent_bytes, packet.size());
        throw std::runtime_error("SAP sendto " + dest_addr_ + " sent a partial datagram");
    }
    return static_cast<size_t>(sent_bytes);
}

size_t SapAnnouncer::announce(const std::string& sdp, const std::string& origin_ip, uint16_t msg_id_hash, bool deletion) {
    const std::vector<uint8_t> packet = encode_sap_packet(sdp, origin_ip, msg_id_hash, deletion);
    LOG_CPP_DEBUG("[SapAnnouncer:%s] Sending SAP %s: %s",
                  dest_addr_.c_str(), deletion ? "deletion" : "announcement", sdp.c_str());
    return send(packet);
}

} // namespace discovery
} // namespace audyn
