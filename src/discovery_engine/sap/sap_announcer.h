#ifndef AUDYN_DISCOVERY_SAP_ANNOUNCER_H
#define AUDYN_DISCOVERY_SAP_ANNOUNCER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <netinet/in.h>

#include "sap_types.h"

namespace audyn {
namespace discovery {

constexpr int kDefaultAnnounceTtl = 4;

/**
 * @brief UDP socket that sends SAP datagrams to one multicast destination.
 * @details Multicast TTL and loopback are set at construction so that a listener
 *          on the same host sees the announcements.
 */
class SapAnnouncer {
public:
    /** @throws std::invalid_argument on a malformed destination, std::runtime_error if the socket cannot be created. */
    explicit SapAnnouncer(const std::string& dest_addr = kSapAddrAdmin,
                          int dest_port = kSapPort,
                          int ttl = kDefaultAnnounceTtl);
    ~SapAnnouncer();

    SapAnnouncer(const SapAnnouncer&) = delete;
    SapAnnouncer& operator=(const SapAnnouncer&) = delete;

    /**
     * @return Bytes sent.
     * @throws std::runtime_error when sendto fails or sends a partial datagram.
     */
    size_t send(const std::vector<uint8_t>& packet);

    /** @brief Encodes and sends one announcement (or deletion) for an SDP document. */
    size_t announce(const std::string& sdp, const std::string& origin_ip, uint16_t msg_id_hash, bool deletion = false);

    const std::string& destination() const { return dest_addr_; }
    int port() const { return dest_port_; }

private:
    std::string dest_addr_;
    int dest_port_;
    int socket_fd_ = -1;
    struct sockaddr_in dest_{};
};

} // namespace discovery
} // namespace audyn

#endif // AUDYN_DISCOVERY_SAP_ANNOUNCER_H
