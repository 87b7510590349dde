#pragma once

#include "dcmx/common.hpp"
#include "dcmx/error.hpp"
#include "network/peer.hpp"
#include "core/track/track.hpp"
#include <string>
#include <vector>
#include <chrono>

namespace dcmx::network {

/**
 * DiscoveryConfig - Bounds for every outbound call
 *
 * Each operation timeout caps the whole exchange, from connect to the last
 * body byte; connect_timeout additionally caps connection setup.
 */
struct DiscoveryConfig {
    std::chrono::seconds connect_timeout{constants::CONNECT_TIMEOUT_SECONDS};
    std::chrono::seconds discovery_timeout{constants::DISCOVERY_TIMEOUT_SECONDS};
    std::chrono::seconds ping_timeout{constants::PING_TIMEOUT_SECONDS};
    std::chrono::seconds content_timeout{constants::CONTENT_TIMEOUT_SECONDS};
    size_t max_content_size{constants::MAX_CONTENT_SIZE};
};

/**
 * DiscoveryProtocol - Client side of the node HTTP protocol
 *
 * Stateless: each call opens its own connection, so one instance may be
 * shared by any number of threads. Failures come back as errors classified
 * by is_peer_unreachable() (transport) or is_protocol_violation() (the peer
 * answered but not with what the protocol requires).
 */
class DiscoveryProtocol {
public:
    explicit DiscoveryProtocol(DiscoveryConfig config = {});

    /**
     * Discovery handshake: announce self to host:port and learn who answers
     *
     * POSTs {"peer": self} to /discover. On success returns a record for the
     * responding node whose available content is exactly the returned track
     * list, touched now.
     */
    Result<PeerRecord> connect(const std::string& host, uint16_t port,
                               const PeerRecord& self) const;

    /**
     * Liveness check against /ping
     */
    Result<void> ping(const PeerRecord& peer) const;

    /**
     * Fetch raw bytes of one object from /content/{hash}
     *
     * The payload is hashed before it is returned; a peer serving bytes that
     * do not match is a protocol violation. Bodies beyond max_content_size are
     * abandoned with ContentTooLarge.
     */
    Result<bytes> request_content(const PeerRecord& peer, const ContentHash& hash) const;

    /**
     * Peers the remote node knows about
     */
    Result<std::vector<PeerRecord>> get_peers(const PeerRecord& peer) const;

    /**
     * Full track records the remote node holds
     */
    Result<std::vector<core::Track>> get_tracks(const PeerRecord& peer) const;

    const DiscoveryConfig& config() const { return config_; }

private:
    DiscoveryConfig config_;
};

} // namespace dcmx::network
