#pragma once

#include "dcmx/common.hpp"
#include "dcmx/error.hpp"
#include "dcmx/time_utils.hpp"
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <chrono>

namespace dcmx::network {

/**
 * PeerRecord - What this node knows about another node in the mesh
 *
 * Holds the peer's address and the content hashes it asserted it can serve.
 * Pure bookkeeping: nothing here touches the network.
 */
class PeerRecord {
public:
    /**
     * New record with a freshly generated peer id, touched now
     */
    PeerRecord(std::string host, uint16_t port);

    /**
     * Record for a known peer id
     */
    PeerRecord(std::string peer_id, std::string host, uint16_t port);

    const std::string& peer_id() const { return peer_id_; }
    const std::string& host() const { return host_; }
    uint16_t port() const { return port_; }

    /**
     * "host:port"
     */
    std::string address() const;

    // Advertised content
    void add_content(const ContentHash& hash);
    void remove_content(const ContentHash& hash);
    bool has_content(const ContentHash& hash) const;
    void set_available_content(std::set<ContentHash> hashes) { available_content_ = std::move(hashes); }
    const std::set<ContentHash>& available_content() const { return available_content_; }

    // Liveness
    void touch();
    void set_last_seen(time::TimePoint when);
    time::TimePoint last_seen() const { return last_seen_; }
    bool is_stale(std::chrono::seconds max_age) const;

    const nlohmann::json& metadata() const { return metadata_; }
    void set_metadata(nlohmann::json metadata);

    nlohmann::json to_json() const;
    static Result<PeerRecord> from_json(const nlohmann::json& j);

    /**
     * "Peer(1a2b3c4d... @ host:port)"
     */
    std::string to_string() const;

    // Identity is the peer id
    bool operator==(const PeerRecord& other) const { return peer_id_ == other.peer_id_; }
    bool operator!=(const PeerRecord& other) const { return !(*this == other); }

private:
    std::string peer_id_;
    std::string host_;
    uint16_t port_;
    time::TimePoint last_seen_;
    std::set<ContentHash> available_content_;
    nlohmann::json metadata_ = nlohmann::json::object();
};

} // namespace dcmx::network
