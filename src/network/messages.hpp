#pragma once

#include "dcmx/common.hpp"
#include "dcmx/error.hpp"
#include "network/peer.hpp"
#include "core/track/track.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace dcmx::network {

/**
 * Wire payloads exchanged between nodes
 *
 * Every HTTP body is one of these structures. Parsing is strict about the
 * fields the receiver depends on and ignores anything else.
 */

// GET /ping
struct PingResponse {
    std::string status{"ok"};
    std::string peer_id;

    nlohmann::json to_json() const;
    static Result<PingResponse> from_json(const nlohmann::json& j);
};

// POST /discover request body
struct DiscoverRequest {
    PeerRecord peer;

    nlohmann::json to_json() const;
    static Result<DiscoverRequest> from_json(const nlohmann::json& j);
};

// POST /discover response body
struct DiscoverResponse {
    PeerRecord peer;
    std::vector<ContentHash> tracks;

    nlohmann::json to_json() const;

    /**
     * Accepts both bare hash strings and track objects in "tracks"
     */
    static Result<DiscoverResponse> from_json(const nlohmann::json& j);
};

// GET /peers
struct PeersResponse {
    std::vector<PeerRecord> peers;

    nlohmann::json to_json() const;
    static Result<PeersResponse> from_json(const nlohmann::json& j);
};

// GET /tracks
struct TracksResponse {
    std::vector<core::Track> tracks;

    nlohmann::json to_json() const;
    static Result<TracksResponse> from_json(const nlohmann::json& j);
};

// Any non-2xx JSON body
struct ErrorResponse {
    std::string error;

    nlohmann::json to_json() const { return nlohmann::json{{"error", error}}; }
    static Result<ErrorResponse> from_json(const nlohmann::json& j);
};

/**
 * Parse a text body as JSON
 * @return ProtocolInvalidMessage on malformed JSON
 */
Result<nlohmann::json> parse_body(const std::string& body);

} // namespace dcmx::network
