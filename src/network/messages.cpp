#include "messages.hpp"

namespace dcmx::network {

using json = nlohmann::json;

namespace {
    template<typename T>
    Result<T> malformed(const std::string& what, const std::string& details = "") {
        return Result<T>::Err(ErrorCode::ProtocolInvalidMessage, "malformed " + what, details);
    }

    // Pull a required JSON object/array member; nullptr when absent or of the wrong kind
    const json* member(const json& j, const char* key, json::value_t kind) {
        if (!j.is_object() || !j.contains(key)) {
            return nullptr;
        }
        const json& value = j.at(key);
        return value.type() == kind ? &value : nullptr;
    }
}

Result<json> parse_body(const std::string& body) {
    try {
        return Result<json>::Ok(json::parse(body));
    } catch (const json::parse_error& e) {
        return Result<json>::Err(ErrorCode::ProtocolInvalidMessage, "invalid JSON body", e.what());
    }
}

// PingResponse

json PingResponse::to_json() const {
    return json{{"status", status}, {"peer_id", peer_id}};
}

Result<PingResponse> PingResponse::from_json(const json& j) {
    if (!j.is_object() || !j.contains("status") || !j.at("status").is_string()) {
        return malformed<PingResponse>("ping response", "missing status");
    }

    PingResponse response;
    response.status = j.at("status").get<std::string>();
    if (j.contains("peer_id") && j.at("peer_id").is_string()) {
        response.peer_id = j.at("peer_id").get<std::string>();
    }
    return Result<PingResponse>::Ok(std::move(response));
}

// DiscoverRequest

json DiscoverRequest::to_json() const {
    return json{{"peer", peer.to_json()}};
}

Result<DiscoverRequest> DiscoverRequest::from_json(const json& j) {
    const json* peer_json = member(j, "peer", json::value_t::object);
    if (!peer_json) {
        return malformed<DiscoverRequest>("discover request", "missing peer object");
    }

    auto peer = PeerRecord::from_json(*peer_json);
    if (peer.is_err()) {
        return malformed<DiscoverRequest>("discover request", peer.error().details());
    }
    return Result<DiscoverRequest>::Ok(DiscoverRequest{std::move(peer.value())});
}

// DiscoverResponse

json DiscoverResponse::to_json() const {
    json hashes = json::array();
    for (const auto& hash : tracks) {
        hashes.push_back(hash.to_string());
    }
    return json{{"peer", peer.to_json()}, {"tracks", hashes}};
}

Result<DiscoverResponse> DiscoverResponse::from_json(const json& j) {
    const json* peer_json = member(j, "peer", json::value_t::object);
    if (!peer_json) {
        return malformed<DiscoverResponse>("discover response", "missing peer object");
    }

    auto peer = PeerRecord::from_json(*peer_json);
    if (peer.is_err()) {
        return malformed<DiscoverResponse>("discover response", peer.error().details());
    }

    std::vector<ContentHash> hashes;
    if (j.contains("tracks") && !j.at("tracks").is_null()) {
        const json& tracks = j.at("tracks");
        if (!tracks.is_array()) {
            return malformed<DiscoverResponse>("discover response", "tracks must be an array");
        }

        for (const auto& entry : tracks) {
            std::optional<ContentHash> hash;
            if (entry.is_string()) {
                hash = ContentHash::parse(entry.get<std::string>());
            } else if (entry.is_object() && entry.contains("content_hash") &&
                       entry.at("content_hash").is_string()) {
                hash = ContentHash::parse(entry.at("content_hash").get<std::string>());
            }
            if (!hash) {
                return malformed<DiscoverResponse>("discover response",
                    "tracks entry is not a content hash");
            }
            hashes.push_back(*hash);
        }
    }

    return Result<DiscoverResponse>::Ok(DiscoverResponse{std::move(peer.value()), std::move(hashes)});
}

// PeersResponse

json PeersResponse::to_json() const {
    json list = json::array();
    for (const auto& peer : peers) {
        list.push_back(peer.to_json());
    }
    return json{{"peers", list}};
}

Result<PeersResponse> PeersResponse::from_json(const json& j) {
    const json* list = member(j, "peers", json::value_t::array);
    if (!list) {
        return malformed<PeersResponse>("peers response", "missing peers array");
    }

    PeersResponse response;
    for (const auto& entry : *list) {
        auto peer = PeerRecord::from_json(entry);
        if (peer.is_err()) {
            return malformed<PeersResponse>("peers response", peer.error().details());
        }
        response.peers.push_back(std::move(peer.value()));
    }
    return Result<PeersResponse>::Ok(std::move(response));
}

// TracksResponse

json TracksResponse::to_json() const {
    json list = json::array();
    for (const auto& track : tracks) {
        list.push_back(track.to_json());
    }
    return json{{"tracks", list}};
}

Result<TracksResponse> TracksResponse::from_json(const json& j) {
    const json* list = member(j, "tracks", json::value_t::array);
    if (!list) {
        return malformed<TracksResponse>("tracks response", "missing tracks array");
    }

    TracksResponse response;
    for (const auto& entry : *list) {
        auto track = core::Track::from_json(entry);
        if (track.is_err()) {
            return malformed<TracksResponse>("tracks response", track.error().details());
        }
        response.tracks.push_back(std::move(track.value()));
    }
    return Result<TracksResponse>::Ok(std::move(response));
}

// ErrorResponse

Result<ErrorResponse> ErrorResponse::from_json(const json& j) {
    if (!j.is_object() || !j.contains("error") || !j.at("error").is_string()) {
        return malformed<ErrorResponse>("error response", "missing error string");
    }
    return Result<ErrorResponse>::Ok(ErrorResponse{j.at("error").get<std::string>()});
}

} // namespace dcmx::network
