#include "peer.hpp"
#include "crypto/random.hpp"
#include <sstream>
#include <stdexcept>
#include <limits>

namespace dcmx::network {

using json = nlohmann::json;

namespace {
    // ISO timestamps carry milliseconds, keep the in-memory value at the same precision
    time::TimePoint truncate_to_millis(time::TimePoint tp) {
        return std::chrono::time_point_cast<time::Milliseconds>(tp);
    }

    Result<PeerRecord> reject(const std::string& reason) {
        return Result<PeerRecord>::Err(ErrorCode::DeserializationFailed,
            "invalid peer record", reason);
    }
}

PeerRecord::PeerRecord(std::string host, uint16_t port)
    : PeerRecord(crypto::Random::uuid_v4(), std::move(host), port)
{}

PeerRecord::PeerRecord(std::string peer_id, std::string host, uint16_t port)
    : peer_id_(std::move(peer_id))
    , host_(std::move(host))
    , port_(port)
    , last_seen_(truncate_to_millis(time::now()))
{}

std::string PeerRecord::address() const {
    return host_ + ":" + std::to_string(port_);
}

void PeerRecord::add_content(const ContentHash& hash) {
    available_content_.insert(hash);
}

void PeerRecord::remove_content(const ContentHash& hash) {
    available_content_.erase(hash);
}

bool PeerRecord::has_content(const ContentHash& hash) const {
    return available_content_.count(hash) > 0;
}

void PeerRecord::touch() {
    last_seen_ = truncate_to_millis(time::now());
}

void PeerRecord::set_last_seen(time::TimePoint when) {
    last_seen_ = truncate_to_millis(when);
}

bool PeerRecord::is_stale(std::chrono::seconds max_age) const {
    return time::now() - last_seen_ > max_age;
}

void PeerRecord::set_metadata(json metadata) {
    metadata_ = metadata.is_object() ? std::move(metadata) : json::object();
}

json PeerRecord::to_json() const {
    json tracks = json::array();
    for (const auto& hash : available_content_) {
        tracks.push_back(hash.to_string());
    }

    return json{
        {"peer_id", peer_id_},
        {"host", host_},
        {"port", port_},
        {"last_seen", time::to_string(last_seen_)},
        {"available_tracks", tracks},
        {"metadata", metadata_}
    };
}

Result<PeerRecord> PeerRecord::from_json(const json& j) {
    if (!j.is_object()) {
        return reject("peer must be a JSON object");
    }
    if (!j.contains("peer_id") || !j.at("peer_id").is_string() ||
        j.at("peer_id").get<std::string>().empty()) {
        return reject("missing peer_id");
    }
    if (!j.contains("host") || !j.at("host").is_string() ||
        j.at("host").get<std::string>().empty()) {
        return reject("missing host");
    }
    if (!j.contains("port") || !j.at("port").is_number_integer()) {
        return reject("missing port");
    }

    int64_t port = j.at("port").get<int64_t>();
    if (port < 0 || port > std::numeric_limits<uint16_t>::max()) {
        return reject("port out of range: " + std::to_string(port));
    }

    PeerRecord peer(j.at("peer_id").get<std::string>(),
                    j.at("host").get<std::string>(),
                    static_cast<uint16_t>(port));

    if (j.contains("last_seen") && j.at("last_seen").is_string()) {
        try {
            peer.set_last_seen(time::from_string(j.at("last_seen").get<std::string>()));
        } catch (const std::invalid_argument& e) {
            return reject(std::string("bad last_seen: ") + e.what());
        }
    }

    if (j.contains("available_tracks") && !j.at("available_tracks").is_null()) {
        const auto& tracks = j.at("available_tracks");
        if (!tracks.is_array()) {
            return reject("available_tracks must be an array");
        }
        for (const auto& entry : tracks) {
            auto hash = entry.is_string()
                ? ContentHash::parse(entry.get<std::string>())
                : std::nullopt;
            if (!hash) {
                return reject("available_tracks contains a malformed content hash");
            }
            peer.add_content(*hash);
        }
    }

    if (j.contains("metadata") && j.at("metadata").is_object()) {
        peer.set_metadata(j.at("metadata"));
    }

    return Result<PeerRecord>::Ok(std::move(peer));
}

std::string PeerRecord::to_string() const {
    std::ostringstream oss;
    oss << "Peer(" << peer_id_.substr(0, 8) << "... @ " << address() << ")";
    return oss.str();
}

} // namespace dcmx::network
