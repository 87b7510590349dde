#include "discovery.hpp"
#include "network/messages.hpp"
#include "utils/logger.hpp"
#include <httplib.h>

namespace dcmx::network {

using json = nlohmann::json;

namespace {

std::unique_ptr<httplib::Client> make_client(const std::string& host, uint16_t port,
                                             std::chrono::seconds connect_timeout,
                                             std::chrono::seconds operation_timeout) {
    auto client = std::make_unique<httplib::Client>(host, port);
    client->set_connection_timeout(static_cast<time_t>(connect_timeout.count()), 0);
    client->set_read_timeout(static_cast<time_t>(operation_timeout.count()), 0);
    client->set_write_timeout(static_cast<time_t>(operation_timeout.count()), 0);
    // Per-recv timeouts alone let a trickling peer hold the call open
    client->set_max_timeout(static_cast<time_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(operation_timeout).count()));
    client->set_keep_alive(false);
    return client;
}

// Transport failure: the request never produced a response
Error transport_error(const std::string& address, const std::string& path, httplib::Error err) {
    ErrorCode code = (err == httplib::Error::Read || err == httplib::Error::Write)
        ? ErrorCode::NetworkTimeout
        : ErrorCode::NetworkConnectionFailed;
    return Error(code, "request to " + address + path + " failed", httplib::to_string(err));
}

// Details carry the peer's own error message when the body is an ErrorResponse
Error status_error(const std::string& address, const std::string& path,
                   int status, const std::string& body) {
    std::string details = std::to_string(status);
    auto parsed = parse_body(body);
    if (parsed.is_ok()) {
        auto response = ErrorResponse::from_json(parsed.value());
        if (response.is_ok()) {
            details += ": " + response.value().error;
        }
    }
    return Error(ErrorCode::ProtocolInvalidMessage,
        "unexpected status from " + address + path, details);
}

// GET path and decode a JSON body
Result<json> get_json(const PeerRecord& peer, const std::string& path,
                      std::chrono::seconds connect_timeout, std::chrono::seconds read_timeout) {
    auto client = make_client(peer.host(), peer.port(), connect_timeout, read_timeout);
    auto res = client->Get(path.c_str());
    if (!res) {
        return Result<json>::Err(transport_error(peer.address(), path, res.error()));
    }
    if (res->status != 200) {
        return Result<json>::Err(status_error(peer.address(), path, res->status, res->body));
    }
    return parse_body(res->body);
}

} // anonymous namespace

DiscoveryProtocol::DiscoveryProtocol(DiscoveryConfig config)
    : config_(config)
{}

Result<PeerRecord> DiscoveryProtocol::connect(const std::string& host, uint16_t port,
                                              const PeerRecord& self) const {
    const std::string address = host + ":" + std::to_string(port);
    DCMX_LOG_DEBUG("Discovering peer at {}", address);

    auto client = make_client(host, port, config_.connect_timeout, config_.discovery_timeout);
    const std::string body = DiscoverRequest{self}.to_json().dump();

    auto res = client->Post("/discover", body, "application/json");
    if (!res) {
        Error error = transport_error(address, "/discover", res.error());
        DCMX_LOG_DEBUG("Discovery of {} failed: {}", address, error.to_string());
        return Result<PeerRecord>::Err(std::move(error));
    }
    if (res->status != 200) {
        return Result<PeerRecord>::Err(status_error(address, "/discover", res->status, res->body));
    }

    auto parsed = parse_body(res->body);
    if (parsed.is_err()) {
        return Result<PeerRecord>::Err(parsed.error());
    }

    auto response = DiscoverResponse::from_json(parsed.value());
    if (response.is_err()) {
        return Result<PeerRecord>::Err(response.error());
    }

    // The returned track list is authoritative for what the peer serves
    PeerRecord peer = std::move(response.value().peer);
    peer.set_available_content(std::set<ContentHash>(
        response.value().tracks.begin(), response.value().tracks.end()));
    peer.touch();

    DCMX_LOG_DEBUG("Discovered {} advertising {} tracks",
                   peer.to_string(), peer.available_content().size());
    return Result<PeerRecord>::Ok(std::move(peer));
}

Result<void> DiscoveryProtocol::ping(const PeerRecord& peer) const {
    auto body = get_json(peer, "/ping", config_.connect_timeout, config_.ping_timeout);
    if (body.is_err()) {
        return Result<void>::Err(body.error());
    }

    auto response = PingResponse::from_json(body.value());
    if (response.is_err()) {
        return Result<void>::Err(response.error());
    }
    if (response.value().status != "ok") {
        return Result<void>::Err(ErrorCode::ProtocolInvalidMessage,
            "peer reported unhealthy status", response.value().status);
    }
    return Result<void>::Ok();
}

Result<bytes> DiscoveryProtocol::request_content(const PeerRecord& peer,
                                                 const ContentHash& hash) const {
    const std::string path = "/content/" + hash.to_string();
    auto client = make_client(peer.host(), peer.port(), config_.connect_timeout, config_.content_timeout);

    bytes data;
    bool too_large = false;
    auto res = client->Get(path.c_str(), [&](const char* chunk, size_t length) {
        if (data.size() + length > config_.max_content_size) {
            too_large = true;
            return false;
        }
        data.insert(data.end(), chunk, chunk + length);
        return true;
    });
    if (too_large) {
        DCMX_LOG_WARN("{} served more than {} bytes for {}",
                      peer.to_string(), config_.max_content_size, hash.to_string());
        return Result<bytes>::Err(ErrorCode::ContentTooLarge,
            "served content exceeds size limit", peer.address() + path);
    }
    if (!res) {
        return Result<bytes>::Err(transport_error(peer.address(), path, res.error()));
    }
    if (res->status == 404) {
        return Result<bytes>::Err(ErrorCode::StorageNotFound,
            "peer does not hold content", peer.address() + path);
    }
    if (res->status != 200) {
        return Result<bytes>::Err(status_error(peer.address(), path, res->status,
                                               std::string(data.begin(), data.end())));
    }

    if (core::Track::compute_hash(data) != hash) {
        DCMX_LOG_WARN("{} served bytes that do not match {}", peer.to_string(), hash.to_string());
        return Result<bytes>::Err(ErrorCode::ProtocolInvalidMessage,
            "served content does not match its hash", hash.to_string());
    }

    return Result<bytes>::Ok(std::move(data));
}

Result<std::vector<PeerRecord>> DiscoveryProtocol::get_peers(const PeerRecord& peer) const {
    auto body = get_json(peer, "/peers", config_.connect_timeout, config_.discovery_timeout);
    if (body.is_err()) {
        return Result<std::vector<PeerRecord>>::Err(body.error());
    }

    auto response = PeersResponse::from_json(body.value());
    if (response.is_err()) {
        return Result<std::vector<PeerRecord>>::Err(response.error());
    }
    return Result<std::vector<PeerRecord>>::Ok(std::move(response.value().peers));
}

Result<std::vector<core::Track>> DiscoveryProtocol::get_tracks(const PeerRecord& peer) const {
    auto body = get_json(peer, "/tracks", config_.connect_timeout, config_.discovery_timeout);
    if (body.is_err()) {
        return Result<std::vector<core::Track>>::Err(body.error());
    }

    auto response = TracksResponse::from_json(body.value());
    if (response.is_err()) {
        return Result<std::vector<core::Track>>::Err(response.error());
    }
    return Result<std::vector<core::Track>>::Ok(std::move(response.value().tracks));
}

} // namespace dcmx::network
