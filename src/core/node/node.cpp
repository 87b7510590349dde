#include "node.hpp"
#include "dcmx/gateway/gateway_server.hpp"
#include "network/messages.hpp"
#include "storage/content_store.hpp"
#include "crypto/random.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <map>
#include <mutex>

namespace dcmx::core {

namespace fs = std::filesystem;
using json = nlohmann::json;
using network::PeerRecord;
using gateway::HttpMethod;
using gateway::HttpRequest;
using gateway::HttpResponse;
using gateway::HttpStatus;

namespace {
    constexpr const char* CATALOG_FILE = "catalog.json";
    constexpr const char* CONTENT_DIR = "content";
    constexpr const char* CONTENT_ROUTE = "/content/";

    std::string short_id(const std::string& id) {
        return id.substr(0, 8);
    }

    std::string short_hash(const ContentHash& hash) {
        return hash.to_string().substr(0, 16);
    }

    std::chrono::seconds timeout_from(const utils::Config& config, const std::string& key,
                                      std::chrono::seconds fallback) {
        int64_t seconds = config.get_or<int64_t>(key, fallback.count());
        if (seconds <= 0) {
            throw DcmxException(ErrorCode::InvalidArgument,
                key + " must be positive, got " + std::to_string(seconds));
        }
        return std::chrono::seconds(seconds);
    }

    // Catalog and wire encodings need every metadata string to be valid UTF-8
    Result<void> check_serializable(const Track& track) {
        try {
            (void)track.to_json().dump();
        } catch (const json::type_error& e) {
            return Result<void>::Err(ErrorCode::InvalidArgument,
                "track metadata is not valid UTF-8", e.what());
        }
        return Result<void>::Ok();
    }

    HttpResponse json_response(const json& body) {
        HttpResponse response;
        response.set_json_body(body.dump());
        return response;
    }
}

// NodeConfig

NodeConfig NodeConfig::from_config(const utils::Config& config) {
    NodeConfig node_config;
    node_config.host = config.get_or<std::string>("host", node_config.host);

    int64_t port = config.get_or<int64_t>("port", node_config.port);
    if (port < 0 || port > std::numeric_limits<uint16_t>::max()) {
        throw DcmxException(ErrorCode::InvalidArgument,
            "port out of range: " + std::to_string(port));
    }
    node_config.port = static_cast<uint16_t>(port);

    if (auto data_dir = config.get<std::string>("data_dir")) {
        node_config.data_dir = *data_dir;
    }

    auto& discovery = node_config.discovery;
    discovery.connect_timeout = timeout_from(config, "connect_timeout_seconds", discovery.connect_timeout);
    discovery.discovery_timeout = timeout_from(config, "discovery_timeout_seconds", discovery.discovery_timeout);
    discovery.ping_timeout = timeout_from(config, "ping_timeout_seconds", discovery.ping_timeout);
    discovery.content_timeout = timeout_from(config, "content_timeout_seconds", discovery.content_timeout);

    node_config.max_request_body_size =
        config.get_or<size_t>("max_request_body_size", node_config.max_request_body_size);

    return node_config;
}

fs::path NodeConfig::default_data_dir() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".dcmx";
    }
    return fs::path(".dcmx");
}

const char* node_state_to_string(NodeState state) {
    switch (state) {
        case NodeState::Stopped: return "stopped";
        case NodeState::Running: return "running";
        default: return "unknown";
    }
}

bool most_recently_seen(const PeerRecord& a, const PeerRecord& b) {
    if (a.last_seen() != b.last_seen()) {
        return a.last_seen() > b.last_seen();
    }
    return a.peer_id() < b.peer_id();
}

json NodeStats::to_json() const {
    return json{
        {"peer_id", peer_id},
        {"address", address},
        {"connected_peers", connected_peers},
        {"tracks", tracks},
        {"storage_size", storage_size}
    };
}

// Node

class Node::Impl {
public:
    explicit Impl(NodeConfig cfg)
        : config(std::move(cfg))
        , peer_id(crypto::Random::uuid_v4())
        , store(config.data_dir / CONTENT_DIR)
        , discovery(config.discovery)
        , gateway(make_gateway_config(config))
    {}

    static gateway::GatewayConfig make_gateway_config(const NodeConfig& config) {
        gateway::GatewayConfig gw;
        gw.bind_address = config.host;
        gw.http_port = config.port;
        gw.max_request_body_size = config.max_request_body_size;
        gw.read_timeout = config.discovery.discovery_timeout;
        return gw;
    }

    fs::path catalog_path() const { return config.data_dir / CATALOG_FILE; }

    NodeConfig config;
    const std::string peer_id;

    storage::ContentStore store;
    network::DiscoveryProtocol discovery;
    gateway::GatewayServer gateway;

    mutable std::mutex content_mutex;
    std::map<ContentHash, Track> local_content;

    mutable std::mutex peers_mutex;
    std::map<std::string, PeerRecord> peers;
    PeerSelectionPolicy selection_policy{most_recently_seen};

    // Serializes catalog file writes
    std::mutex catalog_mutex;
};

Node::Node(NodeConfig config)
    : impl_(std::make_unique<Impl>(std::move(config)))
{
    load_catalog();
    register_handlers();

    DCMX_LOG_INFO("Initialized node {}... at {}:{} (data: {})",
                  short_id(impl_->peer_id), impl_->config.host, impl_->config.port,
                  impl_->config.data_dir.string());
}

Node::~Node() {
    stop();
}

Result<void> Node::start() {
    auto result = impl_->gateway.start();
    if (result.is_err()) {
        DCMX_LOG_ERROR("Node {}... failed to start: {}",
                       short_id(impl_->peer_id), result.error().to_string());
        return result;
    }

    DCMX_LOG_INFO("Node {}... started at {}:{}",
                  short_id(impl_->peer_id), impl_->config.host, port());
    return result;
}

void Node::stop() {
    if (!impl_->gateway.is_running()) {
        return;
    }
    impl_->gateway.stop();
    DCMX_LOG_INFO("Node {}... stopped", short_id(impl_->peer_id));
}

bool Node::is_running() const {
    return impl_->gateway.is_running();
}

NodeState Node::state() const {
    return is_running() ? NodeState::Running : NodeState::Stopped;
}

uint16_t Node::port() const {
    return is_running() ? impl_->gateway.port() : impl_->config.port;
}

const std::string& Node::peer_id() const {
    return impl_->peer_id;
}

const NodeConfig& Node::config() const {
    return impl_->config;
}

PeerRecord Node::self_description() const {
    PeerRecord self(impl_->peer_id, impl_->config.host, port());

    std::lock_guard<std::mutex> lock(impl_->content_mutex);
    for (const auto& [hash, track] : impl_->local_content) {
        self.add_content(hash);
    }
    return self;
}

// Local content

Result<Track> Node::add_content(const bytes& data, TrackMetadata metadata) {
    const ContentHash hash = Track::compute_hash(data);

    if (auto existing = get_track(hash)) {
        DCMX_LOG_DEBUG("Content {}... already registered", short_hash(hash));
        return Result<Track>::Ok(*existing);
    }

    Track track(std::move(metadata), hash, data.size());
    auto serializable = check_serializable(track);
    if (serializable.is_err()) {
        DCMX_LOG_WARN("Rejected content {}...: {}", short_hash(hash), serializable.error().to_string());
        return Result<Track>::Err(serializable.error());
    }

    auto stored = impl_->store.store(hash, data);
    if (stored.is_err()) {
        DCMX_LOG_ERROR("Failed to store content {}...: {}", short_hash(hash), stored.error().to_string());
        return Result<Track>::Err(stored.error());
    }

    return register_track(track);
}

Result<Track> Node::add_track(const Track& track, const bytes& data) {
    if (!track.verify(data)) {
        return Result<Track>::Err(ErrorCode::ContentHashMismatch,
            "payload does not match track record", track.content_hash().to_string());
    }

    auto serializable = check_serializable(track);
    if (serializable.is_err()) {
        return Result<Track>::Err(serializable.error());
    }

    auto stored = impl_->store.store(track.content_hash(), data);
    if (stored.is_err()) {
        return Result<Track>::Err(stored.error());
    }

    return register_track(track);
}

Result<Track> Node::register_track(const Track& track) {
    bool inserted = false;
    Track registered = track;
    {
        std::lock_guard<std::mutex> lock(impl_->content_mutex);
        auto [it, was_inserted] = impl_->local_content.emplace(track.content_hash(), track);
        inserted = was_inserted;
        registered = it->second;
    }

    if (inserted) {
        DCMX_LOG_INFO("Added track: {} [{}...]", registered.to_string(),
                      short_hash(registered.content_hash()));
        persist_catalog();
    }
    return Result<Track>::Ok(std::move(registered));
}

std::optional<Track> Node::get_track(const ContentHash& hash) const {
    std::lock_guard<std::mutex> lock(impl_->content_mutex);
    auto it = impl_->local_content.find(hash);
    if (it == impl_->local_content.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<bytes> Node::get_track_content(const ContentHash& hash) const {
    return impl_->store.retrieve(hash);
}

std::vector<Track> Node::tracks() const {
    std::lock_guard<std::mutex> lock(impl_->content_mutex);
    std::vector<Track> result;
    result.reserve(impl_->local_content.size());
    for (const auto& [hash, track] : impl_->local_content) {
        result.push_back(track);
    }
    return result;
}

size_t Node::track_count() const {
    std::lock_guard<std::mutex> lock(impl_->content_mutex);
    return impl_->local_content.size();
}

// Mesh

Result<PeerRecord> Node::connect_to_peer(const std::string& host, uint16_t port) {
    auto result = impl_->discovery.connect(host, port, self_description());
    if (result.is_err()) {
        DCMX_LOG_WARN("Failed to connect to {}:{}: {}", host, port, result.error().to_string());
        return result;
    }

    if (result.value().peer_id() == impl_->peer_id) {
        DCMX_LOG_WARN("{}:{} is this node; not adding it as a peer", host, port);
        return Result<PeerRecord>::Err(ErrorCode::ProtocolSelfConnection,
            "discovery answered by self", host + ":" + std::to_string(port));
    }

    upsert_peer(result.value());
    DCMX_LOG_INFO("Connected to peer {} ({} tracks)",
                  result.value().to_string(), result.value().available_content().size());
    return result;
}

ContentLocation Node::find_content(const ContentHash& hash) const {
    if (get_track(hash) || impl_->store.exists(hash)) {
        return ContentLocation::local();
    }

    auto candidates = discover_track(hash);
    if (candidates.empty()) {
        return ContentLocation::not_found();
    }
    return ContentLocation::remote(candidates.front().peer_id());
}

std::vector<PeerRecord> Node::discover_track(const ContentHash& hash) const {
    std::vector<PeerRecord> candidates;
    PeerSelectionPolicy policy;
    {
        std::lock_guard<std::mutex> lock(impl_->peers_mutex);
        for (const auto& [id, peer] : impl_->peers) {
            if (peer.has_content(hash)) {
                candidates.push_back(peer);
            }
        }
        policy = impl_->selection_policy;
    }

    std::sort(candidates.begin(), candidates.end(), policy);
    return candidates;
}

Result<bytes> Node::request_track(const ContentHash& hash) {
    auto local = impl_->store.retrieve(hash);
    if (local.is_ok() || !is_not_found(local.error().code())) {
        return local;
    }

    auto candidates = discover_track(hash);
    if (candidates.empty()) {
        DCMX_LOG_WARN("No peers have track {}...", short_hash(hash));
        return Result<bytes>::Err(ErrorCode::StorageNotFound,
            "content not found locally or on any known peer", hash.to_string());
    }

    std::string failures;
    bool protocol_violation = false;
    for (const auto& peer : candidates) {
        auto fetched = impl_->discovery.request_content(peer, hash);
        if (fetched.is_err()) {
            DCMX_LOG_WARN("Failed to download {}... from {}: {}",
                          short_hash(hash), peer.to_string(), fetched.error().to_string());
            protocol_violation = protocol_violation || is_protocol_violation(fetched.error().code());
            if (!failures.empty()) failures += "; ";
            failures += peer.address() + ": " + fetched.error().message();
            continue;
        }

        touch_peer(peer.peer_id());

        auto cached = impl_->store.store(hash, fetched.value());
        if (cached.is_err()) {
            DCMX_LOG_ERROR("Failed to cache {}...: {}", short_hash(hash), cached.error().to_string());
            return Result<bytes>::Err(cached.error());
        }

        DCMX_LOG_INFO("Downloaded track {}... from {}", short_hash(hash), peer.to_string());
        return fetched;
    }

    // A peer that answered wrongly outranks peers that did not answer
    if (protocol_violation) {
        return Result<bytes>::Err(ErrorCode::ProtocolInvalidMessage,
            "advertising peer served invalid content", failures);
    }
    return Result<bytes>::Err(ErrorCode::NetworkConnectionFailed,
        "no advertising peer could serve content", failures);
}

size_t Node::refresh_peers() {
    const auto known = peers();
    size_t refreshed = 0;

    for (const auto& peer : known) {
        auto result = impl_->discovery.connect(peer.host(), peer.port(), self_description());
        if (result.is_err()) {
            DCMX_LOG_DEBUG("Refresh of {} failed: {}", peer.to_string(), result.error().to_string());
            continue;
        }
        if (result.value().peer_id() == impl_->peer_id) {
            continue;
        }
        upsert_peer(std::move(result.value()));
        ++refreshed;
    }

    DCMX_LOG_DEBUG("Refreshed {}/{} peers", refreshed, known.size());
    return refreshed;
}

size_t Node::expire_peers(const PeerPredicate& predicate) {
    size_t removed = 0;
    std::lock_guard<std::mutex> lock(impl_->peers_mutex);
    for (auto it = impl_->peers.begin(); it != impl_->peers.end();) {
        if (predicate(it->second)) {
            DCMX_LOG_INFO("Expiring peer {}", it->second.to_string());
            it = impl_->peers.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t Node::expire_stale_peers(std::chrono::seconds max_age) {
    return expire_peers([max_age](const PeerRecord& peer) {
        return peer.is_stale(max_age);
    });
}

std::vector<PeerRecord> Node::peers() const {
    std::lock_guard<std::mutex> lock(impl_->peers_mutex);
    std::vector<PeerRecord> result;
    result.reserve(impl_->peers.size());
    for (const auto& [id, peer] : impl_->peers) {
        result.push_back(peer);
    }
    return result;
}

std::optional<PeerRecord> Node::get_peer(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(impl_->peers_mutex);
    auto it = impl_->peers.find(peer_id);
    if (it == impl_->peers.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t Node::peer_count() const {
    std::lock_guard<std::mutex> lock(impl_->peers_mutex);
    return impl_->peers.size();
}

void Node::set_peer_selection_policy(PeerSelectionPolicy policy) {
    std::lock_guard<std::mutex> lock(impl_->peers_mutex);
    impl_->selection_policy = policy ? std::move(policy) : PeerSelectionPolicy(most_recently_seen);
}

NodeStats Node::get_stats() const {
    NodeStats stats;
    stats.peer_id = impl_->peer_id;
    stats.address = impl_->config.host + ":" + std::to_string(port());
    stats.connected_peers = peer_count();
    stats.tracks = track_count();
    stats.storage_size = impl_->store.total_size();
    return stats;
}

void Node::upsert_peer(PeerRecord peer) {
    std::lock_guard<std::mutex> lock(impl_->peers_mutex);
    const std::string id = peer.peer_id();
    impl_->peers.insert_or_assign(id, std::move(peer));
}

void Node::touch_peer(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(impl_->peers_mutex);
    auto it = impl_->peers.find(peer_id);
    if (it != impl_->peers.end()) {
        it->second.touch();
    }
}

// Catalog persistence

void Node::load_catalog() {
    const fs::path path = impl_->catalog_path();
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return;
    }

    std::ifstream file(path);
    if (!file) {
        DCMX_LOG_WARN("Cannot open catalog {}; starting with an empty catalog", path.string());
        return;
    }

    json catalog;
    try {
        file >> catalog;
    } catch (const json::parse_error& e) {
        DCMX_LOG_WARN("Catalog {} is not valid JSON ({}); starting with an empty catalog",
                      path.string(), e.what());
        return;
    }

    if (!catalog.is_array()) {
        DCMX_LOG_WARN("Catalog {} is not a JSON array; starting with an empty catalog", path.string());
        return;
    }

    size_t loaded = 0;
    std::lock_guard<std::mutex> lock(impl_->content_mutex);
    for (const auto& entry : catalog) {
        auto track = Track::from_json(entry);
        if (track.is_err()) {
            DCMX_LOG_WARN("Skipping catalog entry: {}", track.error().to_string());
            continue;
        }
        if (!impl_->store.exists(track.value().content_hash())) {
            DCMX_LOG_WARN("Skipping catalog entry {}...: content missing from store",
                          short_hash(track.value().content_hash()));
            continue;
        }
        impl_->local_content.emplace(track.value().content_hash(), track.value());
        ++loaded;
    }

    DCMX_LOG_INFO("Loaded {} tracks from catalog", loaded);
}

void Node::persist_catalog() {
    std::lock_guard<std::mutex> file_lock(impl_->catalog_mutex);

    json catalog = json::array();
    for (const auto& track : tracks()) {
        catalog.push_back(track.to_json());
    }

    const fs::path path = impl_->catalog_path();
    fs::path temp_path = path;
    temp_path += ".tmp";

    {
        std::ofstream file(temp_path, std::ios::trunc);
        if (!file) {
            DCMX_LOG_ERROR("Failed to write catalog {}", temp_path.string());
            return;
        }
        file << catalog.dump(2);
        file.flush();
        if (!file) {
            DCMX_LOG_ERROR("Short write on catalog {}", temp_path.string());
            return;
        }
    }

    std::error_code ec;
    fs::rename(temp_path, path, ec);
    if (ec) {
        DCMX_LOG_ERROR("Failed to replace catalog {}: {}", path.string(), ec.message());
        fs::remove(temp_path, ec);
    }
}

// Service surface

void Node::register_handlers() {
    auto& gw = impl_->gateway;

    gw.register_handler(HttpMethod::GET, "/ping", [this](const HttpRequest&) {
        return json_response(network::PingResponse{"ok", impl_->peer_id}.to_json());
    });

    gw.register_handler(HttpMethod::GET, "/peers", [this](const HttpRequest&) {
        return json_response(network::PeersResponse{peers()}.to_json());
    });

    gw.register_handler(HttpMethod::GET, "/tracks", [this](const HttpRequest&) {
        return json_response(network::TracksResponse{tracks()}.to_json());
    });

    gw.register_handler(HttpMethod::GET, "/stats", [this](const HttpRequest&) {
        return json_response(get_stats().to_json());
    });

    gw.register_handler(HttpMethod::POST, "/discover", [this](const HttpRequest& req) {
        auto body = network::parse_body(req.body_string());
        if (body.is_err()) {
            return HttpResponse::error(HttpStatus::BAD_REQUEST, body.error().message());
        }

        auto request = network::DiscoverRequest::from_json(body.value());
        if (request.is_err()) {
            DCMX_LOG_DEBUG("Rejected discover from {}: {}", req.client_ip, request.error().to_string());
            return HttpResponse::error(HttpStatus::BAD_REQUEST, request.error().details());
        }

        PeerRecord announced = std::move(request.value().peer);
        if (announced.peer_id() != impl_->peer_id) {
            announced.touch();
            DCMX_LOG_INFO("Discovered peer {}", announced.to_string());
            upsert_peer(std::move(announced));
        }

        network::DiscoverResponse response{self_description(), {}};
        for (const auto& hash : response.peer.available_content()) {
            response.tracks.push_back(hash);
        }
        return json_response(response.to_json());
    });

    gw.register_handler(HttpMethod::GET, std::string(CONTENT_ROUTE) + "*", [this](const HttpRequest& req) {
        const std::string hash_str = req.path.substr(std::char_traits<char>::length(CONTENT_ROUTE));
        auto hash = ContentHash::parse(hash_str);
        if (!hash) {
            return HttpResponse::error(HttpStatus::BAD_REQUEST, "Invalid content hash");
        }

        auto content = impl_->store.retrieve(*hash);
        if (content.is_err()) {
            if (is_not_found(content.error().code())) {
                return HttpResponse::error(HttpStatus::NOT_FOUND, "Content not found");
            }
            DCMX_LOG_ERROR("Failed to serve {}...: {}", short_hash(*hash), content.error().to_string());
            return HttpResponse::error(HttpStatus::INTERNAL_ERROR, content.error().message());
        }

        HttpResponse response;
        response.set_binary_body(std::move(content.value()), "application/octet-stream");
        return response;
    });
}

} // namespace dcmx::core
