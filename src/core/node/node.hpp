#pragma once

#include "dcmx/common.hpp"
#include "dcmx/error.hpp"
#include "core/track/track.hpp"
#include "network/peer.hpp"
#include "network/discovery.hpp"
#include "utils/config.hpp"
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dcmx::core {

/**
 * NodeConfig - Where a node listens and keeps its data
 */
struct NodeConfig {
    std::string host{constants::DEFAULT_HOST};
    uint16_t port{constants::DEFAULT_PORT};          // 0 binds an ephemeral port
    std::filesystem::path data_dir{default_data_dir()};
    network::DiscoveryConfig discovery;
    size_t max_request_body_size{constants::MAX_MESSAGE_SIZE};

    /**
     * Read host, port, data_dir and timeout keys; absent keys keep defaults
     * @throws DcmxException (InvalidArgument) on an out-of-range port or timeout
     */
    static NodeConfig from_config(const utils::Config& config);

    /**
     * $HOME/.dcmx, or ./.dcmx when HOME is unset
     */
    static std::filesystem::path default_data_dir();
};

enum class NodeState {
    Stopped,
    Running
};

const char* node_state_to_string(NodeState state);

/**
 * ContentLocation - Answer of find_content
 */
struct ContentLocation {
    enum class Kind {
        Local,
        Remote,
        NotFound
    };

    Kind kind{Kind::NotFound};
    std::string peer_id;    // Set for Remote only

    static ContentLocation local() { return {Kind::Local, {}}; }
    static ContentLocation remote(std::string id) { return {Kind::Remote, std::move(id)}; }
    static ContentLocation not_found() { return {Kind::NotFound, {}}; }

    bool is_local() const { return kind == Kind::Local; }
    bool is_remote() const { return kind == Kind::Remote; }
    bool is_not_found() const { return kind == Kind::NotFound; }
};

/**
 * Ordering of candidate peers for a fetch: true when a should be tried before b.
 * Must be a strict weak ordering.
 */
using PeerSelectionPolicy =
    std::function<bool(const network::PeerRecord& a, const network::PeerRecord& b)>;

/**
 * Most recently touched first; ties broken by peer id
 */
bool most_recently_seen(const network::PeerRecord& a, const network::PeerRecord& b);

using PeerPredicate = std::function<bool(const network::PeerRecord&)>;

/**
 * NodeStats - Summary served on /stats
 */
struct NodeStats {
    std::string peer_id;
    std::string address;
    size_t connected_peers{0};
    size_t tracks{0};
    uint64_t storage_size{0};

    nlohmann::json to_json() const;
};

/**
 * DCMX Node - one peer of the content mesh
 *
 * Owns the local catalog, the peer table, the content store and the HTTP
 * gateway. Both tables are only reachable through this class and are handed
 * out as copies. No lock is held across network or disk I/O.
 */
class Node {
public:
    /**
     * Open the data directory and reload the persisted catalog
     * @throws StorageException if the content store cannot be created
     */
    explicit Node(NodeConfig config);
    ~Node();

    DCMX_DISALLOW_COPY_AND_MOVE(Node);

    // Lifecycle
    Result<void> start();
    void stop();
    bool is_running() const;
    NodeState state() const;

    /**
     * Bound port while running, configured port otherwise
     */
    uint16_t port() const;

    const std::string& peer_id() const;
    const NodeConfig& config() const;

    /**
     * Record other nodes learn about this one: id, address and local catalog
     */
    network::PeerRecord self_description() const;

    // Local content
    /**
     * Hash, store and register a payload
     *
     * Registering identical bytes again returns the existing record.
     * @return InvalidArgument if a metadata string is not valid UTF-8
     */
    Result<Track> add_content(const bytes& data, TrackMetadata metadata);

    /**
     * Register a record built elsewhere together with its bytes
     * @return ContentHashMismatch if data is not the payload track describes
     */
    Result<Track> add_track(const Track& track, const bytes& data);

    std::optional<Track> get_track(const ContentHash& hash) const;
    Result<bytes> get_track_content(const ContentHash& hash) const;
    std::vector<Track> tracks() const;
    size_t track_count() const;

    // Mesh
    /**
     * Discovery handshake with host:port
     *
     * On success the responder is inserted or replaced in the peer table. On
     * failure the table is untouched and the error is returned.
     */
    Result<network::PeerRecord> connect_to_peer(const std::string& host, uint16_t port);

    /**
     * Local when stored here, otherwise the preferred advertising peer
     */
    ContentLocation find_content(const ContentHash& hash) const;

    /**
     * Peers advertising hash, best candidate first
     */
    std::vector<network::PeerRecord> discover_track(const ContentHash& hash) const;

    /**
     * Bytes for hash from local storage or, failing that, from the mesh
     *
     * Fetched content is verified and cached in the local store.
     * @return StorageNotFound when no known peer advertises hash,
     *         ProtocolInvalidMessage when an advertising peer served a bad answer,
     *         NetworkConnectionFailed when advertising peers could not be reached
     */
    Result<bytes> request_track(const ContentHash& hash);

    /**
     * Repeat discovery against every known peer
     * @return Number of peers that answered
     */
    size_t refresh_peers();

    /**
     * Remove every peer matching predicate
     * @return Number removed
     */
    size_t expire_peers(const PeerPredicate& predicate);

    /**
     * Remove peers not touched within max_age
     */
    size_t expire_stale_peers(std::chrono::seconds max_age);

    std::vector<network::PeerRecord> peers() const;
    std::optional<network::PeerRecord> get_peer(const std::string& peer_id) const;
    size_t peer_count() const;

    void set_peer_selection_policy(PeerSelectionPolicy policy);

    NodeStats get_stats() const;

private:
    void register_handlers();
    void load_catalog();
    void persist_catalog();
    Result<Track> register_track(const Track& track);
    void upsert_peer(network::PeerRecord peer);
    void touch_peer(const std::string& peer_id);

    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace dcmx::core
