#include <iostream>
#include <fstream>
#include <filesystem>
#include <csignal>
#include <atomic>
#include <thread>
#include <optional>
#include <vector>
#include <string>
#include <utility>

// Core components
#include "core/node/node.hpp"
#include "core/track/track.hpp"
#include "network/discovery.hpp"

// Utilities
#include "utils/logger.hpp"
#include "utils/config.hpp"
#include "dcmx/common.hpp"
#include "dcmx/error.hpp"

namespace {

using dcmx::core::Node;
using dcmx::core::NodeConfig;

// Global flag for graceful shutdown
std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown_requested = true;
    }
}

void print_usage() {
    std::cout
        << "DCMX node v" << DCMX_VERSION_STRING << "\n\n"
        << "Usage:\n"
        << "  dcmx start [--config FILE] [--host HOST] [--port PORT] [--data-dir DIR]\n"
        << "             [--peers HOST:PORT ...] [-v]\n"
        << "  dcmx add FILE [--title T] [--artist A] [--album A] [--year Y] [--genre G]\n"
        << "               [--duration SECONDS] [--format F] [--data-dir DIR]\n"
        << "  dcmx list [--data-dir DIR]\n"
        << "  dcmx stats [--data-dir DIR]\n"
        << "  dcmx ping HOST:PORT\n"
        << "  dcmx peers HOST:PORT\n"
        << "  dcmx tracks HOST:PORT\n";
}

/**
 * Flags of one command: "--name value" pairs, bare switches and positionals
 */
struct Arguments {
    std::vector<std::string> positional;
    std::vector<std::pair<std::string, std::string>> options;
    bool verbose{false};

    std::optional<std::string> get(const std::string& name) const {
        for (auto it = options.rbegin(); it != options.rend(); ++it) {
            if (it->first == name) return it->second;
        }
        return std::nullopt;
    }

    std::vector<std::string> get_all(const std::string& name) const {
        std::vector<std::string> values;
        for (const auto& [key, value] : options) {
            if (key == name) values.push_back(value);
        }
        return values;
    }
};

Arguments parse_arguments(int argc, char** argv, int first) {
    Arguments args;
    std::string current_multi;  // "--peers" consumes values until the next flag

    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-v" || arg == "--verbose") {
            args.verbose = true;
            current_multi.clear();
        } else if (arg.rfind("--", 0) == 0) {
            std::string name = arg.substr(2);
            if (i + 1 >= argc) {
                throw std::invalid_argument("missing value for " + arg);
            }
            args.options.emplace_back(name, argv[++i]);
            current_multi = (name == "peers") ? name : "";
        } else if (!current_multi.empty()) {
            args.options.emplace_back(current_multi, arg);
        } else {
            args.positional.push_back(arg);
        }
    }
    return args;
}

uint16_t parse_port(const std::string& text) {
    int port = std::stoi(text);
    if (port < 0 || port > 65535) {
        throw std::invalid_argument("port out of range: " + text);
    }
    return static_cast<uint16_t>(port);
}

// HOST:PORT, split at the last colon
std::optional<std::pair<std::string, uint16_t>> parse_address(const std::string& address) {
    auto colon = address.rfind(':');
    if (colon == std::string::npos || colon == 0) {
        return std::nullopt;
    }
    try {
        return std::make_pair(address.substr(0, colon), parse_port(address.substr(colon + 1)));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

NodeConfig build_node_config(const Arguments& args, const dcmx::utils::Config& config) {
    NodeConfig node_config = NodeConfig::from_config(config);
    if (auto host = args.get("host")) node_config.host = *host;
    if (auto port = args.get("port")) node_config.port = parse_port(*port);
    if (auto data_dir = args.get("data-dir")) node_config.data_dir = *data_dir;
    return node_config;
}

int run_start(const Arguments& args, const dcmx::utils::Config& config) {
    Node node(build_node_config(args, config));

    std::cout << "Starting DCMX node...\n"
              << "  Peer ID: " << node.peer_id() << "\n"
              << "  Data directory: " << node.config().data_dir.string() << "\n";

    auto started = node.start();
    if (started.is_err()) {
        std::cerr << "Failed to start node: " << started.error().to_string() << "\n";
        return 1;
    }
    std::cout << "  Address: " << node.config().host << ":" << node.port() << "\n";

    // Bootstrap peers: command line first, then config
    std::vector<std::string> peers = args.get_all("peers");
    for (const auto& peer : config.get_or<std::vector<std::string>>("bootstrap_peers", {})) {
        peers.push_back(peer);
    }

    for (const auto& address : peers) {
        auto parsed = parse_address(address);
        if (!parsed) {
            std::cerr << "Ignoring malformed peer address: " << address << "\n";
            continue;
        }
        const auto& [host, port] = *parsed;

        std::cout << "Connecting to peer " << host << ":" << port << "...\n";
        auto connected = node.connect_to_peer(host, port);
        if (connected.is_err()) {
            std::cerr << "Failed to connect to " << address << ": "
                      << connected.error().to_string() << "\n";
        }
    }

    std::cout << "\nNode is running. Press Ctrl+C to stop.\n";

    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "\nStopping node...\n";
    node.stop();
    return 0;
}

int run_add(const Arguments& args, const dcmx::utils::Config& config) {
    if (args.positional.empty()) {
        std::cerr << "Error: add requires a FILE argument\n";
        return 2;
    }

    const std::filesystem::path file_path = args.positional.front();
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        std::cerr << "Error: File not found: " << file_path.string() << "\n";
        return 1;
    }
    dcmx::bytes content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    dcmx::core::TrackMetadata metadata;
    metadata.title = args.get("title").value_or(file_path.stem().string());
    metadata.artist = args.get("artist").value_or("Unknown Artist");
    metadata.album = args.get("album");
    metadata.genre = args.get("genre");
    metadata.format = args.get("format").value_or("mp3");
    if (auto year = args.get("year")) metadata.year = std::stoi(*year);
    if (auto duration = args.get("duration")) metadata.duration = static_cast<uint32_t>(std::stoul(*duration));

    Node node(build_node_config(args, config));
    auto added = node.add_content(content, std::move(metadata));
    if (added.is_err()) {
        std::cerr << "Failed to add track: " << added.error().to_string() << "\n";
        return 1;
    }

    const auto& track = added.value();
    std::cout << "Added track: " << track.to_string() << "\n"
              << "  Content hash: " << track.content_hash().to_string() << "\n"
              << "  Size: " << track.size() << " bytes\n";
    return 0;
}

int run_list(const Arguments& args, const dcmx::utils::Config& config) {
    Node node(build_node_config(args, config));
    auto tracks = node.tracks();

    if (tracks.empty()) {
        std::cout << "No tracks in local catalog.\n";
        return 0;
    }

    std::cout << tracks.size() << " track(s):\n";
    for (const auto& track : tracks) {
        std::cout << "  " << track.content_hash().to_string().substr(0, 16) << "...  "
                  << track.to_string() << "\n";
    }
    return 0;
}

int run_stats(const Arguments& args, const dcmx::utils::Config& config) {
    Node node(build_node_config(args, config));
    std::cout << node.get_stats().to_json().dump(2) << "\n";
    return 0;
}

/**
 * Commands that query a running node over HTTP: ping, peers, tracks
 */
int run_remote(const std::string& command, const Arguments& args, const dcmx::utils::Config& config) {
    if (args.positional.empty()) {
        std::cerr << "Error: " << command << " requires a HOST:PORT argument\n";
        return 2;
    }
    auto address = parse_address(args.positional.front());
    if (!address) {
        std::cerr << "Error: invalid address: " << args.positional.front() << "\n";
        return 2;
    }

    dcmx::network::DiscoveryProtocol protocol(NodeConfig::from_config(config).discovery);
    // Only host and port matter for outbound calls
    dcmx::network::PeerRecord target(address->first, address->second);

    if (command == "ping") {
        auto result = protocol.ping(target);
        if (result.is_err()) {
            std::cerr << target.address() << " did not answer: " << result.error().to_string() << "\n";
            return 1;
        }
        std::cout << target.address() << " is alive\n";
        return 0;
    }

    if (command == "peers") {
        auto result = protocol.get_peers(target);
        if (result.is_err()) {
            std::cerr << "Failed to list peers: " << result.error().to_string() << "\n";
            return 1;
        }
        std::cout << result.value().size() << " peer(s):\n";
        for (const auto& peer : result.value()) {
            std::cout << "  " << peer.to_string() << "  "
                      << peer.available_content().size() << " track(s)\n";
        }
        return 0;
    }

    auto result = protocol.get_tracks(target);
    if (result.is_err()) {
        std::cerr << "Failed to list tracks: " << result.error().to_string() << "\n";
        return 1;
    }
    std::cout << result.value().size() << " track(s):\n";
    for (const auto& track : result.value()) {
        std::cout << "  " << track.content_hash().to_string().substr(0, 16) << "...  "
                  << track.to_string() << "\n";
    }
    return 0;
}

} // anonymous namespace

int main(int argc, char** argv) {
    if (argc < 2 || std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h") {
        print_usage();
        return argc < 2 ? 2 : 0;
    }

    const std::string command = argv[1];

    try {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        Arguments args = parse_arguments(argc, argv, 2);

        // Load configuration (defaults when no file is given)
        dcmx::utils::Config config;
        if (auto config_path = args.get("config")) {
            config = dcmx::utils::Config::load_from_file(*config_path);
        }

        auto log_level = args.verbose ? std::string("debug")
                                      : config.get_or<std::string>("log_level", "info");
        auto log_to_file = config.get_or<bool>("log_to_file", false);
        dcmx::utils::Logger::init(log_level, log_to_file);

        if (command == "start") return run_start(args, config);
        if (command == "add") return run_add(args, config);
        if (command == "list") return run_list(args, config);
        if (command == "stats") return run_stats(args, config);
        if (command == "ping" || command == "peers" || command == "tracks") {
            return run_remote(command, args, config);
        }

        std::cerr << "Unknown command: " << command << "\n";
        print_usage();
        return 2;
    } catch (const std::exception& e) {
        DCMX_LOG_ERROR("Fatal error: {}", e.what());
        return 1;
    }
}
